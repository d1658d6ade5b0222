// AtomicSlot/AtomicSlot.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include "atomics/x86_atomics.hpp"
#include "AtomicSlot/AllocatorPolicies.hpp"

/**
 * @brief 无锁单值槽：最多持有一个堆上的 T，可被任意多个线程并发地放入 / 替换 / 取出
 *
 * - 内部只有一个地址宽度的原子字：nullptr 表示空，非空表示一个独占的、已完整构造的 T
 * - 所有写操作都归结为一次 exchange（线性化点），不存在 CAS 循环，也不会阻塞
 * - 值的所有权随 exchange 转移：传入的 owner 在调用那一刻交给槽，返回的 owner 归调用者
 * - 槽本身可以被多个线程共享引用，也可以交给另一个线程持有 (线程安全、可跨线程转移)：
 *   共享状态只有 inner_ 这一个原子字，而槽中的值只能先被完整取出才能访问，
 *   所以值永远不会在线程之间产生别名
 *
 * 内存序约定：
 * - 默认 (无 order 参数) 的 swap / take / store 使用 AcqRel，这是保证正确性所需的最弱序
 * - 显式 order 的版本用于热路径调优；调用者若选了比 AcqRel 更弱的序，
 *   需要自己用 fence 或锁建立等价的同步，槽不做任何检查
 * - 最低要求：load/take 需要 Acquire，store 需要 Release，swap 需要 AcqRel
 *
 * 销毁时不能有并发操作：调用者必须保证槽已不再被共享。
 */
template <class T, class AllocPolicy = StandardAllocPolicy>
class AtomicSlot {
public:
    using value_type   = T;
    using policy_type  = AllocPolicy;
    using deleter_type = PolicyDeleter<AllocPolicy>;
    // nullptr 表示"没有值"
    using owner_type   = std::unique_ptr<T, deleter_type>;

    static_assert(!std::is_array<T>::value, "AtomicSlot<T> does not support array types");
    static_assert(!std::is_reference<T>::value, "AtomicSlot<T> requires an object type");
    static_assert(sizeof(Atomic<T*>) == sizeof(T*),
                  "AtomicSlot relies on a single address-sized atomic word");

public:
    AtomicSlot() noexcept;
    explicit AtomicSlot(owner_type value) noexcept;
    ~AtomicSlot() noexcept;

    AtomicSlot(const AtomicSlot&)            = delete;
    AtomicSlot& operator=(const AtomicSlot&) = delete;

    static AtomicSlot empty() noexcept;

    // 通过 AllocPolicy 构造一个值；分配失败时异常在触碰槽之前抛出
    template <class... Args>
    static owner_type makeOwned(Args&&... args);

    // --- 交换族 ---
    owner_type exchange(owner_type value, MemoryOrder order) noexcept;
    owner_type swap(owner_type value) noexcept;
    owner_type take(MemoryOrder order = MemoryOrder::AcqRel) noexcept;

    // 被替换掉的旧值在返回前同步释放
    void store(owner_type value, MemoryOrder order = MemoryOrder::AcqRel) noexcept;

    // --- 观察 ---
    // 仅是某一时刻的快照，不提供任何排他保证：isSome() 为 true 之后的 take()
    // 仍可能拿到空（值已被其他线程取走）。只用于启发式判断，不能用于互斥。
    bool isSome(MemoryOrder order = MemoryOrder::Acquire) const noexcept;
    bool isNone(MemoryOrder order = MemoryOrder::Acquire) const noexcept;

private:
    // 仅有的两处接触裸表示的地方
    static T* intoRaw_(owner_type&& value) noexcept;
    static owner_type fromRaw_(T* raw) noexcept;

private:
    Atomic<T*> inner_;
};

// 在头文件末尾包含实现，实现 Header-Only
#include "AtomicSlot_impl.hpp"
