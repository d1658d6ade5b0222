#pragma once
#include <cstdint>
#include <type_traits>

// 标准原子库 (TSan 模式 / 非 x86 环境使用)
#include <atomic>

// 后端选择：TSan、显式宏或非 x86 平台 -> std::atomic 代理；否则 -> x86 内联汇编
#if defined(__SANITIZE_THREAD__) || defined(ATOMIC_SLOT_RUNNING_ON_TSAN)
    #define ATOMIC_SLOT_USE_STD_ATOMIC 1
#elif defined(__has_feature)
    #if __has_feature(thread_sanitizer)
        #define ATOMIC_SLOT_USE_STD_ATOMIC 1
    #endif
#endif

#if !defined(ATOMIC_SLOT_USE_STD_ATOMIC) && !defined(__x86_64__)
    #define ATOMIC_SLOT_USE_STD_ATOMIC 1
#endif

// 内存序定义 (从弱到强)
enum class MemoryOrder {
    Relaxed,
    Acquire,
    Release,
    AcqRel,
    SeqCst
};

// 将自定义枚举转换为标准库枚举
static inline std::memory_order to_std_order(MemoryOrder order) noexcept {
    switch (order) {
        case MemoryOrder::Relaxed: return std::memory_order_relaxed;
        case MemoryOrder::Acquire: return std::memory_order_acquire;
        case MemoryOrder::Release: return std::memory_order_release;
        case MemoryOrder::AcqRel:  return std::memory_order_acq_rel;
        case MemoryOrder::SeqCst:  return std::memory_order_seq_cst;
    }
    return std::memory_order_seq_cst;
}

// 纯 load 不允许 release 语义：Release -> Relaxed, AcqRel -> Acquire
static inline MemoryOrder to_load_order(MemoryOrder order) noexcept {
    switch (order) {
        case MemoryOrder::Release: return MemoryOrder::Relaxed;
        case MemoryOrder::AcqRel:  return MemoryOrder::Acquire;
        default:                   return order;
    }
}

template <typename T>
class Atomic {
    static_assert(sizeof(T) == 4 || sizeof(T) == 8, "Atomic<T> only supports 4 or 8 byte types");
    static_assert(std::is_trivially_copyable<T>::value, "Atomic<T> requires a trivially copyable T");

private:
/*
 * ============================================================================
 * [模式 A] TSan / 调试 / 非 x86 模式
 * 条件：开启了 ThreadSanitizer、定义了 ATOMIC_SLOT_RUNNING_ON_TSAN，或目标不是 x86-64
 * 作用：使用 std::atomic 代理，让 TSan 能够正确追踪 happens-before 关系。
 *       如果这里用汇编，TSan 会报 "Read of size 8" 的假阳性错误。
 * ============================================================================
 */
#if defined(ATOMIC_SLOT_USE_STD_ATOMIC)
    std::atomic<T> data;

public:
    static constexpr bool kUsesStdAtomic = true;

    constexpr Atomic(T val) noexcept : data(val) {}
    Atomic(const Atomic&) = delete;
    Atomic& operator=(const Atomic&) = delete;

    T load(MemoryOrder order = MemoryOrder::SeqCst) const noexcept {
        return data.load(to_std_order(to_load_order(order)));
    }

    T exchange(T val, MemoryOrder order = MemoryOrder::SeqCst) noexcept {
        return data.exchange(val, to_std_order(order));
    }

/*
 * ============================================================================
 * [模式 B] 生产 / 高性能模式 (x86 内联汇编)
 * 条件：x86-64 目标且未开启 TSan
 * 作用：直接使用 mov / xchg 指令；两者在 x86 上已满足任何 order，order 参数被忽略。
 * ============================================================================
 */
#else
    alignas(sizeof(T)) volatile T data;

public:
    static constexpr bool kUsesStdAtomic = false;

    constexpr Atomic(T val) noexcept : data(val) {}
    Atomic(const Atomic&) = delete;
    Atomic& operator=(const Atomic&) = delete;

    T load(MemoryOrder order = MemoryOrder::SeqCst) const noexcept {
        (void)order;
        T v;
        // x86 TSO 模型下，普通的 mov + 编译器屏障即可满足 Acquire 语义
        asm volatile (
            "mov %1, %0"
            : "=r" (v)
            : "m" (data)
            : "memory"
        );
        return v;
    }

    T exchange(T val, MemoryOrder order = MemoryOrder::SeqCst) noexcept {
        (void)order;
        // 带内存操作数的 xchg 隐含 lock 前缀，自身就是 Full Barrier，
        // 因此任何 order 都用同一条指令
        asm volatile (
            "xchg %0, %1"
            : "+r" (val),
              "+m" (data)
            :
            : "memory"
        );
        return val;
    }
#endif
};

// 内存屏障同样做条件编译处理
static inline void atomic_thread_fence(MemoryOrder order) noexcept {
#if defined(ATOMIC_SLOT_USE_STD_ATOMIC)
    std::atomic_thread_fence(to_std_order(order));
#else
    if (order == MemoryOrder::SeqCst) {
        asm volatile("mfence" ::: "memory");
    } else {
        asm volatile("" ::: "memory");
    }
#endif
}
