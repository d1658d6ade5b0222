// AtomicSlot_impl.hpp
#pragma once

template <class T, class AllocPolicy>
AtomicSlot<T, AllocPolicy>::AtomicSlot() noexcept : inner_(nullptr) {}

template <class T, class AllocPolicy>
AtomicSlot<T, AllocPolicy>::AtomicSlot(owner_type value) noexcept
    : inner_(intoRaw_(std::move(value))) {}

template <class T, class AllocPolicy>
AtomicSlot<T, AllocPolicy>::~AtomicSlot() noexcept {
    // 与手动 take() 后丢弃返回值走同一条释放路径
    take(MemoryOrder::Acquire);
}

template <class T, class AllocPolicy>
AtomicSlot<T, AllocPolicy> AtomicSlot<T, AllocPolicy>::empty() noexcept {
    return AtomicSlot();
}

template <class T, class AllocPolicy>
template <class... Args>
typename AtomicSlot<T, AllocPolicy>::owner_type
AtomicSlot<T, AllocPolicy>::makeOwned(Args&&... args) {
    return owner_type(AllocPolicy::template allocate<T>(std::forward<Args>(args)...));
}

template <class T, class AllocPolicy>
typename AtomicSlot<T, AllocPolicy>::owner_type
AtomicSlot<T, AllocPolicy>::exchange(owner_type value, MemoryOrder order) noexcept {
    T* incoming = intoRaw_(std::move(value));
    T* previous = inner_.exchange(incoming, order); // 线性化点
    return fromRaw_(previous);
}

template <class T, class AllocPolicy>
typename AtomicSlot<T, AllocPolicy>::owner_type
AtomicSlot<T, AllocPolicy>::swap(owner_type value) noexcept {
    return exchange(std::move(value), MemoryOrder::AcqRel);
}

template <class T, class AllocPolicy>
typename AtomicSlot<T, AllocPolicy>::owner_type
AtomicSlot<T, AllocPolicy>::take(MemoryOrder order) noexcept {
    return exchange(owner_type(), order);
}

template <class T, class AllocPolicy>
void AtomicSlot<T, AllocPolicy>::store(owner_type value, MemoryOrder order) noexcept {
    owner_type displaced = exchange(std::move(value), order);
    displaced.reset();
}

template <class T, class AllocPolicy>
bool AtomicSlot<T, AllocPolicy>::isSome(MemoryOrder order) const noexcept {
    return !isNone(order);
}

template <class T, class AllocPolicy>
bool AtomicSlot<T, AllocPolicy>::isNone(MemoryOrder order) const noexcept {
    return inner_.load(to_load_order(order)) == nullptr;
}

// --- 裸表示边界 ---

template <class T, class AllocPolicy>
T* AtomicSlot<T, AllocPolicy>::intoRaw_(owner_type&& value) noexcept {
    // 交出所有权：此后 value 为空，地址只存在于原子字中
    return value.release();
}

template <class T, class AllocPolicy>
typename AtomicSlot<T, AllocPolicy>::owner_type
AtomicSlot<T, AllocPolicy>::fromRaw_(T* raw) noexcept {
    // raw 只能来自一次 exchange 的返回值，此时槽已不再持有它
    return owner_type(raw);
}
