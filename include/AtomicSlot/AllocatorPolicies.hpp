#pragma once
#include <new> // For placement new / std::bad_alloc
#include <utility>

// 默认策略：使用标准的 new/delete
struct StandardAllocPolicy {
    template <class T, class... Args>
    static T* allocate(Args&&... args) {
        return new T(std::forward<Args>(args)...);
    }

    template <class T>
    static void deallocate(T* p) noexcept {
        delete p;
    }
};

// 把 AllocPolicy 绑定进 std::unique_ptr，使"持有一个值"与"交还给分配器"走同一条路径
template <class AllocPolicy>
struct PolicyDeleter {
    template <class T>
    void operator()(T* p) const noexcept {
        if (p) {
            AllocPolicy::template deallocate<T>(p);
        }
    }
};
