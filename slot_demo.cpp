#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "AtomicSlot/AtomicSlot.hpp"

// 一份可热替换的配置：写线程不断发布新版本，读线程取走并"应用"它
struct Config {
    int version;
    std::string endpoint;
    int checksum; // version 与 endpoint 长度之和，读端用来校验内容完整

    Config(int v, std::string ep)
        : version(v), endpoint(std::move(ep)), checksum(v + static_cast<int>(endpoint.size())) {}
};

// 统计分配与释放次数，用来确认每份配置恰好被释放一次
struct CountingPolicy {
    static std::atomic<long> allocated;
    static std::atomic<long> released;

    template <class T, class... Args>
    static T* allocate(Args&&... args) {
        allocated.fetch_add(1, std::memory_order_relaxed);
        return new T(std::forward<Args>(args)...);
    }

    template <class T>
    static void deallocate(T* p) noexcept {
        released.fetch_add(1, std::memory_order_relaxed);
        delete p;
    }
};

std::atomic<long> CountingPolicy::allocated{0};
std::atomic<long> CountingPolicy::released{0};

using ConfigSlot = AtomicSlot<Config, CountingPolicy>;

int main(int argc, char** argv) {
    int versions = 200000;
    int readers = 3;
    if (argc > 1) versions = std::atoi(argv[1]);
    if (argc > 2) readers = std::atoi(argv[2]);
    if (versions <= 0 || readers <= 0) {
        std::cerr << "usage: slot_demo [versions > 0] [readers > 0]" << std::endl;
        return 2;
    }

    std::cout << "Starting config hand-off demo: " << versions << " versions, "
              << readers << " readers" << std::endl;

    std::atomic<bool> publishing{true};
    std::atomic<long> applied{0};
    std::atomic<long> corrupt{0};
    long published = 0;

    {
        ConfigSlot slot;

        // 写线程：每个新版本直接覆盖旧版本，旧版本由 store 当场释放
        std::thread writer([&] {
            for (int v = 1; v <= versions; ++v) {
                slot.store(ConfigSlot::makeOwned(v, "shard-" + std::to_string(v % 16)));
                ++published;
            }
            publishing.store(false, std::memory_order_release);
        });

        // 读线程：isSome 只是提示，真正的归属以 take 的结果为准
        std::vector<std::thread> reader_threads;
        for (int r = 0; r < readers; ++r) {
            reader_threads.emplace_back([&] {
                while (publishing.load(std::memory_order_acquire) || slot.isSome()) {
                    if (!slot.isSome()) {
                        std::this_thread::yield();
                        continue;
                    }
                    auto cfg = slot.take();
                    if (!cfg) {
                        continue; // 被其他读线程抢先
                    }
                    if (cfg->checksum != cfg->version + static_cast<int>(cfg->endpoint.size())) {
                        corrupt.fetch_add(1, std::memory_order_relaxed);
                    }
                    applied.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }

        writer.join();
        for (auto& t : reader_threads) {
            t.join();
        }

        if (slot.isSome()) {
            std::cout << "[INFO] A final config is still resident; it is released with the slot." << std::endl;
        }
    }

    const long dropped = published - applied.load();

    std::cout << "========================================" << std::endl;
    std::cout << "Published:           " << published << std::endl;
    std::cout << "Applied by readers:  " << applied.load() << std::endl;
    std::cout << "Replaced unseen:     " << dropped << std::endl;
    std::cout << "Allocated / released: " << CountingPolicy::allocated.load()
              << " / " << CountingPolicy::released.load() << std::endl;
    std::cout << "========================================" << std::endl;

    if (corrupt.load() != 0) {
        std::cerr << "[FAILURE] " << corrupt.load() << " config(s) observed half-initialized!" << std::endl;
        return 1;
    }
    if (CountingPolicy::allocated.load() != CountingPolicy::released.load()) {
        std::cerr << "[FAILURE] allocation count does not match release count!" << std::endl;
        return 1;
    }

    std::cout << "[SUCCESS] Every config was owned by exactly one party and released exactly once." << std::endl;
    return 0;
}
