#include "rota/log/logger.hpp"
#include "rota/scheduler/wrr_scheduler.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

int main() {
    rota::log::initLogging(rota::log::LogSettings::fromEnvironment());

    // Spinning readers suit short critical sections like select()
    rota::SpinningWrrScheduler<int> scheduler;
    scheduler.insertMany({{0, 1}, {1, 2}, {2, 3}});

    constexpr int kReaders = 4;
    std::atomic<bool> stop{false};
    std::array<std::atomic<long>, 8> hits{};

    std::vector<std::thread> readers;
    for (int r = 0; r < kReaders; ++r) {
        readers.emplace_back([&] {
            while (!stop.load(std::memory_order_acquire)) {
                if (auto picked = scheduler.select()) {
                    hits[picked->data()].fetch_add(1,
                                                   std::memory_order_relaxed);
                }
            }
        });
    }

    // Grow the pool while readers are selecting
    for (int id = 3; id < static_cast<int>(hits.size()); ++id) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        scheduler.insert(id, static_cast<rota::Weight>(id));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.store(true, std::memory_order_release);

    for (auto& reader : readers) {
        reader.join();
    }

    long total = 0;
    for (std::size_t id = 0; id < hits.size(); ++id) {
        std::cout << "backend " << id << ": " << hits[id].load() << std::endl;
        total += hits[id].load();
    }
    std::cout << "Selections: " << total << ", cursor: " << scheduler.cursor()
              << ", generation: " << scheduler.generation() << std::endl;

    return 0;
}
