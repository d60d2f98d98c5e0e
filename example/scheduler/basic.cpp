#include "rota/log/logger.hpp"
#include "rota/scheduler/wrr_scheduler.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <string>

int main() {
    // LOG_LEVEL and LOG_FILE are read from ROTA_LOG_LEVEL / ROTA_LOG_FILE
    auto settings = rota::log::LogSettings::fromEnvironment();
    rota::log::initLogging(settings);

    rota::WrrScheduler<std::string> scheduler(
        rota::SchedulerOptions::fromEnvironment());

    // Register backends in three batches
    scheduler.insertMany({{"a", 1}, {"b", 2}});
    scheduler.insert("c", 3);
    scheduler.insertMany({{"d", 5}, {"e", 2}});

    std::cout << "Entries: " << scheduler.size()
              << ", total weight: " << scheduler.totalWeight() << std::endl;

    // Walk two full cycles
    std::map<std::string, int> counts;
    std::cout << "Picks: ";
    for (std::uint64_t i = 0; i < 2 * scheduler.totalWeight(); ++i) {
        if (auto picked = scheduler.select()) {
            std::cout << picked->data() << " ";
            counts[picked->data()]++;
        }
    }
    std::cout << std::endl;

    for (const auto& [name, count] : counts) {
        std::cout << name << ": " << count << std::endl;
    }

    // Drain a backend and reweight another
    scheduler.removeIf([](const std::string& name) { return name == "d"; });
    scheduler.updateWeight(0, 4);
    std::cout << "After removing d and reweighting a: ";
    for (const auto& picked : scheduler.selectMany(scheduler.totalWeight())) {
        std::cout << picked->data() << " ";
    }
    std::cout << std::endl;

    // Invalid weights are rejected and leave the scheduler untouched
    try {
        scheduler.insert("f", 0);
    } catch (const rota::algorithm::InvalidWeight& e) {
        std::cout << "Rejected: " << e.what() << std::endl;
    }

    scheduler.clear();
    std::cout << "Cleared, select returns "
              << (scheduler.select() ? "an entry" : "nothing") << std::endl;

    return 0;
}
