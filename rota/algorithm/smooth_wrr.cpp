/*
 * smooth_wrr.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-22

Description: Smooth weighted round-robin cycle generation

**************************************************/

#include "smooth_wrr.hpp"

#include <spdlog/fmt/fmt.h>

namespace rota::algorithm {

WeightError::WeightError(const std::string& message,
                         const std::source_location& loc)
    : std::runtime_error(
          fmt::format("{}:{}: {}", loc.file_name(), loc.line(), message)) {}

void validateWeight(Weight weight, std::uint64_t limit) {
    if (weight == 0) {
        throw InvalidWeight("Weight must be a positive integer, got 0");
    }
    if (weight > limit) {
        throw CapacityExceeded(
            fmt::format("Weight {} exceeds the cycle limit {}", weight, limit));
    }
}

auto checkedTotalWeight(std::span<const Weight> weights, std::uint64_t limit)
    -> std::uint64_t {
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] == 0) {
            throw InvalidWeight(
                fmt::format("Weight at index {} must be positive, got 0", i));
        }
        // total <= limit holds here, so the subtraction cannot wrap
        if (weights[i] > limit - total) {
            throw CapacityExceeded(fmt::format(
                "Total weight exceeds the cycle limit {} at index {}", limit,
                i));
        }
        total += weights[i];
    }
    return total;
}

SmoothWeightedRoundRobin::SmoothWeightedRoundRobin(
    std::span<const Weight> weights) {
    totalWeight_ = checkedTotalWeight(weights, kMaxCycleLength);
    nodes_.reserve(weights.size());
    for (Weight weight : weights) {
        nodes_.push_back(Node{weight, 0});
    }
}

void SmoothWeightedRoundRobin::add(Weight weight) {
    validateWeight(weight, kMaxCycleLength - totalWeight_);
    nodes_.push_back(Node{weight, 0});
    totalWeight_ += weight;
}

auto SmoothWeightedRoundRobin::next() -> std::size_t {
    if (nodes_.empty()) {
        throw WeightError("Cannot pick from an empty weight table");
    }

    std::size_t selected = 0;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        auto& node = nodes_[i];
        node.current += static_cast<std::int64_t>(node.weight);
        // Strict comparison: on ties the earliest node keeps the pick
        if (node.current > nodes_[selected].current) {
            selected = i;
        }
    }
    nodes_[selected].current -= static_cast<std::int64_t>(totalWeight_);
    return selected;
}

void SmoothWeightedRoundRobin::reset() noexcept {
    for (auto& node : nodes_) {
        node.current = 0;
    }
}

auto generateSmoothCycle(std::span<const Weight> weights, std::uint64_t limit)
    -> std::vector<SlotIndex> {
    if (limit > kMaxCycleLength) {
        throw std::invalid_argument(fmt::format(
            "Cycle limit {} is above the maximum {}", limit, kMaxCycleLength));
    }

    const std::uint64_t total = checkedTotalWeight(weights, limit);
    if (total == 0) {
        return {};
    }

    SmoothWeightedRoundRobin picker(weights);
    std::vector<SlotIndex> cycle;
    cycle.reserve(static_cast<std::size_t>(total));
    for (std::uint64_t tick = 0; tick < total; ++tick) {
        cycle.push_back(static_cast<SlotIndex>(picker.next()));
    }
    return cycle;
}

}  // namespace rota::algorithm
