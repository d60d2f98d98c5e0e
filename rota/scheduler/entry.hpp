#ifndef ROTA_SCHEDULER_ENTRY_HPP
#define ROTA_SCHEDULER_ENTRY_HPP

#include <concepts>
#include <type_traits>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "rota/algorithm/smooth_wrr.hpp"

namespace rota {

using algorithm::Weight;

/**
 * @brief One weighted item of a scheduler.
 *
 * Entries are immutable once built. Identity is positional: two entries with
 * equal payloads are still distinct.
 *
 * @tparam T Opaque payload type
 */
template <typename T>
class Entry {
public:
    Entry(T data, Weight weight) : data_(std::move(data)), weight_(weight) {}

    /**
     * @brief Builds an entry from a (payload, weight) pair
     * @throws algorithm::InvalidWeight if a signed weight is negative
     */
    template <typename U, std::integral W>
        requires std::constructible_from<T, const U&>
    Entry(const std::pair<U, W>& pair)  // NOLINT(google-explicit-constructor)
        : data_(pair.first), weight_(toWeight(pair.second)) {}

    template <typename U, std::integral W>
        requires std::constructible_from<T, U&&>
    Entry(std::pair<U, W>&& pair)  // NOLINT(google-explicit-constructor)
        : data_(std::move(pair.first)), weight_(toWeight(pair.second)) {}

    [[nodiscard]] auto data() const noexcept -> const T& { return data_; }
    [[nodiscard]] auto weight() const noexcept -> Weight { return weight_; }

    auto operator*() const noexcept -> const T& { return data_; }
    auto operator->() const noexcept -> const T* { return &data_; }

private:
    template <std::integral W>
    static auto toWeight(W weight) -> Weight {
        if constexpr (std::is_signed_v<W>) {
            if (weight < 0) {
                throw algorithm::InvalidWeight(
                    fmt::format("Weight cannot be negative: {}", weight));
            }
        }
        return static_cast<Weight>(weight);
    }

    T data_;
    Weight weight_;
};

}  // namespace rota

#endif  // ROTA_SCHEDULER_ENTRY_HPP
