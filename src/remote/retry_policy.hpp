#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <type_traits>

namespace remote {

// Exponential backoff for retryable fetch failures. Retry k (1-based) waits
// min(max_delay, base_delay * 2^(k-1)) scaled by a factor in [1 - jitter, 1].
struct RetryPolicy {
    std::uint32_t max_attempts{5}; // total tries, first one included
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{30000};
    double jitter{0.0};
};

static_assert(std::is_trivially_copyable_v<RetryPolicy>, "RetryPolicy must be trivially copyable");

[[nodiscard]] inline constexpr RetryPolicy default_retry_policy() noexcept {
    return RetryPolicy{};
}

// Same attempt budget, never sleeps.
[[nodiscard]] inline constexpr RetryPolicy zero_delay(std::uint32_t max_attempts = 5) noexcept {
    return RetryPolicy{max_attempts, std::chrono::milliseconds{0}, std::chrono::milliseconds{0}, 0.0};
}

// `unit` is a uniform sample in [0, 1); ignored when jitter is 0.
[[nodiscard]] inline std::chrono::milliseconds backoff_delay(const RetryPolicy& p,
                                                             std::uint32_t retry,
                                                             double unit = 0.0) noexcept {
    if (retry == 0 || p.base_delay.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    const std::uint32_t shift = std::min<std::uint32_t>(retry - 1, 30);
    const auto base = static_cast<std::uint64_t>(p.base_delay.count());
    const auto cap = static_cast<std::uint64_t>(std::max<std::int64_t>(p.max_delay.count(), 0));
    std::uint64_t ms = base << shift;
    if ((ms >> shift) != base || ms > cap) {
        ms = cap;
    }
    const double jitter = std::clamp(p.jitter, 0.0, 1.0);
    const double factor = 1.0 - jitter * std::clamp(unit, 0.0, 1.0);
    return std::chrono::milliseconds{static_cast<std::int64_t>(static_cast<double>(ms) * factor)};
}

} // namespace remote
