#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace core {

// FDateTime ticks (100ns since 0001-01-01) at the Unix epoch.
inline constexpr std::int64_t unix_epoch_ticks = 621'355'968'000'000'000LL;
inline constexpr std::int64_t ticks_per_ms = 10'000;

[[nodiscard]] inline constexpr std::int64_t unix_ms_to_ticks(std::int64_t unix_ms) noexcept {
    return unix_ms * ticks_per_ms + unix_epoch_ticks;
}

// Accepts RFC 3339 ("2024-03-01T18:22:43.120Z", "+02:00" offsets, optional
// fraction truncated to milliseconds) or integer Unix seconds.
bool parse_created_timestamp(std::string_view text, std::int64_t& unix_ms, std::string& err) noexcept;

} // namespace core
