#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace persist {

inline constexpr std::uint32_t byteswap32(std::uint32_t v) noexcept {
    return ((v & 0xFF000000u) >> 24) |
           ((v & 0x00FF0000u) >> 8) |
           ((v & 0x0000FF00u) << 8) |
           ((v & 0x000000FFu) << 24);
}

inline constexpr std::uint64_t byteswap64(std::uint64_t v) noexcept {
    return (static_cast<std::uint64_t>(byteswap32(static_cast<std::uint32_t>(v))) << 32) |
           byteswap32(static_cast<std::uint32_t>(v >> 32));
}

inline constexpr std::uint32_t to_le32(std::uint32_t v) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    }
    return byteswap32(v);
}

inline constexpr std::uint32_t from_le32(std::uint32_t v) noexcept { return to_le32(v); }

inline constexpr std::uint64_t to_le64(std::uint64_t v) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    }
    return byteswap64(v);
}

inline constexpr std::uint64_t from_le64(std::uint64_t v) noexcept { return to_le64(v); }

// Unaligned little-endian stores and loads on byte buffers.
inline void store_le32(std::byte* dst, std::uint32_t v) noexcept {
    const std::uint32_t le = to_le32(v);
    std::memcpy(dst, &le, sizeof(le));
}

inline void store_le64(std::byte* dst, std::uint64_t v) noexcept {
    const std::uint64_t le = to_le64(v);
    std::memcpy(dst, &le, sizeof(le));
}

inline std::uint32_t load_le32(const std::byte* src) noexcept {
    std::uint32_t v = 0;
    std::memcpy(&v, src, sizeof(v));
    return from_le32(v);
}

inline std::uint64_t load_le64(const std::byte* src) noexcept {
    std::uint64_t v = 0;
    std::memcpy(&v, src, sizeof(v));
    return from_le64(v);
}

inline void append_le32(std::vector<std::byte>& out, std::uint32_t v) {
    const std::size_t at = out.size();
    out.resize(at + sizeof(v));
    store_le32(out.data() + at, v);
}

} // namespace persist
