#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/chunk.hpp"

namespace persist {

// Unreal Engine local-file replay container, file version 6. All integers
// little-endian.
inline constexpr std::uint32_t replay_magic = 0x1CA2E27Fu;
inline constexpr std::uint32_t replay_file_version = 6;
inline constexpr std::int32_t friendly_name_length = -257; // negative: UTF-16
inline constexpr std::size_t friendly_name_bytes = 514;
inline constexpr std::size_t friendly_name_max_units = 256; // last unit is NUL
inline constexpr std::size_t replay_info_size = 562;

inline constexpr std::size_t chunk_prefix_size = 8;          // u32 type + i32 body size
inline constexpr std::size_t stream_header_size = 16;        // time1, time2, data size, memory size
inline constexpr std::size_t event_trailer_size = 12;        // time1, time2, payload size

// Replay-info field offsets.
namespace info_offset {
inline constexpr std::size_t magic = 0;
inline constexpr std::size_t file_version = 4;
inline constexpr std::size_t length_ms = 8;
inline constexpr std::size_t network_version = 12;
inline constexpr std::size_t changelist = 16;
inline constexpr std::size_t name_length = 20;
inline constexpr std::size_t name = 24;
inline constexpr std::size_t is_live = 538;
inline constexpr std::size_t timestamp = 542;
inline constexpr std::size_t compressed = 550;
inline constexpr std::size_t encrypted = 554;
inline constexpr std::size_t key_length = 558;
} // namespace info_offset

static_assert(info_offset::name + friendly_name_bytes == info_offset::is_live);
static_assert(info_offset::key_length + 4 == replay_info_size);

// Location of one chunk in the output. Offsets are relative to the start of
// the payload section (the byte after the replay-info header).
struct ChunkIndexEntry {
    core::ChunkType type{core::ChunkType::Header};
    std::uint32_t start_ms{0};
    std::uint32_t end_ms{0};
    std::uint64_t frame_offset{0};   // first byte of the chunk record
    std::uint64_t payload_offset{0}; // first byte of the raw payload
    std::uint32_t payload_size{0};
    std::string remote_id;
};

// Everything about the output except payload bytes, derived from descriptors.
struct ReplayLayout {
    std::vector<std::byte> info;
    // Bytes preceding each payload within its record, in chunk order.
    std::vector<std::vector<std::byte>> frame_headers;
    std::vector<ChunkIndexEntry> index;
    std::uint64_t payload_section_size{0};
    std::uint64_t total_size{0};
};

// "{gameMode},{friendlyName},{competitive|casual},0,{workshop_mods},{true|false}"
std::string friendly_name_text(const core::ReplayMeta& meta);

// Invalid UTF-8 sequences decode as U+FFFD.
std::u16string utf8_to_utf16(std::string_view utf8);

void encode_replay_info(const core::ReplayMeta& meta, std::vector<std::byte>& out);

// Unreal FString: [i32 len]+ASCII+NUL, or [i32 -len]+UTF-16LE+NUL when the
// text is not pure ASCII. Length counts the terminator.
void append_fstring(std::vector<std::byte>& out, std::string_view utf8);
std::size_t fstring_size(std::string_view utf8);

// Record prefix and type-specific header for `desc`; the payload follows.
bool encode_frame_header(const core::ChunkDescriptor& desc, std::vector<std::byte>& out, std::string& err);

// Fails when a record body would not fit the container's i32 size field.
bool compute_layout(const core::ReplayMeta& meta,
                    const std::vector<core::ChunkDescriptor>& chunks,
                    ReplayLayout& out,
                    std::string& err);

} // namespace persist
