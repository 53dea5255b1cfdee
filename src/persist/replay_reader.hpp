#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "core/chunk.hpp"

namespace persist {

// Parses a local-file replay back into its parts. Used to verify assembled
// output; never modifies the input.

struct ReplayInfo {
    std::uint32_t magic{0};
    std::uint32_t file_version{0};
    std::uint32_t length_ms{0};
    std::uint32_t network_version{0};
    std::uint32_t changelist{0};
    std::string friendly_name; // UTF-8, padding removed
    bool live{false};
    std::int64_t timestamp_ticks{0};
    std::uint32_t compressed{0};
    std::uint32_t encrypted{0};
    std::uint32_t key_length{0};
};

struct ChunkRecord {
    core::ChunkType type{core::ChunkType::Header};
    std::uint32_t start_ms{0};
    std::uint32_t end_ms{0};
    std::string id;
    std::string group;
    std::string metadata;
    // Relative to the start of the payload section.
    std::uint64_t frame_offset{0};
    std::uint64_t payload_offset{0};
    std::uint32_t payload_size{0};
};

struct ParsedReplay {
    ReplayInfo info;
    std::vector<ChunkRecord> chunks;
};

enum class ReplayReadStatus {
    Ok = 0,
    Truncated,
    BadMagic,
    UnsupportedVersion,
    InvalidLength,
    UnknownChunkType,
    IoError,
};

const char* replay_read_status_name(ReplayReadStatus s) noexcept;

ReplayReadStatus parse_replay(std::span<const std::byte> data, ParsedReplay& out, std::string& err);

ReplayReadStatus read_replay_file(const std::filesystem::path& path,
                                  std::vector<std::byte>& bytes,
                                  ParsedReplay& out,
                                  std::string& err);

// Payload bytes of `rec` inside a whole-file buffer.
std::span<const std::byte> payload_of(std::span<const std::byte> file, const ChunkRecord& rec) noexcept;

} // namespace persist
