#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Values are the container's on-disk chunk type tags.
enum class ChunkType : std::uint32_t {
    Header = 0,
    Stream = 1,
    Checkpoint = 2,
    Event = 3,
};

inline const char* chunk_type_name(ChunkType t) noexcept {
    switch (t) {
    case ChunkType::Header: return "Header";
    case ChunkType::Stream: return "Stream";
    case ChunkType::Checkpoint: return "Checkpoint";
    case ChunkType::Event: return "Event";
    }
    return "Unknown";
}

// Position of a type in the serialized sequence Header, Checkpoint*, Event*, Stream*.
inline constexpr int chunk_type_rank(ChunkType t) noexcept {
    switch (t) {
    case ChunkType::Header: return 0;
    case ChunkType::Checkpoint: return 1;
    case ChunkType::Event: return 2;
    case ChunkType::Stream: return 3;
    }
    return 4;
}

struct ChunkDescriptor {
    ChunkType type{ChunkType::Header};
    std::uint32_t size{0};
    std::uint32_t start_ms{0};
    std::uint32_t end_ms{0};
    // Opaque to everything but the source that produced it ("stream.3", an event id, ...).
    std::string remote_id;
    // Checkpoint/Event only; written verbatim into the chunk record.
    std::string group;
    std::string metadata;
    // Stream only: N of stream.N.
    std::uint32_t stream_index{0};
};

using ChunkPayload = std::vector<std::byte>;

struct ReplayMeta {
    std::string game_mode;
    std::string friendly_name;
    bool competitive{false};
    std::string workshop_mods;
    bool live{false};
    std::uint32_t total_time_ms{0};
    std::uint32_t network_version{0};
    std::string created;
    // FDateTime ticks derived from `created`.
    std::int64_t timestamp_ticks{0};
};

struct ReplayManifest {
    std::string replay_id;
    ReplayMeta meta;
    std::vector<ChunkDescriptor> chunks;
};

} // namespace core
