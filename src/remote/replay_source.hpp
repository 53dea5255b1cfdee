#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "core/chunk.hpp"

namespace remote {

enum class FetchStatus {
    Ok,
    NotFound,
    NotReady,
    ServiceUnavailable,
    MalformedResponse,
    ChunkMissing,
    SizeMismatch,
};

inline const char* fetch_status_name(FetchStatus s) noexcept {
    switch (s) {
    case FetchStatus::Ok: return "Ok";
    case FetchStatus::NotFound: return "NotFound";
    case FetchStatus::NotReady: return "NotReady";
    case FetchStatus::ServiceUnavailable: return "ServiceUnavailable";
    case FetchStatus::MalformedResponse: return "MalformedResponse";
    case FetchStatus::ChunkMissing: return "ChunkMissing";
    case FetchStatus::SizeMismatch: return "SizeMismatch";
    }
    return "Unknown";
}

struct FetchResult {
    FetchStatus status{FetchStatus::Ok};
    std::string detail;

    bool ok() const noexcept { return status == FetchStatus::Ok; }

    static FetchResult success() { return {}; }
    static FetchResult failure(FetchStatus s, std::string why) { return {s, std::move(why)}; }
};

// Key for payloads that arrive inline with the manifest (checkpoints, events).
inline std::string inline_payload_key(const core::ChunkDescriptor& desc) {
    return std::to_string(static_cast<std::uint32_t>(desc.type)) + '/' + std::to_string(desc.start_ms) + '/' +
           desc.remote_id;
}

struct SourceStats {
    std::uint64_t requests{0};
    std::uint64_t bytes_downloaded{0};
};

// Typed access to one hosted replay. fetch_chunk may be called concurrently
// for different descriptors once fetch_manifest has returned Ok.
class IReplaySource {
public:
    virtual ~IReplaySource() = default;

    virtual FetchResult fetch_manifest(const std::string& replay_id, core::ReplayManifest& out) = 0;

    // On Ok, `out` holds exactly desc.size bytes.
    virtual FetchResult fetch_chunk(const core::ChunkDescriptor& desc, core::ChunkPayload& out) = 0;

    virtual SourceStats stats() const noexcept = 0;
};

} // namespace remote
