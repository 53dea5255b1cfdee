#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

#include "remote/replay_source.hpp"

namespace remote {

// Reads a replay previously dumped to disk as metadata.json, timing.json,
// replay.header and stream.N files.
class DirectoryReplaySource : public IReplaySource {
public:
    explicit DirectoryReplaySource(std::filesystem::path dir);

    // `replay_id` only labels the manifest; an empty id takes the directory name.
    FetchResult fetch_manifest(const std::string& replay_id, core::ReplayManifest& out) override;
    FetchResult fetch_chunk(const core::ChunkDescriptor& desc, core::ChunkPayload& out) override;
    SourceStats stats() const noexcept override;

private:
    std::filesystem::path dir_;
    // Moved out by fetch_chunk; the map itself is not modified after fetch_manifest.
    std::unordered_map<std::string, core::ChunkPayload> inline_payloads_;

    std::atomic<std::uint64_t> reads_{0};
    std::atomic<std::uint64_t> bytes_read_{0};
};

} // namespace remote
