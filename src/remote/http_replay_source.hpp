#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "remote/http_transport.hpp"
#include "remote/replay_source.hpp"
#include "remote/retry_policy.hpp"
#include "remote/service_json.hpp"
#include "util/clock.hpp"

namespace remote {

struct HttpSourceConfig {
    std::string base_url{"https://tv.vankrupt.net"};
    std::uint32_t page_size{100};
    // Parallel HEAD requests used to size stream chunks.
    std::uint32_t head_concurrency{8};
    // Each HEAD request retries ServiceUnavailable on its own before the manifest fails.
    RetryPolicy head_retry{default_retry_policy()};
    // Larger numChunks values are rejected as MalformedResponse.
    std::uint32_t max_stream_chunks{100000};
    // Confirm the id in the public listing before asking for a download.
    bool locate_in_listing{true};
    CurlTransportConfig transport{};
};

// IReplaySource backed by the replay hosting service. Checkpoint and event
// payloads arrive inline with the manifest; header and stream payloads are
// downloaded per chunk. Only the HEAD size requests are retried here; every other
// failure is reported for the caller's retry policy.
class HttpReplaySource : public IReplaySource {
public:
    explicit HttpReplaySource(HttpSourceConfig cfg);
    HttpReplaySource(HttpSourceConfig cfg, std::unique_ptr<IHttpTransport> transport);
    HttpReplaySource(HttpSourceConfig cfg, std::unique_ptr<IHttpTransport> transport, util::Sleeper& sleeper);

    FetchResult fetch_manifest(const std::string& replay_id, core::ReplayManifest& out) override;
    FetchResult fetch_chunk(const core::ChunkDescriptor& desc, core::ChunkPayload& out) override;
    SourceStats stats() const noexcept override;

    // One page of the public listing starting at `offset`.
    FetchResult list_replays(std::uint64_t offset, ReplayPage& out);

    // Pages through the listing until `replay_id` is found.
    FetchResult find_replay(const std::string& replay_id, ReplayListing& out);

private:
    struct FileStat {
        FetchResult result;
        std::uint32_t size{0};
        std::uint32_t start_ms{0};
        std::uint32_t end_ms{0};
    };

    std::string replay_url(const std::string& replay_id) const;
    std::string file_url(const std::string& replay_id, const std::string& name) const;

    HttpResponse get(const std::string& url);
    HttpResponse head(const std::string& url);
    HttpResponse post(const std::string& url, const std::string& body);

    FetchResult fetch_events(const std::string& replay_id,
                             const std::string& group,
                             core::ChunkType type,
                             core::ReplayManifest& manifest);
    FileStat stat_file(const std::string& replay_id, const std::string& name);
    FileStat stat_with_retry(const std::string& replay_id, const std::string& name);
    FetchResult stat_streams(const std::string& replay_id, std::uint64_t count, core::ReplayManifest& manifest);

    HttpSourceConfig cfg_;
    std::unique_ptr<IHttpTransport> transport_;
    util::Sleeper own_sleeper_;
    util::Sleeper& sleeper_;

    // Keys are fixed once fetch_manifest has returned. fetch_chunk moves each
    // payload out, so a chunk's bytes are handed over once.
    std::string replay_id_;
    std::unordered_map<std::string, core::ChunkPayload> inline_payloads_;

    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> bytes_downloaded_{0};
};

// Non-empty ASCII alphanumeric.
bool is_valid_replay_id(const std::string& id) noexcept;

} // namespace remote
