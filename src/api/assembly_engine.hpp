#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/chunk.hpp"
#include "core/chunk_order.hpp"
#include "persist/replay_format.hpp"
#include "persist/replay_sink.hpp"
#include "remote/replay_source.hpp"
#include "remote/retry_policy.hpp"
#include "util/clock.hpp"

namespace api {

// What to do when a checkpoint or event chunk is still missing after its refetch.
enum class MissingChunkPolicy {
    Abort,
    // Leave the record out and keep assembling. Header and stream chunks always abort.
    Degrade,
};

struct AssemblyConfig {
    std::uint32_t concurrency{8}; // clamped to [1, chunk count]
    // Fetched-but-uncommitted chunks allowed ahead of the writer.
    std::uint32_t max_buffered_chunks{64};
    remote::RetryPolicy retry{remote::default_retry_policy()};
    core::ValidationOptions validation{core::default_validation_options()};
    MissingChunkPolicy missing_chunks{MissingChunkPolicy::Abort};
};

enum class AssemblyStatus {
    Success,
    NotFound,
    NotReady,
    ServiceUnavailable,
    MalformedResponse,
    InvalidManifest,
    AssemblyFailed,
    SinkError,
    Cancelled,
    ConfigError,
};

const char* assembly_status_name(AssemblyStatus s) noexcept;

struct AssemblyError {
    AssemblyStatus status{AssemblyStatus::Success};
    std::string detail;
    // AssemblyFailed only.
    std::string chunk_id;
    remote::FetchStatus cause{remote::FetchStatus::Ok};
    // SinkError only: errno reported by the OS, 0 if none.
    int os_error{0};
};

struct ProgressCounter {
    std::size_t current{0};
    std::size_t max{0};
};

enum class ProgressStage { ManifestFetched, ChunkCommitted, Finalized };

struct AssemblyProgress {
    ProgressStage stage{ProgressStage::ManifestFetched};
    ProgressCounter header;
    ProgressCounter stream;
    ProgressCounter checkpoint;
    ProgressCounter event;
    std::uint64_t bytes_written{0};
    std::uint64_t total_bytes{0};
};

using ProgressCallback = std::function<void(const AssemblyProgress&)>;

struct AssemblyStats {
    std::uint64_t bytes_downloaded{0};
    std::uint64_t chunks_fetched{0};
    std::uint64_t chunks_committed{0};
    std::uint64_t retries{0};
    std::uint64_t refetches{0};
};

struct AssemblyResult {
    AssemblyStatus status{AssemblyStatus::Success};
    AssemblyError error;
    // An incomplete artifact is left behind and must be removed by the caller.
    bool cleanup_needed{false};

    std::uint64_t bytes_written{0};
    std::size_t chunk_count{0};
    std::uint64_t payload_bytes{0};  // sum of raw chunk payloads
    std::uint32_t payload_crc32c{0}; // over the whole payload section
    core::ReplayMeta meta;           // meta.created / meta.timestamp_ticks carry the timestamp
    std::vector<persist::ChunkIndexEntry> index;
    std::size_t duplicates_dropped{0};
    std::size_t capped_chunks{0};
    // Degrade only: remote ids left out of the output, in canonical order.
    std::vector<std::string> dropped_chunks;

    bool ok() const noexcept { return status == AssemblyStatus::Success; }
};

// Fetches one replay from `source` and streams the container to `sink`.
// The calling thread is the only writer to the sink and the only thread that
// invokes the progress callback. An engine runs one assembly.
class AssemblyEngine {
public:
    AssemblyEngine(AssemblyConfig cfg, remote::IReplaySource& source, persist::IReplaySink& sink);
    // `sleeper` is interrupted by cancel() and when the workers are stopped.
    AssemblyEngine(AssemblyConfig cfg,
                   remote::IReplaySource& source,
                   persist::IReplaySink& sink,
                   util::Sleeper& sleeper);
    ~AssemblyEngine();

    AssemblyEngine(const AssemblyEngine&) = delete;
    AssemblyEngine& operator=(const AssemblyEngine&) = delete;

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    AssemblyResult run(const std::string& replay_id);

    // Safe from any thread, including from the progress callback.
    void cancel() noexcept;
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    AssemblyStats snapshot_stats() const noexcept;

private:
    enum class SlotState : int { Pending, Ready, Failed };

    struct Slot {
        std::atomic<SlotState> state{SlotState::Pending};
        core::ChunkPayload payload;
        remote::FetchResult failure;
    };

    bool fetch_manifest(const std::string& replay_id, core::ReplayManifest& manifest, AssemblyResult& result);
    remote::FetchResult fetch_chunk_with_retry(const core::ChunkDescriptor& desc,
                                               core::ChunkPayload& payload,
                                               std::uint64_t seed);
    bool skippable(const core::ChunkDescriptor& desc, remote::FetchStatus cause) const noexcept;
    void worker_loop(const std::vector<core::ChunkDescriptor>& chunks, std::uint64_t seed);
    bool commit_all(const core::AssemblyPlan& plan,
                    const persist::ReplayLayout& layout,
                    AssemblyResult& result,
                    std::uint64_t& dropped_bytes);
    void stop_workers() noexcept;
    void notify_committer() noexcept;
    void sleep_backoff(std::uint32_t retry, std::uint64_t& rng_state);
    void report(ProgressStage stage);
    void fail(AssemblyResult& result, AssemblyStatus status, std::string detail);

    AssemblyConfig cfg_;
    remote::IReplaySource& source_;
    persist::IReplaySink& sink_;
    util::InterruptibleSleeper own_sleeper_;
    util::Sleeper& sleeper_;
    ProgressCallback progress_cb_;
    AssemblyProgress progress_;

    std::unique_ptr<Slot[]> slots_;
    std::size_t slot_count_{0};
    std::atomic<std::size_t> next_claim_{0};
    // Lowest failed slot; workers abandon slots above it.
    std::atomic<std::size_t> first_failed_{static_cast<std::size_t>(-1)};
    std::size_t committed_{0}; // guarded by mu_
    std::mutex mu_;
    std::condition_variable ready_cv_;
    std::condition_variable window_cv_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> cancelled_{false};

    std::atomic<std::uint64_t> bytes_downloaded_{0};
    std::atomic<std::uint64_t> chunks_fetched_{0};
    std::atomic<std::uint64_t> chunks_committed_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> refetches_{0};
};

// Convenience wrapper: one engine, one run, no progress callback.
AssemblyResult assemble_replay(const std::string& replay_id,
                               const AssemblyConfig& cfg,
                               remote::IReplaySource& source,
                               persist::IReplaySink& sink);

} // namespace api
