#include "api/assembly_engine.hpp"

#include <algorithm>
#include <limits>
#include <span>
#include <thread>

#include "util/crc32c.hpp"
#include "util/log.hpp"

namespace api {
namespace {

constexpr std::size_t kNoFailure = std::numeric_limits<std::size_t>::max();

AssemblyStatus status_from_manifest(remote::FetchStatus s) noexcept {
    switch (s) {
    case remote::FetchStatus::Ok: return AssemblyStatus::Success;
    case remote::FetchStatus::NotFound: return AssemblyStatus::NotFound;
    case remote::FetchStatus::NotReady: return AssemblyStatus::NotReady;
    case remote::FetchStatus::ServiceUnavailable: return AssemblyStatus::ServiceUnavailable;
    case remote::FetchStatus::MalformedResponse:
    case remote::FetchStatus::ChunkMissing:
    case remote::FetchStatus::SizeMismatch: return AssemblyStatus::MalformedResponse;
    }
    return AssemblyStatus::MalformedResponse;
}

// splitmix64; only feeds backoff jitter.
double next_unit(std::uint64_t& state) noexcept {
    std::uint64_t z = (state += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    z ^= z >> 31;
    return static_cast<double>(z >> 11) * (1.0 / 9007199254740992.0);
}

ProgressCounter& counter_for(AssemblyProgress& p, core::ChunkType t) noexcept {
    switch (t) {
    case core::ChunkType::Header: return p.header;
    case core::ChunkType::Stream: return p.stream;
    case core::ChunkType::Checkpoint: return p.checkpoint;
    case core::ChunkType::Event: return p.event;
    }
    return p.header;
}

// Joins worker threads on every exit path out of run().
class WorkerGroup {
public:
    explicit WorkerGroup(std::function<void()> on_stop) : on_stop_(std::move(on_stop)) {}
    ~WorkerGroup() { join(); }

    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    void join() noexcept {
        if (threads_.empty()) {
            return;
        }
        on_stop_();
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        threads_.clear();
    }

private:
    std::function<void()> on_stop_;
    std::vector<std::thread> threads_;
};

} // namespace

const char* assembly_status_name(AssemblyStatus s) noexcept {
    switch (s) {
    case AssemblyStatus::Success: return "Success";
    case AssemblyStatus::NotFound: return "NotFound";
    case AssemblyStatus::NotReady: return "NotReady";
    case AssemblyStatus::ServiceUnavailable: return "ServiceUnavailable";
    case AssemblyStatus::MalformedResponse: return "MalformedResponse";
    case AssemblyStatus::InvalidManifest: return "InvalidManifest";
    case AssemblyStatus::AssemblyFailed: return "AssemblyFailed";
    case AssemblyStatus::SinkError: return "SinkError";
    case AssemblyStatus::Cancelled: return "Cancelled";
    case AssemblyStatus::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

AssemblyEngine::AssemblyEngine(AssemblyConfig cfg, remote::IReplaySource& source, persist::IReplaySink& sink)
    : cfg_(cfg), source_(source), sink_(sink), sleeper_(own_sleeper_) {}

AssemblyEngine::AssemblyEngine(AssemblyConfig cfg,
                               remote::IReplaySource& source,
                               persist::IReplaySink& sink,
                               util::Sleeper& sleeper)
    : cfg_(cfg), source_(source), sink_(sink), sleeper_(sleeper) {}

AssemblyEngine::~AssemblyEngine() = default;

void AssemblyEngine::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lk(mu_);
    }
    ready_cv_.notify_all();
    window_cv_.notify_all();
    sleeper_.interrupt();
}

AssemblyStats AssemblyEngine::snapshot_stats() const noexcept {
    AssemblyStats s;
    s.bytes_downloaded = bytes_downloaded_.load(std::memory_order_relaxed);
    s.chunks_fetched = chunks_fetched_.load(std::memory_order_relaxed);
    s.chunks_committed = chunks_committed_.load(std::memory_order_relaxed);
    s.retries = retries_.load(std::memory_order_relaxed);
    s.refetches = refetches_.load(std::memory_order_relaxed);
    return s;
}

void AssemblyEngine::fail(AssemblyResult& result, AssemblyStatus status, std::string detail) {
    result.status = status;
    result.error.status = status;
    result.error.detail = std::move(detail);
    if (status == AssemblyStatus::Cancelled) {
        RF_LOG_INFO("assembly cancelled");
    } else {
        RF_LOG_ERROR("assembly failed: %s: %s", assembly_status_name(status), result.error.detail.c_str());
    }
}

void AssemblyEngine::report(ProgressStage stage) {
    if (!progress_cb_) {
        return;
    }
    progress_.stage = stage;
    progress_cb_(progress_);
}

void AssemblyEngine::sleep_backoff(std::uint32_t retry, std::uint64_t& rng_state) {
    const double unit = cfg_.retry.jitter > 0.0 ? next_unit(rng_state) : 0.0;
    sleeper_.sleep_for(remote::backoff_delay(cfg_.retry, retry, unit));
}

void AssemblyEngine::notify_committer() noexcept {
    {
        std::lock_guard<std::mutex> lk(mu_);
    }
    ready_cv_.notify_one();
}

void AssemblyEngine::stop_workers() noexcept {
    stop_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lk(mu_);
    }
    window_cv_.notify_all();
    sleeper_.interrupt();
}

bool AssemblyEngine::skippable(const core::ChunkDescriptor& desc, remote::FetchStatus cause) const noexcept {
    return cfg_.missing_chunks == MissingChunkPolicy::Degrade && cause == remote::FetchStatus::ChunkMissing &&
           (desc.type == core::ChunkType::Checkpoint || desc.type == core::ChunkType::Event);
}

bool AssemblyEngine::fetch_manifest(const std::string& replay_id,
                                    core::ReplayManifest& manifest,
                                    AssemblyResult& result) {
    std::uint64_t rng = 0x2545F4914F6CDD1Dull;
    for (std::uint32_t attempt = 1;; ++attempt) {
        if (cancelled()) {
            fail(result, AssemblyStatus::Cancelled, "cancelled before manifest was fetched");
            return false;
        }
        const remote::FetchResult r = source_.fetch_manifest(replay_id, manifest);
        if (r.ok()) {
            return true;
        }
        if (r.status == remote::FetchStatus::ServiceUnavailable && attempt < cfg_.retry.max_attempts) {
            retries_.fetch_add(1, std::memory_order_relaxed);
            RF_LOG_WARN("manifest %s: %s (attempt %u/%u), retrying",
                        replay_id.c_str(),
                        r.detail.c_str(),
                        attempt,
                        cfg_.retry.max_attempts);
            sleep_backoff(attempt, rng);
            continue;
        }
        fail(result, status_from_manifest(r.status), r.detail);
        return false;
    }
}

remote::FetchResult AssemblyEngine::fetch_chunk_with_retry(const core::ChunkDescriptor& desc,
                                                           core::ChunkPayload& payload,
                                                           std::uint64_t seed) {
    std::uint64_t rng = seed;
    std::uint32_t attempts = 0;
    bool refetched = false;
    while (true) {
        if (cancelled() || stop_.load(std::memory_order_acquire)) {
            return remote::FetchResult::failure(remote::FetchStatus::ServiceUnavailable, "stopped");
        }
        payload.clear();
        remote::FetchResult r = source_.fetch_chunk(desc, payload);
        if (r.ok() && payload.size() != desc.size) {
            r = remote::FetchResult::failure(remote::FetchStatus::SizeMismatch,
                                             "expected " + std::to_string(desc.size) + " bytes, got " +
                                                 std::to_string(payload.size()));
        }
        if (r.ok()) {
            chunks_fetched_.fetch_add(1, std::memory_order_relaxed);
            bytes_downloaded_.fetch_add(payload.size(), std::memory_order_relaxed);
            return r;
        }
        switch (r.status) {
        case remote::FetchStatus::ServiceUnavailable:
            if (++attempts >= cfg_.retry.max_attempts) {
                return r;
            }
            retries_.fetch_add(1, std::memory_order_relaxed);
            RF_LOG_WARN("chunk %s: %s (attempt %u/%u), retrying",
                        desc.remote_id.c_str(),
                        r.detail.c_str(),
                        attempts,
                        cfg_.retry.max_attempts);
            sleep_backoff(attempts, rng);
            break;
        case remote::FetchStatus::ChunkMissing:
        case remote::FetchStatus::SizeMismatch:
            if (refetched) {
                return r;
            }
            refetched = true;
            refetches_.fetch_add(1, std::memory_order_relaxed);
            RF_LOG_WARN("chunk %s: %s, fetching once more", desc.remote_id.c_str(), r.detail.c_str());
            break;
        default:
            return r;
        }
    }
}

void AssemblyEngine::worker_loop(const std::vector<core::ChunkDescriptor>& chunks, std::uint64_t seed) {
    while (!stop_.load(std::memory_order_acquire) && !cancelled()) {
        const std::size_t i = next_claim_.fetch_add(1, std::memory_order_relaxed);
        if (i >= slot_count_ || i > first_failed_.load(std::memory_order_acquire)) {
            return;
        }
        {
            std::unique_lock<std::mutex> lk(mu_);
            window_cv_.wait(lk, [&] {
                return stop_.load(std::memory_order_acquire) || cancelled() ||
                       i > first_failed_.load(std::memory_order_acquire) ||
                       i < committed_ + cfg_.max_buffered_chunks;
            });
        }
        if (stop_.load(std::memory_order_acquire) || cancelled() || i > first_failed_.load(std::memory_order_acquire)) {
            return;
        }

        Slot& slot = slots_[i];
        remote::FetchResult r = fetch_chunk_with_retry(chunks[i], slot.payload, seed + i);
        if (cancelled() || stop_.load(std::memory_order_acquire)) {
            return;
        }
        if (!r.ok()) {
            const bool fatal = !skippable(chunks[i], r.status);
            slot.failure = std::move(r);
            slot.state.store(SlotState::Failed, std::memory_order_release);
            if (!fatal) {
                notify_committer();
                continue;
            }
            std::size_t cur = first_failed_.load(std::memory_order_relaxed);
            while (i < cur && !first_failed_.compare_exchange_weak(cur, i, std::memory_order_acq_rel)) {
            }
            {
                std::lock_guard<std::mutex> lk(mu_);
            }
            ready_cv_.notify_one();
            window_cv_.notify_all();
            return;
        }
        slot.state.store(SlotState::Ready, std::memory_order_release);
        notify_committer();
    }
}

bool AssemblyEngine::commit_all(const core::AssemblyPlan& plan,
                                const persist::ReplayLayout& layout,
                                AssemblyResult& result,
                                std::uint64_t& dropped_bytes) {
    if (auto r = sink_.write(layout.info); !r.ok) {
        result.error.os_error = r.error_code;
        fail(result, AssemblyStatus::SinkError, r.detail);
        return false;
    }
    result.bytes_written = sink_.bytes_written();

    util::Crc32c crc;
    std::vector<bool> dropped(slot_count_, false);
    for (std::size_t i = 0; i < slot_count_; ++i) {
        Slot& slot = slots_[i];
        {
            std::unique_lock<std::mutex> lk(mu_);
            ready_cv_.wait(lk, [&] {
                return cancelled() || slot.state.load(std::memory_order_acquire) != SlotState::Pending;
            });
        }
        if (cancelled()) {
            fail(result, AssemblyStatus::Cancelled, "cancelled after " + std::to_string(i) + " chunks");
            return false;
        }
        const core::ChunkDescriptor& desc = plan.chunks[i];
        const std::vector<std::byte>& frame = layout.frame_headers[i];
        if (slot.state.load(std::memory_order_acquire) == SlotState::Failed && skippable(desc, slot.failure.status)) {
            RF_LOG_WARN("%s chunk %s: %s, leaving it out",
                        core::chunk_type_name(desc.type),
                        desc.remote_id.c_str(),
                        slot.failure.detail.c_str());
            dropped[i] = true;
            result.dropped_chunks.push_back(desc.remote_id);
            dropped_bytes += frame.size() + desc.size;
            result.payload_bytes -= desc.size;
            --counter_for(progress_, desc.type).max;
            progress_.total_bytes -= frame.size() + desc.size;
            {
                std::lock_guard<std::mutex> lk(mu_);
                committed_ = i + 1;
            }
            window_cv_.notify_all();
            continue;
        }
        if (slot.state.load(std::memory_order_acquire) == SlotState::Failed) {
            result.error.chunk_id = desc.remote_id;
            result.error.cause = slot.failure.status;
            fail(result,
                 AssemblyStatus::AssemblyFailed,
                 std::string(core::chunk_type_name(desc.type)) + " chunk " + desc.remote_id + ": " +
                     remote::fetch_status_name(slot.failure.status) + ": " + slot.failure.detail);
            return false;
        }

        const std::span<const std::byte> parts[2] = {frame, slot.payload};
        if (auto r = sink_.write_gather(parts); !r.ok) {
            result.bytes_written = sink_.bytes_written();
            result.error.os_error = r.error_code;
            fail(result, AssemblyStatus::SinkError, r.detail);
            return false;
        }
        crc.append(frame);
        crc.append(slot.payload);
        core::ChunkPayload().swap(slot.payload);
        result.bytes_written = sink_.bytes_written();

        {
            std::lock_guard<std::mutex> lk(mu_);
            committed_ = i + 1;
        }
        window_cv_.notify_all();
        chunks_committed_.fetch_add(1, std::memory_order_relaxed);

        ++counter_for(progress_, desc.type).current;
        progress_.bytes_written = result.bytes_written;
        report(ProgressStage::ChunkCommitted);
    }
    result.payload_crc32c = crc.value();

    if (!result.dropped_chunks.empty()) {
        // Later records move up by the bytes of every dropped one before them.
        std::vector<persist::ChunkIndexEntry> kept;
        kept.reserve(slot_count_ - result.dropped_chunks.size());
        std::uint64_t shift = 0;
        for (std::size_t i = 0; i < slot_count_; ++i) {
            if (dropped[i]) {
                shift += layout.frame_headers[i].size() + plan.chunks[i].size;
                continue;
            }
            persist::ChunkIndexEntry e = std::move(result.index[i]);
            e.frame_offset -= shift;
            e.payload_offset -= shift;
            kept.push_back(std::move(e));
        }
        result.index = std::move(kept);
        result.chunk_count = result.index.size();
    }
    return true;
}

AssemblyResult AssemblyEngine::run(const std::string& replay_id) {
    AssemblyResult result;
    if (cfg_.retry.max_attempts == 0) {
        fail(result, AssemblyStatus::ConfigError, "retry.max_attempts must be at least 1");
        return result;
    }
    if (cfg_.max_buffered_chunks == 0) {
        fail(result, AssemblyStatus::ConfigError, "max_buffered_chunks must be at least 1");
        return result;
    }
    if (cfg_.retry.jitter < 0.0 || cfg_.retry.jitter > 1.0) {
        fail(result, AssemblyStatus::ConfigError, "retry.jitter must be within [0, 1]");
        return result;
    }

    auto abort_sink = [&] {
        sink_.abort();
        result.cleanup_needed = sink_.leaves_partial();
    };

    core::ReplayManifest manifest;
    if (!fetch_manifest(replay_id, manifest, result)) {
        abort_sink();
        return result;
    }
    result.meta = manifest.meta;

    core::AssemblyPlan plan;
    std::string err;
    if (!core::build_assembly_plan(manifest, cfg_.validation, plan, err)) {
        fail(result, AssemblyStatus::InvalidManifest, err);
        abort_sink();
        return result;
    }
    persist::ReplayLayout layout;
    if (!persist::compute_layout(manifest.meta, plan.chunks, layout, err)) {
        fail(result, AssemblyStatus::InvalidManifest, err);
        abort_sink();
        return result;
    }
    if (plan.duplicates_dropped > 0) {
        RF_LOG_WARN("replay %s: dropped %zu duplicate chunk descriptors", replay_id.c_str(), plan.duplicates_dropped);
    }

    result.chunk_count = plan.chunks.size();
    result.duplicates_dropped = plan.duplicates_dropped;
    result.capped_chunks = plan.capped;
    for (const auto& c : plan.chunks) {
        result.payload_bytes += c.size;
        ++counter_for(progress_, c.type).max;
    }
    result.index = layout.index;
    progress_.total_bytes = layout.total_size;
    RF_LOG_INFO("replay %s: %zu chunks, %llu bytes to assemble",
                replay_id.c_str(),
                result.chunk_count,
                static_cast<unsigned long long>(layout.total_size));
    report(ProgressStage::ManifestFetched);

    slot_count_ = plan.chunks.size();
    slots_ = std::make_unique<Slot[]>(slot_count_);
    next_claim_.store(0, std::memory_order_relaxed);
    first_failed_.store(kNoFailure, std::memory_order_relaxed);
    committed_ = 0;
    stop_.store(false, std::memory_order_relaxed);

    const std::size_t nthreads =
        std::clamp<std::size_t>(cfg_.concurrency, 1, std::max<std::size_t>(slot_count_, 1));
    bool committed_all = false;
    std::uint64_t dropped_bytes = 0;
    {
        WorkerGroup workers([this] { stop_workers(); });
        for (std::size_t t = 0; t < nthreads; ++t) {
            const std::uint64_t seed = 0x9E3779B97F4A7C15ull * (t + 1);
            workers.spawn([this, &plan, seed] { worker_loop(plan.chunks, seed); });
        }
        committed_all = commit_all(plan, layout, result, dropped_bytes);
    }
    slots_.reset();

    if (!committed_all) {
        abort_sink();
        return result;
    }
    if (!result.dropped_chunks.empty()) {
        RF_LOG_WARN("replay %s: assembled without %zu missing chunks", replay_id.c_str(), result.dropped_chunks.size());
    }
    if (auto r = sink_.finalize(layout.total_size - dropped_bytes); !r.ok) {
        result.error.os_error = r.error_code;
        fail(result, AssemblyStatus::SinkError, r.detail);
        abort_sink();
        return result;
    }
    result.bytes_written = sink_.bytes_written();
    RF_LOG_INFO("replay %s assembled: %llu bytes, crc32c=%08x",
                replay_id.c_str(),
                static_cast<unsigned long long>(result.bytes_written),
                result.payload_crc32c);
    report(ProgressStage::Finalized);
    return result;
}

AssemblyResult assemble_replay(const std::string& replay_id,
                               const AssemblyConfig& cfg,
                               remote::IReplaySource& source,
                               persist::IReplaySink& sink) {
    AssemblyEngine engine(cfg, source, sink);
    return engine.run(replay_id);
}

} // namespace api
