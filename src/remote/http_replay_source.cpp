#include "remote/http_replay_source.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <thread>
#include <vector>

#include "util/log.hpp"

namespace remote {
namespace {

enum class Target { Manifest, Chunk };

FetchResult classify(const HttpResponse& r, const std::string& what, Target target) {
    if (r.transport_failed()) {
        return FetchResult::failure(FetchStatus::ServiceUnavailable, what + ": " + r.transport_error);
    }
    if (r.success()) {
        return FetchResult::success();
    }
    const std::string detail = what + ": HTTP " + std::to_string(r.status);
    if (r.status == 404 || r.status == 410) {
        return FetchResult::failure(target == Target::Manifest ? FetchStatus::NotFound : FetchStatus::ChunkMissing,
                                    detail);
    }
    if (r.status == 408 || r.status == 429 || (r.status >= 500 && r.status < 600)) {
        return FetchResult::failure(FetchStatus::ServiceUnavailable, detail);
    }
    return FetchResult::failure(
        target == Target::Manifest ? FetchStatus::MalformedResponse : FetchStatus::ChunkMissing, detail);
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

bool is_valid_replay_id(const std::string& id) noexcept {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u < 0x80 && std::isalnum(u);
    });
}

HttpReplaySource::HttpReplaySource(HttpSourceConfig cfg)
    : HttpReplaySource(cfg, std::make_unique<CurlTransport>(cfg.transport)) {}

HttpReplaySource::HttpReplaySource(HttpSourceConfig cfg, std::unique_ptr<IHttpTransport> transport)
    : HttpReplaySource(std::move(cfg), std::move(transport), own_sleeper_) {}

HttpReplaySource::HttpReplaySource(HttpSourceConfig cfg,
                                   std::unique_ptr<IHttpTransport> transport,
                                   util::Sleeper& sleeper)
    : cfg_(std::move(cfg)), transport_(std::move(transport)), sleeper_(sleeper) {
    cfg_.base_url = trim_trailing_slash(cfg_.base_url);
    if (cfg_.page_size == 0) {
        cfg_.page_size = 100;
    }
    if (cfg_.head_concurrency == 0) {
        cfg_.head_concurrency = 1;
    }
    if (cfg_.head_retry.max_attempts == 0) {
        cfg_.head_retry.max_attempts = 1;
    }
}

SourceStats HttpReplaySource::stats() const noexcept {
    return {requests_.load(std::memory_order_relaxed), bytes_downloaded_.load(std::memory_order_relaxed)};
}

std::string HttpReplaySource::replay_url(const std::string& replay_id) const {
    return cfg_.base_url + "/replay/" + replay_id;
}

std::string HttpReplaySource::file_url(const std::string& replay_id, const std::string& name) const {
    return replay_url(replay_id) + "/file/" + name;
}

HttpResponse HttpReplaySource::get(const std::string& url) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    HttpResponse r = transport_->get(url);
    bytes_downloaded_.fetch_add(r.body.size(), std::memory_order_relaxed);
    return r;
}

HttpResponse HttpReplaySource::head(const std::string& url) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    return transport_->head(url);
}

HttpResponse HttpReplaySource::post(const std::string& url, const std::string& body) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    HttpResponse r = transport_->post(url, body);
    bytes_downloaded_.fetch_add(r.body.size(), std::memory_order_relaxed);
    return r;
}

FetchResult HttpReplaySource::list_replays(std::uint64_t offset, ReplayPage& out) {
    const std::string url = cfg_.base_url + "/find/?game=all&offset=" + std::to_string(offset) + "&live=false";
    const HttpResponse r = get(url);
    if (auto res = classify(r, "find offset=" + std::to_string(offset), Target::Manifest); !res.ok()) {
        return res;
    }
    std::string err;
    if (!parse_find_page(r.body, out, err)) {
        return FetchResult::failure(FetchStatus::MalformedResponse, "find listing: " + err);
    }
    return FetchResult::success();
}

FetchResult HttpReplaySource::find_replay(const std::string& replay_id, ReplayListing& out) {
    if (!is_valid_replay_id(replay_id)) {
        return FetchResult::failure(FetchStatus::NotFound, "invalid replay id '" + replay_id + "'");
    }
    std::uint64_t offset = 0;
    while (true) {
        ReplayPage page;
        if (auto res = list_replays(offset, page); !res.ok()) {
            return res;
        }
        for (auto& r : page.replays) {
            if (r.id == replay_id) {
                out = std::move(r);
                return FetchResult::success();
            }
        }
        offset += cfg_.page_size;
        if (page.replays.empty() || offset >= page.total) {
            break;
        }
    }
    return FetchResult::failure(FetchStatus::NotFound, "replay " + replay_id + " not in listing");
}

FetchResult HttpReplaySource::fetch_events(const std::string& replay_id,
                                           const std::string& group,
                                           core::ChunkType type,
                                           core::ReplayManifest& manifest) {
    const HttpResponse r = get(replay_url(replay_id) + "/event?group=" + group);
    if (auto res = classify(r, group + " events", Target::Manifest); !res.ok()) {
        return res;
    }
    std::vector<ServiceEvent> events;
    std::size_t skipped = 0;
    std::string err;
    if (!parse_event_list(r.body, events, skipped, err)) {
        return FetchResult::failure(FetchStatus::MalformedResponse, group + " events: " + err);
    }
    if (skipped > 0) {
        RF_LOG_WARN("replay %s: skipped %zu incomplete %s events", replay_id.c_str(), skipped, group.c_str());
    }
    for (auto& ev : events) {
        if (ev.data.size() > std::numeric_limits<std::uint32_t>::max()) {
            return FetchResult::failure(FetchStatus::MalformedResponse, group + " event " + ev.id + " too large");
        }
        core::ChunkDescriptor d;
        d.type = type;
        d.size = static_cast<std::uint32_t>(ev.data.size());
        d.start_ms = ev.time1;
        d.end_ms = ev.time2;
        d.remote_id = std::move(ev.id);
        d.group = std::move(ev.group);
        d.metadata = std::move(ev.meta);
        inline_payloads_.emplace(inline_payload_key(d), std::move(ev.data));
        manifest.chunks.push_back(std::move(d));
    }
    return FetchResult::success();
}

HttpReplaySource::FileStat HttpReplaySource::stat_file(const std::string& replay_id, const std::string& name) {
    FileStat p;
    const HttpResponse r = head(file_url(replay_id, name));
    p.result = classify(r, "HEAD " + name, Target::Manifest);
    if (!p.result.ok()) {
        return p;
    }
    const std::string* len = r.header("content-length");
    if (!len || !parse_u32_text(*len, p.size)) {
        p.result = FetchResult::failure(FetchStatus::MalformedResponse, "HEAD " + name + ": no usable Content-Length");
        return p;
    }
    if (const std::string* t1 = r.header("mtime1"); t1 && !parse_u32_text(*t1, p.start_ms)) {
        p.result = FetchResult::failure(FetchStatus::MalformedResponse, "HEAD " + name + ": bad mtime1 " + *t1);
        return p;
    }
    if (const std::string* t2 = r.header("mtime2"); t2 && !parse_u32_text(*t2, p.end_ms)) {
        p.result = FetchResult::failure(FetchStatus::MalformedResponse, "HEAD " + name + ": bad mtime2 " + *t2);
        return p;
    }
    return p;
}

HttpReplaySource::FileStat HttpReplaySource::stat_with_retry(const std::string& replay_id,
                                                                const std::string& name) {
    for (std::uint32_t attempt = 1;; ++attempt) {
        FileStat p = stat_file(replay_id, name);
        if (p.result.status != FetchStatus::ServiceUnavailable || attempt >= cfg_.head_retry.max_attempts) {
            return p;
        }
        RF_LOG_WARN("replay %s: %s (attempt %u/%u), retrying",
                    replay_id.c_str(),
                    p.result.detail.c_str(),
                    attempt,
                    cfg_.head_retry.max_attempts);
        sleeper_.sleep_for(backoff_delay(cfg_.head_retry, attempt));
    }
}

FetchResult HttpReplaySource::stat_streams(const std::string& replay_id,
                                            std::uint64_t count,
                                            core::ReplayManifest& manifest) {
    if (count == 0) {
        return FetchResult::success();
    }
    std::vector<FileStat> results(count);
    std::atomic<std::uint64_t> next{0};
    std::atomic<bool> failed{false};
    auto worker = [&] {
        while (!failed.load(std::memory_order_acquire)) {
            const std::uint64_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }
            results[i] = stat_with_retry(replay_id, "stream." + std::to_string(i));
            if (!results[i].result.ok()) {
                failed.store(true, std::memory_order_release);
            }
        }
    };
    const auto nthreads = static_cast<std::size_t>(std::min<std::uint64_t>(cfg_.head_concurrency, count));
    std::vector<std::thread> threads;
    threads.reserve(nthreads);
    for (std::size_t t = 0; t < nthreads; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& th : threads) {
        th.join();
    }
    for (const auto& p : results) {
        if (!p.result.ok()) {
            return p.result;
        }
    }
    for (std::uint64_t i = 0; i < count; ++i) {
        core::ChunkDescriptor d;
        d.type = core::ChunkType::Stream;
        d.size = results[i].size;
        d.start_ms = results[i].start_ms;
        d.end_ms = results[i].end_ms;
        d.remote_id = "stream." + std::to_string(i);
        d.stream_index = static_cast<std::uint32_t>(i);
        manifest.chunks.push_back(std::move(d));
    }
    return FetchResult::success();
}

FetchResult HttpReplaySource::fetch_manifest(const std::string& replay_id, core::ReplayManifest& out) {
    if (!is_valid_replay_id(replay_id)) {
        return FetchResult::failure(FetchStatus::NotFound, "invalid replay id '" + replay_id + "'");
    }
    replay_id_.clear();
    inline_payloads_.clear();

    if (cfg_.locate_in_listing) {
        ReplayListing listing;
        if (auto res = find_replay(replay_id, listing); !res.ok()) {
            return res;
        }
    }

    const HttpResponse start = post(replay_url(replay_id) + "/startDownloading?user", std::string{});
    if (auto res = classify(start, "startDownloading", Target::Manifest); !res.ok()) {
        return res;
    }
    DownloadState state;
    std::string err;
    if (!parse_download_state(start.body, state, err)) {
        return FetchResult::failure(FetchStatus::MalformedResponse, "startDownloading: " + err);
    }
    if (state.state != "Recorded") {
        return FetchResult::failure(FetchStatus::NotReady, "replay state is '" + state.state + "'");
    }
    if (state.num_chunks > cfg_.max_stream_chunks) {
        return FetchResult::failure(FetchStatus::MalformedResponse,
                                    "numChunks " + std::to_string(state.num_chunks) + " exceeds limit " +
                                        std::to_string(cfg_.max_stream_chunks));
    }

    core::ReplayManifest manifest;
    manifest.replay_id = replay_id;

    const HttpResponse meta = get(cfg_.base_url + "/meta/" + replay_id);
    if (auto res = classify(meta, "meta", Target::Manifest); !res.ok()) {
        return res;
    }
    if (!parse_replay_meta(meta.body, manifest.meta, err)) {
        return FetchResult::failure(FetchStatus::MalformedResponse, "meta: " + err);
    }

    if (auto res = fetch_events(replay_id, "checkpoint", core::ChunkType::Checkpoint, manifest); !res.ok()) {
        return res;
    }
    if (auto res = fetch_events(replay_id, "Pavlov", core::ChunkType::Event, manifest); !res.ok()) {
        return res;
    }

    FileStat header = stat_with_retry(replay_id, "replay.header");
    if (!header.result.ok()) {
        return header.result;
    }
    core::ChunkDescriptor hd;
    hd.type = core::ChunkType::Header;
    hd.size = header.size;
    hd.remote_id = "replay.header";
    manifest.chunks.push_back(std::move(hd));

    if (auto res = stat_streams(replay_id, state.num_chunks, manifest); !res.ok()) {
        return res;
    }

    RF_LOG_INFO("replay %s: manifest with %zu chunks (%llu streams), %u ms",
                replay_id.c_str(),
                manifest.chunks.size(),
                static_cast<unsigned long long>(state.num_chunks),
                manifest.meta.total_time_ms);
    replay_id_ = replay_id;
    out = std::move(manifest);
    return FetchResult::success();
}

FetchResult HttpReplaySource::fetch_chunk(const core::ChunkDescriptor& desc, core::ChunkPayload& out) {
    switch (desc.type) {
    case core::ChunkType::Checkpoint:
    case core::ChunkType::Event: {
        const auto it = inline_payloads_.find(inline_payload_key(desc));
        if (it == inline_payloads_.end()) {
            return FetchResult::failure(FetchStatus::ChunkMissing, "no inline payload for " + desc.remote_id);
        }
        if (it->second.empty() && desc.size > 0) {
            return FetchResult::failure(FetchStatus::ChunkMissing, "inline payload for " + desc.remote_id + " already taken");
        }
        if (it->second.size() != desc.size) {
            return FetchResult::failure(FetchStatus::SizeMismatch,
                                        desc.remote_id + ": expected " + std::to_string(desc.size) + " bytes, have " +
                                            std::to_string(it->second.size()));
        }
        out = std::move(it->second);
        core::ChunkPayload().swap(it->second);
        return FetchResult::success();
    }
    case core::ChunkType::Header:
    case core::ChunkType::Stream: {
        HttpResponse r = get(file_url(replay_id_, desc.remote_id));
        if (auto res = classify(r, desc.remote_id, Target::Chunk); !res.ok()) {
            return res;
        }
        if (r.body.size() != desc.size) {
            return FetchResult::failure(FetchStatus::SizeMismatch,
                                        desc.remote_id + ": expected " + std::to_string(desc.size) + " bytes, got " +
                                            std::to_string(r.body.size()));
        }
        const auto* first = reinterpret_cast<const std::byte*>(r.body.data());
        out.assign(first, first + r.body.size());
        return FetchResult::success();
    }
    }
    return FetchResult::failure(FetchStatus::ChunkMissing, "unknown chunk type");
}

} // namespace remote
