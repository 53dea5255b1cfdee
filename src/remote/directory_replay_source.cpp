#include "remote/directory_replay_source.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>
#include <vector>

#include "remote/service_json.hpp"
#include "util/log.hpp"

namespace remote {
namespace {

constexpr std::string_view kStreamPrefix = "stream.";

bool read_file(const std::filesystem::path& p, std::string& out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

// N of "stream.N"; false for anything else.
bool stream_index_of(const std::string& name, std::uint32_t& index) {
    if (name.rfind(kStreamPrefix, 0) != 0) {
        return false;
    }
    const std::string_view digits = std::string_view(name).substr(kStreamPrefix.size());
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string_view::npos) {
        return false;
    }
    return parse_u32_text(digits, index);
}

void add_inline_events(std::vector<ServiceEvent>& events,
                       core::ChunkType type,
                       core::ReplayManifest& manifest,
                       std::unordered_map<std::string, core::ChunkPayload>& payloads) {
    for (auto& ev : events) {
        core::ChunkDescriptor d;
        d.type = type;
        d.size = static_cast<std::uint32_t>(ev.data.size());
        d.start_ms = ev.time1;
        d.end_ms = ev.time2;
        d.remote_id = std::move(ev.id);
        d.group = std::move(ev.group);
        d.metadata = std::move(ev.meta);
        payloads.emplace(inline_payload_key(d), std::move(ev.data));
        manifest.chunks.push_back(std::move(d));
    }
}

} // namespace

DirectoryReplaySource::DirectoryReplaySource(std::filesystem::path dir) : dir_(std::move(dir)) {}

SourceStats DirectoryReplaySource::stats() const noexcept {
    return {reads_.load(std::memory_order_relaxed), bytes_read_.load(std::memory_order_relaxed)};
}

FetchResult DirectoryReplaySource::fetch_manifest(const std::string& replay_id, core::ReplayManifest& out) {
    inline_payloads_.clear();
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) {
        return FetchResult::failure(FetchStatus::NotFound, dir_.string() + " is not a directory");
    }

    std::string text;
    const auto metadata_path = dir_ / "metadata.json";
    if (!read_file(metadata_path, text)) {
        return FetchResult::failure(FetchStatus::NotFound, "cannot read " + metadata_path.string());
    }
    reads_.fetch_add(1, std::memory_order_relaxed);
    MetadataFile metadata;
    std::string err;
    if (!parse_metadata_file(text, metadata, err)) {
        return FetchResult::failure(FetchStatus::MalformedResponse, "metadata.json: " + err);
    }
    if (metadata.skipped_events > 0) {
        RF_LOG_WARN("%s: skipped %zu incomplete events", metadata_path.c_str(), metadata.skipped_events);
    }

    std::vector<TimingEntry> timing;
    const auto timing_path = dir_ / "timing.json";
    if (read_file(timing_path, text)) {
        reads_.fetch_add(1, std::memory_order_relaxed);
        if (!parse_timing_file(text, timing, err)) {
            return FetchResult::failure(FetchStatus::MalformedResponse, "timing.json: " + err);
        }
    } else {
        RF_LOG_WARN("%s missing; stream chunks get zero timestamps", timing_path.c_str());
    }

    core::ReplayManifest manifest;
    manifest.replay_id = replay_id.empty() ? dir_.filename().string() : replay_id;
    manifest.meta = std::move(metadata.meta);

    const auto header_path = dir_ / "replay.header";
    const auto header_size = std::filesystem::file_size(header_path, ec);
    if (ec) {
        return FetchResult::failure(FetchStatus::NotFound, "cannot stat " + header_path.string() + ": " + ec.message());
    }
    if (header_size > std::numeric_limits<std::uint32_t>::max()) {
        return FetchResult::failure(FetchStatus::MalformedResponse, "replay.header too large");
    }
    core::ChunkDescriptor hd;
    hd.type = core::ChunkType::Header;
    hd.size = static_cast<std::uint32_t>(header_size);
    hd.remote_id = "replay.header";
    manifest.chunks.push_back(std::move(hd));

    add_inline_events(metadata.checkpoints, core::ChunkType::Checkpoint, manifest, inline_payloads_);
    add_inline_events(metadata.events, core::ChunkType::Event, manifest, inline_payloads_);

    std::filesystem::directory_iterator it(dir_, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        std::uint32_t index = 0;
        std::error_code entry_ec;
        if (!stream_index_of(name, index) || !entry.is_regular_file(entry_ec)) {
            continue;
        }
        const auto size = entry.file_size(entry_ec);
        if (entry_ec || size == 0) {
            continue;
        }
        if (size > std::numeric_limits<std::uint32_t>::max()) {
            return FetchResult::failure(FetchStatus::MalformedResponse, name + " too large");
        }
        core::ChunkDescriptor d;
        d.type = core::ChunkType::Stream;
        d.size = static_cast<std::uint32_t>(size);
        d.remote_id = name;
        d.stream_index = index;
        for (const auto& t : timing) {
            if (t.num_chunks == static_cast<std::uint64_t>(index) + 1) {
                d.start_ms = t.start_ms;
                d.end_ms = t.end_ms;
                break;
            }
        }
        manifest.chunks.push_back(std::move(d));
    }
    if (ec) {
        return FetchResult::failure(FetchStatus::NotFound, "cannot list " + dir_.string() + ": " + ec.message());
    }

    RF_LOG_INFO("%s: manifest with %zu chunks, %u ms",
                dir_.c_str(),
                manifest.chunks.size(),
                manifest.meta.total_time_ms);
    out = std::move(manifest);
    return FetchResult::success();
}

FetchResult DirectoryReplaySource::fetch_chunk(const core::ChunkDescriptor& desc, core::ChunkPayload& out) {
    if (desc.type == core::ChunkType::Checkpoint || desc.type == core::ChunkType::Event) {
        const auto it = inline_payloads_.find(inline_payload_key(desc));
        if (it == inline_payloads_.end()) {
            return FetchResult::failure(FetchStatus::ChunkMissing, "no inline payload for " + desc.remote_id);
        }
        if (it->second.empty() && desc.size > 0) {
            return FetchResult::failure(FetchStatus::ChunkMissing, "inline payload for " + desc.remote_id + " already taken");
        }
        if (it->second.size() != desc.size) {
            return FetchResult::failure(FetchStatus::SizeMismatch, desc.remote_id + ": payload size changed");
        }
        out = std::move(it->second);
        core::ChunkPayload().swap(it->second);
        return FetchResult::success();
    }

    std::string data;
    if (!read_file(dir_ / desc.remote_id, data)) {
        return FetchResult::failure(FetchStatus::ChunkMissing, "cannot read " + (dir_ / desc.remote_id).string());
    }
    reads_.fetch_add(1, std::memory_order_relaxed);
    bytes_read_.fetch_add(data.size(), std::memory_order_relaxed);
    if (data.size() != desc.size) {
        return FetchResult::failure(FetchStatus::SizeMismatch,
                                    desc.remote_id + ": expected " + std::to_string(desc.size) + " bytes, read " +
                                        std::to_string(data.size()));
    }
    const auto* first = reinterpret_cast<const std::byte*>(data.data());
    out.assign(first, first + data.size());
    return FetchResult::success();
}

} // namespace remote
