#include "core/chunk_order.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <tuple>

namespace core {
namespace {

using DedupKey = std::tuple<std::uint32_t, std::uint32_t, std::string>;

DedupKey dedup_key(const ChunkDescriptor& c) {
    return {static_cast<std::uint32_t>(c.type), c.start_ms, c.remote_id};
}

std::uint32_t cap_for(ChunkType t, const ValidationOptions& opts) noexcept {
    switch (t) {
    case ChunkType::Header: return std::numeric_limits<std::uint32_t>::max();
    case ChunkType::Stream: return opts.max_stream_chunks;
    case ChunkType::Checkpoint: return opts.max_checkpoint_chunks;
    case ChunkType::Event: return opts.max_event_chunks;
    }
    return std::numeric_limits<std::uint32_t>::max();
}

bool check_timeline(const std::vector<ChunkDescriptor>& sorted,
                    ChunkType type,
                    const ValidationOptions& opts,
                    std::string& err) {
    std::uint32_t prev_end = 0;
    bool first = true;
    for (const auto& c : sorted) {
        if (c.type != type) {
            continue;
        }
        std::ostringstream oss;
        if (c.start_ms > c.end_ms) {
            oss << chunk_type_name(type) << " chunk " << c.remote_id << " starts after it ends ("
                << c.start_ms << " > " << c.end_ms << ")";
            err = oss.str();
            return false;
        }
        if (!first && c.start_ms < prev_end) {
            oss << chunk_type_name(type) << " chunk " << c.remote_id << " at " << c.start_ms
                << " overlaps previous chunk ending at " << prev_end;
            err = oss.str();
            return false;
        }
        const std::uint32_t gap = c.start_ms - prev_end;
        if (gap > opts.gap_tolerance_ms) {
            oss << chunk_type_name(type) << " timeline gap of " << gap << "ms before chunk " << c.remote_id
                << " exceeds tolerance " << opts.gap_tolerance_ms << "ms";
            err = oss.str();
            return false;
        }
        prev_end = std::max(prev_end, c.end_ms);
        first = false;
    }
    return true;
}

} // namespace

bool canonical_less(const ChunkDescriptor& a, const ChunkDescriptor& b) noexcept {
    const int ra = chunk_type_rank(a.type);
    const int rb = chunk_type_rank(b.type);
    if (ra != rb) {
        return ra < rb;
    }
    if (a.start_ms != b.start_ms) {
        return a.start_ms < b.start_ms;
    }
    if (a.type == ChunkType::Stream && a.stream_index != b.stream_index) {
        return a.stream_index < b.stream_index;
    }
    return a.remote_id < b.remote_id;
}

bool same_chunk(const ChunkDescriptor& a, const ChunkDescriptor& b) noexcept {
    return a.type == b.type && a.start_ms == b.start_ms && a.remote_id == b.remote_id;
}

void sort_canonical(std::vector<ChunkDescriptor>& chunks) {
    std::stable_sort(chunks.begin(), chunks.end(), canonical_less);
}

std::size_t drop_duplicates(std::vector<ChunkDescriptor>& chunks) {
    std::set<DedupKey> seen;
    const std::size_t before = chunks.size();
    auto it = std::remove_if(chunks.begin(), chunks.end(), [&](const ChunkDescriptor& c) {
        return !seen.insert(dedup_key(c)).second;
    });
    chunks.erase(it, chunks.end());
    return before - chunks.size();
}

bool validate_chunks(const std::vector<ChunkDescriptor>& sorted,
                     std::uint32_t total_time_ms,
                     const ValidationOptions& opts,
                     std::string& err) {
    if (total_time_ms == 0) {
        err = "replay has zero total duration";
        return false;
    }
    if (sorted.empty()) {
        err = "manifest lists no chunks";
        return false;
    }
    const auto headers = std::count_if(sorted.begin(), sorted.end(), [](const ChunkDescriptor& c) {
        return c.type == ChunkType::Header;
    });
    if (headers != 1) {
        err = "manifest must contain exactly one header chunk, found " + std::to_string(headers);
        return false;
    }
    for (const auto& c : sorted) {
        if (c.size > static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max())) {
            err = "chunk " + c.remote_id + " exceeds the container's 2GiB record limit";
            return false;
        }
    }
    return check_timeline(sorted, ChunkType::Checkpoint, opts, err) &&
           check_timeline(sorted, ChunkType::Stream, opts, err);
}

bool build_assembly_plan(const ReplayManifest& manifest,
                         const ValidationOptions& opts,
                         AssemblyPlan& out,
                         std::string& err) {
    AssemblyPlan plan;
    plan.chunks = manifest.chunks;
    plan.duplicates_dropped = drop_duplicates(plan.chunks);
    sort_canonical(plan.chunks);
    if (!validate_chunks(plan.chunks, manifest.meta.total_time_ms, opts, err)) {
        return false;
    }

    std::uint32_t kept[4] = {0, 0, 0, 0};
    auto it = std::remove_if(plan.chunks.begin(), plan.chunks.end(), [&](const ChunkDescriptor& c) {
        auto& n = kept[static_cast<std::uint32_t>(c.type)];
        if (n >= cap_for(c.type, opts)) {
            return true;
        }
        ++n;
        return false;
    });
    plan.capped = static_cast<std::size_t>(std::distance(it, plan.chunks.end()));
    plan.chunks.erase(it, plan.chunks.end());

    out = std::move(plan);
    return true;
}

} // namespace core
