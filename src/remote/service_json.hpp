#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/chunk.hpp"

namespace remote {

// One entry of the public /find listing.
struct ReplayListing {
    std::string id;
    std::string game_mode;
    std::string map_name;
    bool shack{false};
    std::string created;
    std::string expires;
    std::int64_t seconds_since{0};
    std::string workshop_mods;
    bool competitive{false};
    bool live{false};
    std::vector<std::string> users;
    std::int64_t mod_count{0};
};

struct ReplayPage {
    std::vector<ReplayListing> replays;
    std::uint64_t total{0};
};

struct DownloadState {
    std::string state;
    std::uint64_t num_chunks{0};
};

// A checkpoint or game event with its payload inlined as a byte array.
struct ServiceEvent {
    std::string id;
    std::string group;
    std::string meta;
    std::uint32_t time1{0};
    std::uint32_t time2{0};
    std::vector<std::byte> data;
};

// Entry of a local dump's timing.json: stream.N takes the entry with numchunks == N + 1.
struct TimingEntry {
    std::uint64_t num_chunks{0};
    std::uint32_t start_ms{0};
    std::uint32_t end_ms{0};
};

// Contents of a local dump's metadata.json.
struct MetadataFile {
    core::ReplayMeta meta;
    std::vector<ServiceEvent> checkpoints;
    std::vector<ServiceEvent> events;
    std::size_t skipped_events{0};
};

// All parsers ignore unknown members and return false with `err` set on
// malformed input.
bool parse_find_page(std::string_view json, ReplayPage& out, std::string& err);
bool parse_download_state(std::string_view json, DownloadState& out, std::string& err);

// Also derives meta.timestamp_ticks from `created`.
bool parse_replay_meta(std::string_view json, core::ReplayMeta& out, std::string& err);

// `{"events":[...]}`. Events lacking id or group are dropped and counted in
// `skipped`. The payload is data.data when data.type is "Buffer", else empty.
bool parse_event_list(std::string_view json, std::vector<ServiceEvent>& out, std::size_t& skipped, std::string& err);

bool parse_metadata_file(std::string_view json, MetadataFile& out, std::string& err);
bool parse_timing_file(std::string_view json, std::vector<TimingEntry>& out, std::string& err);

// Decimal integer in [0, 2^32), optionally surrounded by whitespace.
bool parse_u32_text(std::string_view text, std::uint32_t& out) noexcept;

} // namespace remote
