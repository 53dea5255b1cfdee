#include "remote/service_json.hpp"

#include <charconv>
#include <limits>
#include <optional>

#include "core/replay_time.hpp"
#include "util/json_cursor.hpp"
#include "util/log.hpp"

namespace remote {
namespace {

using util::JsonCursor;

template <typename Fn>
bool parse_object(JsonCursor& cur, std::string& err, Fn&& on_member) {
    if (!cur.expect('{')) {
        err = "Expected object";
        return false;
    }
    if (cur.consume('}')) {
        return true;
    }
    while (true) {
        auto key = cur.parse_string(err);
        if (!key) {
            return false;
        }
        if (!cur.expect(':')) {
            err = "Expected ':' after key " + *key;
            return false;
        }
        if (!on_member(*key)) {
            return false;
        }
        if (cur.consume('}')) {
            return true;
        }
        if (!cur.consume(',')) {
            err = "Expected ',' or '}' in object";
            return false;
        }
    }
}

template <typename Fn>
bool parse_array(JsonCursor& cur, std::string& err, Fn&& on_element) {
    if (!cur.expect('[')) {
        err = "Expected array";
        return false;
    }
    if (cur.consume(']')) {
        return true;
    }
    while (true) {
        if (!on_element()) {
            return false;
        }
        if (cur.consume(']')) {
            return true;
        }
        if (!cur.consume(',')) {
            err = "Expected ',' or ']' in array";
            return false;
        }
    }
}

bool finish_document(JsonCursor& cur, std::string& err) {
    cur.skip_ws();
    if (!cur.eof()) {
        err = "Trailing data after JSON document";
        return false;
    }
    return true;
}

bool read_string(JsonCursor& cur, const std::string& key, std::string& out, std::string& err) {
    auto s = cur.parse_string(err);
    if (!s) {
        err = key + ": " + err;
        return false;
    }
    out = std::move(*s);
    return true;
}

bool read_opt_string(JsonCursor& cur, const std::string& key, std::optional<std::string>& out, std::string& err) {
    if (cur.consume_null()) {
        out.reset();
        return true;
    }
    std::string s;
    if (!read_string(cur, key, s, err)) {
        return false;
    }
    out = std::move(s);
    return true;
}

bool read_bool(JsonCursor& cur, const std::string& key, bool& out, std::string& err) {
    auto b = cur.parse_bool(err);
    if (!b) {
        err = key + ": " + err;
        return false;
    }
    out = *b;
    return true;
}

bool read_i64(JsonCursor& cur, const std::string& key, std::int64_t& out, std::string& err) {
    auto v = cur.parse_int64(err);
    if (!v) {
        err = key + ": " + err;
        return false;
    }
    out = *v;
    return true;
}

// Integer in [0, 2^32) given either as a JSON number or a numeric string.
bool read_u32(JsonCursor& cur, const std::string& key, std::uint32_t& out, std::string& err) {
    if (cur.peek() == '"') {
        std::string text;
        if (!read_string(cur, key, text, err)) {
            return false;
        }
        if (!parse_u32_text(text, out)) {
            err = key + ": not an unsigned 32-bit integer: " + text;
            return false;
        }
        return true;
    }
    std::int64_t v = 0;
    if (!read_i64(cur, key, v, err)) {
        return false;
    }
    if (v < 0 || v > std::numeric_limits<std::uint32_t>::max()) {
        err = key + ": value out of range: " + std::to_string(v);
        return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool read_opt_u32(JsonCursor& cur, const std::string& key, std::uint32_t& out, std::string& err) {
    if (cur.consume_null()) {
        out = 0;
        return true;
    }
    return read_u32(cur, key, out, err);
}

bool parse_listing(JsonCursor& cur, ReplayListing& r, std::string& err) {
    return parse_object(cur, err, [&](const std::string& key) {
        if (key == "_id") return read_string(cur, key, r.id, err);
        if (key == "gameMode") return read_string(cur, key, r.game_mode, err);
        if (key == "friendlyName") return read_string(cur, key, r.map_name, err);
        if (key == "shack") return read_bool(cur, key, r.shack, err);
        if (key == "created") return read_string(cur, key, r.created, err);
        if (key == "expires") return read_string(cur, key, r.expires, err);
        if (key == "secondsSince") return read_i64(cur, key, r.seconds_since, err);
        if (key == "workshop_mods") return read_string(cur, key, r.workshop_mods, err);
        if (key == "competitive") return read_bool(cur, key, r.competitive, err);
        if (key == "live") return read_bool(cur, key, r.live, err);
        if (key == "modcount") return read_i64(cur, key, r.mod_count, err);
        if (key == "users") {
            if (cur.consume_null()) {
                return true;
            }
            return parse_array(cur, err, [&] {
                std::string u;
                if (!read_string(cur, key, u, err)) {
                    return false;
                }
                r.users.push_back(std::move(u));
                return true;
            });
        }
        return cur.skip_value(err);
    });
}

bool parse_event(JsonCursor& cur, std::vector<ServiceEvent>& out, std::size_t& skipped, std::string& err) {
    if (cur.consume_null()) {
        ++skipped;
        return true;
    }
    std::optional<std::string> id;
    std::optional<std::string> group;
    std::optional<std::string> meta;
    ServiceEvent ev;
    std::optional<std::string> data_type;
    const bool ok = parse_object(cur, err, [&](const std::string& key) {
        if (key == "id") return read_opt_string(cur, key, id, err);
        if (key == "group") return read_opt_string(cur, key, group, err);
        if (key == "meta") return read_opt_string(cur, key, meta, err);
        if (key == "time1") return read_opt_u32(cur, key, ev.time1, err);
        if (key == "time2") return read_opt_u32(cur, key, ev.time2, err);
        if (key == "data") {
            if (cur.consume_null()) {
                return true;
            }
            return parse_object(cur, err, [&](const std::string& inner) {
                if (inner == "type") return read_opt_string(cur, inner, data_type, err);
                if (inner == "data") {
                    if (cur.consume_null()) {
                        return true;
                    }
                    return cur.parse_byte_array(ev.data, err);
                }
                return cur.skip_value(err);
            });
        }
        return cur.skip_value(err);
    });
    if (!ok) {
        return false;
    }
    if (!id || !group) {
        RF_LOG_WARN("skipping event %s: missing %s", id ? id->c_str() : "<no id>", !id ? "id" : "group");
        ++skipped;
        return true;
    }
    // Only a Buffer carries payload bytes; anything else frames an empty record.
    if (!data_type || *data_type != "Buffer") {
        ev.data.clear();
    }
    ev.id = std::move(*id);
    ev.group = std::move(*group);
    ev.meta = meta ? std::move(*meta) : std::string{};
    out.push_back(std::move(ev));
    return true;
}

bool parse_events_object(JsonCursor& cur, std::vector<ServiceEvent>& out, std::size_t& skipped, std::string& err) {
    bool seen = false;
    const bool ok = parse_object(cur, err, [&](const std::string& key) {
        if (key == "events") {
            seen = true;
            return parse_array(cur, err, [&] { return parse_event(cur, out, skipped, err); });
        }
        return cur.skip_value(err);
    });
    if (ok && !seen) {
        err = "missing events array";
        return false;
    }
    return ok;
}

enum MetaField : unsigned {
    kGameMode = 1u << 0,
    kFriendlyName = 1u << 1,
    kCompetitive = 1u << 2,
    kWorkshopMods = 1u << 3,
    kLive = 1u << 4,
    kTotalTime = 1u << 5,
    kVersion = 1u << 6,
    kCreated = 1u << 7,
    kAllMetaFields = (1u << 8) - 1,
};

const char* first_missing(unsigned seen) noexcept {
    if (!(seen & kGameMode)) return "gameMode";
    if (!(seen & kFriendlyName)) return "friendlyName";
    if (!(seen & kCompetitive)) return "competitive";
    if (!(seen & kWorkshopMods)) return "workshop_mods";
    if (!(seen & kLive)) return "live";
    if (!(seen & kTotalTime)) return "totalTime";
    if (!(seen & kVersion)) return "__v";
    return "created";
}

bool parse_meta_object(JsonCursor& cur, core::ReplayMeta& m, std::string& err) {
    unsigned seen = 0;
    const bool ok = parse_object(cur, err, [&](const std::string& key) {
        if (key == "gameMode") {
            seen |= kGameMode;
            return read_string(cur, key, m.game_mode, err);
        }
        if (key == "friendlyName") {
            seen |= kFriendlyName;
            return read_string(cur, key, m.friendly_name, err);
        }
        if (key == "competitive") {
            seen |= kCompetitive;
            return read_bool(cur, key, m.competitive, err);
        }
        if (key == "workshop_mods") {
            seen |= kWorkshopMods;
            return read_string(cur, key, m.workshop_mods, err);
        }
        if (key == "live") {
            seen |= kLive;
            return read_bool(cur, key, m.live, err);
        }
        if (key == "totalTime") {
            seen |= kTotalTime;
            return read_u32(cur, key, m.total_time_ms, err);
        }
        if (key == "__v") {
            seen |= kVersion;
            return read_u32(cur, key, m.network_version, err);
        }
        if (key == "created") {
            seen |= kCreated;
            return read_string(cur, key, m.created, err);
        }
        return cur.skip_value(err);
    });
    if (!ok) {
        return false;
    }
    if (seen != kAllMetaFields) {
        err = std::string("meta is missing field ") + first_missing(seen);
        return false;
    }
    std::int64_t unix_ms = 0;
    std::string ts_err;
    if (!core::parse_created_timestamp(m.created, unix_ms, ts_err)) {
        err = "created '" + m.created + "': " + ts_err;
        return false;
    }
    m.timestamp_ticks = core::unix_ms_to_ticks(unix_ms);
    return true;
}

} // namespace

bool parse_u32_text(std::string_view text, std::uint32_t& out) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return false;
    }
    std::uint32_t v = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), v);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
        return false;
    }
    out = v;
    return true;
}

bool parse_find_page(std::string_view json, ReplayPage& out, std::string& err) {
    JsonCursor cur(json);
    ReplayPage page;
    const bool ok = parse_object(cur, err, [&](const std::string& key) {
        if (key == "replays") {
            return parse_array(cur, err, [&] {
                ReplayListing r;
                if (!parse_listing(cur, r, err)) {
                    return false;
                }
                page.replays.push_back(std::move(r));
                return true;
            });
        }
        if (key == "total") {
            std::int64_t total = 0;
            if (!read_i64(cur, key, total, err)) {
                return false;
            }
            page.total = total < 0 ? 0 : static_cast<std::uint64_t>(total);
            return true;
        }
        return cur.skip_value(err);
    });
    if (!ok || !finish_document(cur, err)) {
        return false;
    }
    out = std::move(page);
    return true;
}

bool parse_download_state(std::string_view json, DownloadState& out, std::string& err) {
    JsonCursor cur(json);
    DownloadState st;
    bool have_state = false;
    const bool ok = parse_object(cur, err, [&](const std::string& key) {
        if (key == "state") {
            have_state = true;
            return read_string(cur, key, st.state, err);
        }
        if (key == "numChunks") {
            if (cur.consume_null()) {
                return true;
            }
            std::int64_t n = 0;
            if (!read_i64(cur, key, n, err)) {
                return false;
            }
            if (n < 0) {
                err = "numChunks is negative";
                return false;
            }
            st.num_chunks = static_cast<std::uint64_t>(n);
            return true;
        }
        return cur.skip_value(err);
    });
    if (!ok || !finish_document(cur, err)) {
        return false;
    }
    if (!have_state) {
        err = "missing state";
        return false;
    }
    out = std::move(st);
    return true;
}

bool parse_replay_meta(std::string_view json, core::ReplayMeta& out, std::string& err) {
    JsonCursor cur(json);
    core::ReplayMeta m;
    if (!parse_meta_object(cur, m, err) || !finish_document(cur, err)) {
        return false;
    }
    out = std::move(m);
    return true;
}

bool parse_event_list(std::string_view json, std::vector<ServiceEvent>& out, std::size_t& skipped, std::string& err) {
    JsonCursor cur(json);
    std::vector<ServiceEvent> events;
    std::size_t dropped = 0;
    if (!parse_events_object(cur, events, dropped, err) || !finish_document(cur, err)) {
        return false;
    }
    out = std::move(events);
    skipped = dropped;
    return true;
}

bool parse_metadata_file(std::string_view json, MetadataFile& out, std::string& err) {
    JsonCursor cur(json);
    MetadataFile file;
    bool have_meta = false;
    const bool ok = parse_object(cur, err, [&](const std::string& key) {
        if (key == "meta") {
            if (cur.consume_null()) {
                return true;
            }
            have_meta = true;
            return parse_meta_object(cur, file.meta, err);
        }
        if (key == "events" || key == "events_pavlov") {
            if (cur.consume_null()) {
                return true;
            }
            auto& dst = key == "events" ? file.checkpoints : file.events;
            return parse_events_object(cur, dst, file.skipped_events, err);
        }
        return cur.skip_value(err);
    });
    if (!ok || !finish_document(cur, err)) {
        return false;
    }
    if (!have_meta) {
        err = "missing 'meta' field";
        return false;
    }
    out = std::move(file);
    return true;
}

bool parse_timing_file(std::string_view json, std::vector<TimingEntry>& out, std::string& err) {
    JsonCursor cur(json);
    std::vector<TimingEntry> entries;
    const bool ok = parse_array(cur, err, [&] {
        TimingEntry e;
        std::uint32_t n = 0;
        bool have_n = false;
        const bool entry_ok = parse_object(cur, err, [&](const std::string& key) {
            if (key == "numchunks") {
                have_n = true;
                return read_u32(cur, key, n, err);
            }
            if (key == "mtime1") return read_u32(cur, key, e.start_ms, err);
            if (key == "mtime2") return read_u32(cur, key, e.end_ms, err);
            return cur.skip_value(err);
        });
        if (!entry_ok) {
            return false;
        }
        if (!have_n) {
            err = "timing entry without numchunks";
            return false;
        }
        e.num_chunks = n;
        entries.push_back(e);
        return true;
    });
    if (!ok || !finish_document(cur, err)) {
        return false;
    }
    out = std::move(entries);
    return true;
}

} // namespace remote
