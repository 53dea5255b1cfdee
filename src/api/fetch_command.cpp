#include "api/fetch_command.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <vector>

#include "persist/replay_reader.hpp"
#include "persist/replay_sink.hpp"
#include "remote/directory_replay_source.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace api {

namespace {

constexpr std::size_t kCompareBlock = 64 * 1024;

std::string describe_offset(std::uint64_t offset, const std::vector<persist::ChunkIndexEntry>& index) {
    if (offset < persist::replay_info_size) {
        return "replay info byte " + std::to_string(offset);
    }
    const std::uint64_t rel = offset - persist::replay_info_size;
    const auto it = std::upper_bound(index.begin(), index.end(), rel, [](std::uint64_t v, const auto& e) {
        return v < e.frame_offset;
    });
    if (it == index.begin()) {
        return "byte " + std::to_string(offset);
    }
    const persist::ChunkIndexEntry& e = *std::prev(it);
    if (rel >= e.payload_offset + e.payload_size) {
        return "byte " + std::to_string(offset) + " past the last record";
    }
    const std::string where = std::string(core::chunk_type_name(e.type)) + " " + e.remote_id;
    if (rel < e.payload_offset) {
        return where + " frame byte " + std::to_string(rel - e.frame_offset);
    }
    return where + " payload byte " + std::to_string(rel - e.payload_offset);
}

bool parse_u32(const std::string& flag, const char* text, std::uint32_t& value, std::string& err) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || text[0] == '-' || v > std::numeric_limits<std::uint32_t>::max()) {
        err = flag + " expects a non-negative integer, got '" + text + "'";
        return false;
    }
    value = static_cast<std::uint32_t>(v);
    return true;
}

void print_progress(const AssemblyProgress& p) {
    std::fprintf(stderr,
                 "\rheader %zu/%zu  checkpoint %zu/%zu  event %zu/%zu  stream %zu/%zu  %llu/%llu bytes",
                 p.header.current,
                 p.header.max,
                 p.checkpoint.current,
                 p.checkpoint.max,
                 p.event.current,
                 p.event.max,
                 p.stream.current,
                 p.stream.max,
                 static_cast<unsigned long long>(p.bytes_written),
                 static_cast<unsigned long long>(p.total_bytes));
    if (p.stage == ProgressStage::Finalized) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace

bool parse_command_line(int argc, const char* const* argv, CommandLine& out, std::string& err) {
    FetchCommandConfig& cfg = out.fetch;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        std::uint32_t n = 0;
        if (arg == "--list") {
            out.list = true;
        } else if (arg == "--offset" && has_value) {
            if (!parse_u32(arg, argv[++i], n, err)) {
                return false;
            }
            out.list_offset = n;
        } else if (arg == "--offline" && has_value) {
            cfg.offline_dir = argv[++i];
        } else if (arg == "--base-url" && has_value) {
            cfg.http.base_url = argv[++i];
        } else if (arg == "--concurrency" && has_value) {
            if (!parse_u32(arg, argv[++i], cfg.assembly.concurrency, err)) {
                return false;
            }
            cfg.http.head_concurrency = cfg.assembly.concurrency;
        } else if (arg == "--max-buffered" && has_value) {
            if (!parse_u32(arg, argv[++i], cfg.assembly.max_buffered_chunks, err)) {
                return false;
            }
        } else if (arg == "--max-attempts" && has_value) {
            if (!parse_u32(arg, argv[++i], cfg.assembly.retry.max_attempts, err)) {
                return false;
            }
            cfg.http.head_retry.max_attempts = cfg.assembly.retry.max_attempts;
        } else if (arg == "--timeout-s" && has_value) {
            if (!parse_u32(arg, argv[++i], n, err)) {
                return false;
            }
            cfg.http.transport.request_timeout = std::chrono::seconds{n};
        } else if (arg == "--gap-tolerance-ms" && has_value) {
            if (!parse_u32(arg, argv[++i], cfg.assembly.validation.gap_tolerance_ms, err)) {
                return false;
            }
        } else if (arg == "--max-stream-chunks" && has_value) {
            if (!parse_u32(arg, argv[++i], cfg.assembly.validation.max_stream_chunks, err)) {
                return false;
            }
        } else if (arg == "--max-event-chunks" && has_value) {
            if (!parse_u32(arg, argv[++i], cfg.assembly.validation.max_event_chunks, err)) {
                return false;
            }
        } else if (arg == "--max-checkpoint-chunks" && has_value) {
            if (!parse_u32(arg, argv[++i], cfg.assembly.validation.max_checkpoint_chunks, err)) {
                return false;
            }
        } else if (arg == "--skip-missing") {
            cfg.assembly.missing_chunks = MissingChunkPolicy::Degrade;
        } else if (arg == "--skip-listing") {
            cfg.http.locate_in_listing = false;
        } else if (arg == "--verify") {
            cfg.verify = true;
        } else if (arg == "--verify-against" && has_value) {
            cfg.verify_against = argv[++i];
        } else if (arg == "--progress") {
            cfg.show_progress = true;
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (!arg.empty() && arg[0] != '-' && positional < 2) {
            if (positional++ == 0) {
                cfg.replay_id = arg;
            } else {
                cfg.output = arg;
            }
        } else {
            err = "unexpected argument '" + arg + "'";
            return false;
        }
    }

    if (out.list) {
        return true;
    }
    // With --offline the id only labels the output, so it may be omitted.
    if (!cfg.offline_dir.empty() && positional == 1) {
        cfg.output = cfg.replay_id;
        cfg.replay_id.clear();
    } else if (positional < 2) {
        err = positional == 0 ? "missing replay id and output path" : "missing output path";
        return false;
    }
    return true;
}

bool verify_replay_file(const std::filesystem::path& path, const AssemblyResult& result, std::string& err) {
    std::vector<std::byte> bytes;
    persist::ParsedReplay parsed;
    std::string read_err;
    const auto st = persist::read_replay_file(path, bytes, parsed, read_err);
    if (st != persist::ReplayReadStatus::Ok) {
        err = std::string(persist::replay_read_status_name(st)) + ": " + read_err;
        return false;
    }
    if (parsed.chunks.size() != result.index.size()) {
        err = std::to_string(parsed.chunks.size()) + " chunk records, expected " + std::to_string(result.index.size());
        return false;
    }
    for (std::size_t i = 0; i < parsed.chunks.size(); ++i) {
        const auto& rec = parsed.chunks[i];
        const auto& idx = result.index[i];
        if (rec.type != idx.type || rec.frame_offset != idx.frame_offset || rec.payload_offset != idx.payload_offset ||
            rec.payload_size != idx.payload_size) {
            err = "record " + std::to_string(i) + " (" + core::chunk_type_name(idx.type) + " " + idx.remote_id +
                  ") does not match the index";
            return false;
        }
        if ((rec.type == core::ChunkType::Checkpoint || rec.type == core::ChunkType::Event) && rec.id != idx.remote_id) {
            err = "record " + std::to_string(i) + " has id '" + rec.id + "', expected '" + idx.remote_id + "'";
            return false;
        }
    }
    if (parsed.info.length_ms != result.meta.total_time_ms || parsed.info.timestamp_ticks != result.meta.timestamp_ticks) {
        err = "replay info does not match metadata";
        return false;
    }
    util::log(util::LogLevel::Info,
              "verified %s: \"%s\", %u ms, %zu chunks",
              path.c_str(),
              parsed.info.friendly_name.c_str(),
              parsed.info.length_ms,
              parsed.chunks.size());
    return true;
}

bool compare_with_reference(const std::filesystem::path& output,
                            const std::filesystem::path& reference,
                            const std::vector<persist::ChunkIndexEntry>& index,
                            std::string& err) {
    std::ifstream out(output, std::ios::binary);
    if (!out.is_open()) {
        err = "cannot open " + output.string();
        return false;
    }
    std::ifstream ref(reference, std::ios::binary);
    if (!ref.is_open()) {
        err = "cannot open " + reference.string();
        return false;
    }

    std::vector<char> a(kCompareBlock);
    std::vector<char> b(kCompareBlock);
    std::uint64_t offset = 0;
    while (true) {
        out.read(a.data(), static_cast<std::streamsize>(a.size()));
        ref.read(b.data(), static_cast<std::streamsize>(b.size()));
        const auto got_a = static_cast<std::size_t>(out.gcount());
        const auto got_b = static_cast<std::size_t>(ref.gcount());
        const std::size_t n = std::min(got_a, got_b);
        const auto end_a = a.begin() + static_cast<std::ptrdiff_t>(n);
        const auto diff = std::mismatch(a.begin(), end_a, b.begin());
        if (diff.first != end_a) {
            const std::uint64_t at = offset + static_cast<std::uint64_t>(diff.first - a.begin());
            err = "differs at byte " + std::to_string(at) + " (" + describe_offset(at, index) + ")";
            return false;
        }
        offset += n;
        if (got_a != got_b) {
            err = std::string(got_a < got_b ? "output" : "reference") + " ends at byte " + std::to_string(offset) +
                  " (" + describe_offset(offset, index) + ")";
            return false;
        }
        if (got_a < a.size()) {
            return true;
        }
    }
}

int run_fetch(const FetchCommandConfig& cfg) {
    if (cfg.verbose) {
        util::set_min_log_level(util::LogLevel::Debug);
    } else if (cfg.quiet) {
        util::set_min_log_level(util::LogLevel::Error);
    }

    if (cfg.replay_id.empty() && cfg.offline_dir.empty()) {
        util::log(util::LogLevel::Error, "No replay id provided");
        return 1;
    }
    if (cfg.output.empty()) {
        util::log(util::LogLevel::Error, "No output path provided");
        return 1;
    }
    if (cfg.offline_dir.empty() && !remote::is_valid_replay_id(cfg.replay_id)) {
        util::log(util::LogLevel::Error, "Invalid replay id '%s'; expected ASCII letters and digits", cfg.replay_id.c_str());
        return 1;
    }
    if (const auto parent = cfg.output.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            util::log(util::LogLevel::Error, "Cannot create %s: %s", parent.c_str(), ec.message().c_str());
            return 1;
        }
    }

    std::unique_ptr<remote::IReplaySource> source;
    if (!cfg.offline_dir.empty()) {
        source = std::make_unique<remote::DirectoryReplaySource>(cfg.offline_dir);
    } else {
        source = std::make_unique<remote::HttpReplaySource>(cfg.http);
    }
    persist::FileReplaySink sink(cfg.output);

    AssemblyEngine engine(cfg.assembly, *source, sink);
    if (cfg.show_progress && !cfg.quiet) {
        engine.set_progress_callback(print_progress);
    }
    util::SteadyClock clock;
    const auto started = clock.now();
    const AssemblyResult result = engine.run(cfg.replay_id);
    const std::uint64_t took_ms = util::elapsed_ms(clock, started);
    const AssemblyStats stats = engine.snapshot_stats();
    const remote::SourceStats src_stats = source->stats();
    util::log(util::LogLevel::Debug,
              "requests=%llu downloaded=%llu fetched=%llu retries=%llu refetches=%llu",
              static_cast<unsigned long long>(src_stats.requests),
              static_cast<unsigned long long>(stats.bytes_downloaded),
              static_cast<unsigned long long>(stats.chunks_fetched),
              static_cast<unsigned long long>(stats.retries),
              static_cast<unsigned long long>(stats.refetches));

    if (!result.ok()) {
        if (result.status == AssemblyStatus::AssemblyFailed) {
            util::log(util::LogLevel::Error,
                      "chunk %s failed: %s",
                      result.error.chunk_id.c_str(),
                      remote::fetch_status_name(result.error.cause));
        }
        if (result.cleanup_needed) {
            util::log(util::LogLevel::Error, "incomplete file left at %s", sink.partial_path().c_str());
        }
        return 2;
    }

    if (!result.dropped_chunks.empty()) {
        util::log(util::LogLevel::Warn,
                  "%zu missing chunks left out of %s",
                  result.dropped_chunks.size(),
                  cfg.output.c_str());
    }
    std::string err;
    if (cfg.verify && !verify_replay_file(cfg.output, result, err)) {
        util::log(util::LogLevel::Error, "verify %s: %s", cfg.output.c_str(), err.c_str());
        return 3;
    }
    if (!cfg.verify_against.empty()) {
        if (!compare_with_reference(cfg.output, cfg.verify_against, result.index, err)) {
            util::log(util::LogLevel::Error, "verify-against %s: %s", cfg.verify_against.c_str(), err.c_str());
            return 3;
        }
        util::log(util::LogLevel::Info, "output matches %s", cfg.verify_against.c_str());
    }

    std::printf("%s %llu bytes %zu chunks crc32c=%08x in %llums\n",
                cfg.output.c_str(),
                static_cast<unsigned long long>(result.bytes_written),
                result.chunk_count,
                result.payload_crc32c,
                static_cast<unsigned long long>(took_ms));
    return 0;
}

int run_list(const remote::HttpSourceConfig& http, std::uint64_t offset) {
    remote::HttpReplaySource source(http);
    remote::ReplayPage page;
    const remote::FetchResult r = source.list_replays(offset, page);
    if (!r.ok()) {
        util::log(util::LogLevel::Error, "list failed: %s: %s", remote::fetch_status_name(r.status), r.detail.c_str());
        return 2;
    }
    for (const auto& l : page.replays) {
        std::printf("%s  %-8s %-24s %-9s users=%zu mods=%lld %s%s\n",
                    l.id.c_str(),
                    l.game_mode.c_str(),
                    l.map_name.c_str(),
                    l.competitive ? "comp" : "casual",
                    l.users.size(),
                    static_cast<long long>(l.mod_count),
                    l.created.c_str(),
                    l.live ? " live" : "");
    }
    std::printf("%zu of %llu replays from offset %llu\n",
                page.replays.size(),
                static_cast<unsigned long long>(page.total),
                static_cast<unsigned long long>(offset));
    return 0;
}

} // namespace api
