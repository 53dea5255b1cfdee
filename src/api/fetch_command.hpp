#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "api/assembly_engine.hpp"
#include "remote/http_replay_source.hpp"

namespace api {

struct FetchCommandConfig {
    std::string replay_id{};
    std::filesystem::path output{};

    // Read a local dump instead of the hosting service when set.
    std::filesystem::path offline_dir{};
    remote::HttpSourceConfig http{};
    AssemblyConfig assembly{};

    // Re-read the finished file and check it against the assembly index.
    bool verify{false};
    // Byte-compare the finished file against a known-good replay.
    std::filesystem::path verify_against{};
    bool show_progress{false};

    bool quiet{false};
    bool verbose{false};
};

struct CommandLine {
    FetchCommandConfig fetch{};
    bool list{false};
    std::uint64_t list_offset{0};
};

// Fills `out` from argv. With --offline a single positional argument is the
// output path. Returns false with `err` set on unknown flags or missing arguments.
bool parse_command_line(int argc, const char* const* argv, CommandLine& out, std::string& err);

// Exit codes: 0 ok, 1 bad arguments, 2 fetch or assembly failed,
// 3 the written file failed verification.
int run_fetch(const FetchCommandConfig& cfg);

// Re-reads `path` and checks every record against `result.index` and the
// replay info against `result.meta`.
bool verify_replay_file(const std::filesystem::path& path, const AssemblyResult& result, std::string& err);

// Byte-compares `output` with `reference`. A difference is reported by its
// place in the layout described by `index`, e.g. "Stream stream.3 payload byte 17".
bool compare_with_reference(const std::filesystem::path& output,
                            const std::filesystem::path& reference,
                            const std::vector<persist::ChunkIndexEntry>& index,
                            std::string& err);

// Lists one page of the hosting service's public replays to stdout.
int run_list(const remote::HttpSourceConfig& http, std::uint64_t offset);

} // namespace api
