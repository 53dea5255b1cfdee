#include <iostream>
#include <string>

#include "api/fetch_command.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <replay_id> <output_file> [options]\n"
              << "       " << prog << " --offline <dir> [replay_id] <output_file> [options]\n"
              << "       " << prog << " --list [--offset N] [--base-url URL]\n"
              << "Options:\n"
              << "  --offline <dir>           Assemble from a local dump instead of the service\n"
              << "  --base-url <url>          Replay service (default https://tv.vankrupt.net)\n"
              << "  --concurrency <N>         Parallel chunk downloads (default 8)\n"
              << "  --max-buffered <N>        Chunks fetched ahead of the writer (default 64)\n"
              << "  --max-attempts <N>        Tries per request on transient failure (default 5)\n"
              << "  --timeout-s <N>           Per-request timeout in seconds (default 60)\n"
              << "  --gap-tolerance-ms <N>    Largest tolerated timeline gap (default 120000)\n"
              << "  --max-stream-chunks <N>   Keep only the first N stream chunks\n"
              << "  --max-event-chunks <N>    Keep only the first N event chunks\n"
              << "  --max-checkpoint-chunks <N> Keep only the first N checkpoint chunks\n"
              << "  --skip-missing            Leave out checkpoints and events that stay missing\n"
              << "  --skip-listing            Do not confirm the id in the public listing\n"
              << "  --verify                  Re-read the output and check it against the index\n"
              << "  --verify-against <file>   Byte-compare the output with a known-good replay\n"
              << "  --progress                Print per-chunk progress\n"
              << "  --quiet                   Suppress non-error logs\n"
              << "  --verbose                 Enable verbose logging\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    api::CommandLine cmd;
    std::string err;
    if (!api::parse_command_line(argc, argv, cmd, err)) {
        std::cerr << argv[0] << ": " << err << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (cmd.list) {
        return api::run_list(cmd.fetch.http, cmd.list_offset);
    }
    return api::run_fetch(cmd.fetch);
}
