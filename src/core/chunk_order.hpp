#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include "core/chunk.hpp"

namespace core {

// Manifest validation and trimming knobs. All times in milliseconds.
struct ValidationOptions {
    // Largest tolerated hole in the Checkpoint or Stream timeline, measured from
    // 0 to the first chunk of the type and between consecutive chunks.
    std::uint32_t gap_tolerance_ms{120'000};

    // Keep only the first N chunks of a type in canonical order (debugging aid).
    std::uint32_t max_stream_chunks{std::numeric_limits<std::uint32_t>::max()};
    std::uint32_t max_event_chunks{std::numeric_limits<std::uint32_t>::max()};
    std::uint32_t max_checkpoint_chunks{std::numeric_limits<std::uint32_t>::max()};
};

static_assert(std::is_trivially_copyable_v<ValidationOptions>, "ValidationOptions must be trivially copyable");

[[nodiscard]] inline constexpr ValidationOptions default_validation_options() noexcept {
    return ValidationOptions{};
}

struct AssemblyPlan {
    std::vector<ChunkDescriptor> chunks; // final serialization order
    std::size_t duplicates_dropped{0};
    std::size_t capped{0};
};

// Canonical order: Header, Checkpoint*, Event*, Stream*; ascending start time
// within a type, then remote id (Checkpoint/Event) or stream index (Stream).
bool canonical_less(const ChunkDescriptor& a, const ChunkDescriptor& b) noexcept;

// Same type, start time and remote id.
bool same_chunk(const ChunkDescriptor& a, const ChunkDescriptor& b) noexcept;

void sort_canonical(std::vector<ChunkDescriptor>& chunks);

// Drops later occurrences of a chunk, keeping the first one in input order.
// Returns the number of descriptors removed.
std::size_t drop_duplicates(std::vector<ChunkDescriptor>& chunks);

// Structural checks on an already deduplicated, canonically sorted list.
bool validate_chunks(const std::vector<ChunkDescriptor>& sorted,
                     std::uint32_t total_time_ms,
                     const ValidationOptions& opts,
                     std::string& err);

// Deduplicate, order, validate and cap. Returns false with a diagnostic when
// the manifest cannot produce a loadable replay.
bool build_assembly_plan(const ReplayManifest& manifest,
                         const ValidationOptions& opts,
                         AssemblyPlan& out,
                         std::string& err);

} // namespace core
