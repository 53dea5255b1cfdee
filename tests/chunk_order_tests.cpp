#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "core/chunk_order.hpp"

namespace {

core::ChunkDescriptor make_chunk(core::ChunkType type,
                                 std::uint32_t start,
                                 std::uint32_t end,
                                 std::string id,
                                 std::uint32_t size = 8,
                                 std::uint32_t stream_index = 0) {
    core::ChunkDescriptor c;
    c.type = type;
    c.start_ms = start;
    c.end_ms = end;
    c.remote_id = std::move(id);
    c.size = size;
    c.stream_index = stream_index;
    return c;
}

core::ReplayManifest sample_manifest() {
    core::ReplayManifest m;
    m.replay_id = "abc123";
    m.meta.total_time_ms = 2000;
    m.chunks = {
        make_chunk(core::ChunkType::Stream, 0, 2000, "stream.0", 64, 0),
        make_chunk(core::ChunkType::Event, 500, 500, "kill-1", 4),
        make_chunk(core::ChunkType::Checkpoint, 1000, 2000, "cp-2", 16),
        make_chunk(core::ChunkType::Header, 0, 0, "replay.header", 32),
        make_chunk(core::ChunkType::Checkpoint, 0, 1000, "cp-1", 16),
    };
    return m;
}

std::vector<std::string> ids(const std::vector<core::ChunkDescriptor>& chunks) {
    std::vector<std::string> out;
    for (const auto& c : chunks) {
        out.push_back(c.remote_id);
    }
    return out;
}

} // namespace

TEST(ChunkOrder, CanonicalTypeSequence) {
    auto m = sample_manifest();
    core::sort_canonical(m.chunks);
    EXPECT_EQ(ids(m.chunks), (std::vector<std::string>{"replay.header", "cp-1", "cp-2", "kill-1", "stream.0"}));
}

TEST(ChunkOrder, EventTiesBrokenByRemoteId) {
    std::vector<core::ChunkDescriptor> chunks = {
        make_chunk(core::ChunkType::Event, 100, 100, "b"),
        make_chunk(core::ChunkType::Event, 100, 100, "a"),
        make_chunk(core::ChunkType::Event, 50, 50, "z"),
    };
    core::sort_canonical(chunks);
    EXPECT_EQ(ids(chunks), (std::vector<std::string>{"z", "a", "b"}));
}

TEST(ChunkOrder, StreamTiesBrokenByIndex) {
    std::vector<core::ChunkDescriptor> chunks = {
        make_chunk(core::ChunkType::Stream, 0, 0, "stream.10", 8, 10),
        make_chunk(core::ChunkType::Stream, 0, 0, "stream.2", 8, 2),
    };
    core::sort_canonical(chunks);
    EXPECT_EQ(ids(chunks), (std::vector<std::string>{"stream.2", "stream.10"}));
}

TEST(ChunkOrder, DropDuplicatesKeepsFirst) {
    std::vector<core::ChunkDescriptor> chunks = {
        make_chunk(core::ChunkType::Event, 10, 10, "e", 4),
        make_chunk(core::ChunkType::Event, 10, 10, "e", 9),
        make_chunk(core::ChunkType::Checkpoint, 10, 20, "e", 4),
        make_chunk(core::ChunkType::Event, 11, 11, "e", 4),
    };
    EXPECT_EQ(core::drop_duplicates(chunks), 1u);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size, 4u);
    EXPECT_TRUE(core::same_chunk(chunks[0], make_chunk(core::ChunkType::Event, 10, 10, "e", 1)));
}

TEST(ChunkOrder, PlanIsIndependentOfInputOrder) {
    const auto m = sample_manifest();
    core::AssemblyPlan a;
    std::string err;
    ASSERT_TRUE(core::build_assembly_plan(m, core::default_validation_options(), a, err)) << err;

    auto shuffled = m;
    std::reverse(shuffled.chunks.begin(), shuffled.chunks.end());
    core::AssemblyPlan b;
    ASSERT_TRUE(core::build_assembly_plan(shuffled, core::default_validation_options(), b, err)) << err;
    EXPECT_EQ(ids(a.chunks), ids(b.chunks));
    EXPECT_EQ(a.duplicates_dropped, 0u);
}

TEST(ChunkOrder, PlanCountsDuplicates) {
    auto m = sample_manifest();
    m.chunks.push_back(m.chunks[1]);
    m.chunks.push_back(m.chunks[2]);
    core::AssemblyPlan plan;
    std::string err;
    ASSERT_TRUE(core::build_assembly_plan(m, core::default_validation_options(), plan, err)) << err;
    EXPECT_EQ(plan.duplicates_dropped, 2u);
    EXPECT_EQ(plan.chunks.size(), 5u);
}

TEST(ChunkOrder, RejectsZeroDuration) {
    auto m = sample_manifest();
    m.meta.total_time_ms = 0;
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_FALSE(core::build_assembly_plan(m, core::default_validation_options(), plan, err));
    EXPECT_EQ(err, "replay has zero total duration");
}

TEST(ChunkOrder, RejectsEmptyManifest) {
    core::ReplayManifest m;
    m.meta.total_time_ms = 10;
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_FALSE(core::build_assembly_plan(m, core::default_validation_options(), plan, err));
    EXPECT_EQ(err, "manifest lists no chunks");
}

TEST(ChunkOrder, RequiresExactlyOneHeader) {
    auto m = sample_manifest();
    m.chunks.erase(m.chunks.begin() + 3);
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_FALSE(core::build_assembly_plan(m, core::default_validation_options(), plan, err));

    m = sample_manifest();
    m.chunks.push_back(make_chunk(core::ChunkType::Header, 0, 0, "replay.header.2"));
    EXPECT_FALSE(core::build_assembly_plan(m, core::default_validation_options(), plan, err));
    EXPECT_NE(err.find("found 2"), std::string::npos);
}

TEST(ChunkOrder, RejectsInvertedRange) {
    auto m = sample_manifest();
    m.chunks.push_back(make_chunk(core::ChunkType::Stream, 2500, 2100, "stream.1", 8, 1));
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_FALSE(core::build_assembly_plan(m, core::default_validation_options(), plan, err));
    EXPECT_NE(err.find("starts after it ends"), std::string::npos);
}

TEST(ChunkOrder, RejectsOverlap) {
    auto m = sample_manifest();
    m.chunks.push_back(make_chunk(core::ChunkType::Checkpoint, 1500, 2500, "cp-3", 16));
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_FALSE(core::build_assembly_plan(m, core::default_validation_options(), plan, err));
    EXPECT_NE(err.find("overlaps"), std::string::npos);
}

TEST(ChunkOrder, EventsMayOverlap) {
    auto m = sample_manifest();
    m.chunks.push_back(make_chunk(core::ChunkType::Event, 400, 900, "kill-2", 4));
    m.chunks.push_back(make_chunk(core::ChunkType::Event, 450, 600, "kill-3", 4));
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_TRUE(core::build_assembly_plan(m, core::default_validation_options(), plan, err)) << err;
}

TEST(ChunkOrder, GapTolerance) {
    auto m = sample_manifest();
    m.meta.total_time_ms = 10000;
    m.chunks.push_back(make_chunk(core::ChunkType::Stream, 5000, 6000, "stream.1", 8, 1));
    core::ValidationOptions opts = core::default_validation_options();
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_TRUE(core::build_assembly_plan(m, opts, plan, err)) << err;

    opts.gap_tolerance_ms = 2999;
    EXPECT_FALSE(core::build_assembly_plan(m, opts, plan, err));
    EXPECT_NE(err.find("gap of 3000ms"), std::string::npos);

    opts.gap_tolerance_ms = 3000;
    EXPECT_TRUE(core::build_assembly_plan(m, opts, plan, err)) << err;
}

TEST(ChunkOrder, GapFromTimelineStart) {
    auto m = sample_manifest();
    m.chunks[0].start_ms = 500;
    core::ValidationOptions opts;
    opts.gap_tolerance_ms = 100;
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_FALSE(core::build_assembly_plan(m, opts, plan, err));
    EXPECT_NE(err.find("stream.0"), std::string::npos);
}

TEST(ChunkOrder, CapsKeepFirstChunksOfType) {
    auto m = sample_manifest();
    m.chunks.push_back(make_chunk(core::ChunkType::Event, 700, 700, "kill-2", 4));
    core::ValidationOptions opts;
    opts.max_checkpoint_chunks = 1;
    opts.max_event_chunks = 0;
    core::AssemblyPlan plan;
    std::string err;
    ASSERT_TRUE(core::build_assembly_plan(m, opts, plan, err)) << err;
    EXPECT_EQ(plan.capped, 3u);
    EXPECT_EQ(ids(plan.chunks), (std::vector<std::string>{"replay.header", "cp-1", "stream.0"}));
}

TEST(ChunkOrder, RejectsOversizedChunk) {
    auto m = sample_manifest();
    m.chunks[0].size = 0x80000000u;
    core::AssemblyPlan plan;
    std::string err;
    EXPECT_FALSE(core::build_assembly_plan(m, core::default_validation_options(), plan, err));
    EXPECT_NE(err.find("stream.0"), std::string::npos);
}
