#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/replay_time.hpp"
#include "persist/endianness.hpp"
#include "persist/replay_format.hpp"
#include "util/crc32c.hpp"

namespace {

core::ReplayMeta sample_meta() {
    core::ReplayMeta m;
    m.game_mode = "SND";
    m.friendly_name = "datacenter";
    m.competitive = true;
    m.workshop_mods = "UGC1234";
    m.live = false;
    m.total_time_ms = 123456;
    m.network_version = 9;
    m.created = "2024-03-01T18:22:43.120Z";
    m.timestamp_ticks = core::unix_ms_to_ticks(1709317363120LL);
    return m;
}

core::ChunkDescriptor make_chunk(core::ChunkType type, std::uint32_t start, std::uint32_t end, std::string id, std::uint32_t size) {
    core::ChunkDescriptor c;
    c.type = type;
    c.start_ms = start;
    c.end_ms = end;
    c.remote_id = std::move(id);
    c.size = size;
    return c;
}

std::uint32_t u32_at(const std::vector<std::byte>& b, std::size_t off) {
    return persist::load_le32(b.data() + off);
}

} // namespace

TEST(ReplayFormat, Crc32cVector) {
    const char* msg = "123456789";
    const auto* p = reinterpret_cast<const std::byte*>(msg);
    EXPECT_EQ(util::Crc32c::compute(p, 9), 0xE3069283u);
    util::Crc32c running;
    running.append({p, 4});
    running.append({p + 4, 5});
    EXPECT_EQ(running.value(), 0xE3069283u);
}

TEST(ReplayFormat, FriendlyNameText) {
    auto m = sample_meta();
    EXPECT_EQ(persist::friendly_name_text(m), "SND,datacenter,competitive,0,UGC1234,false");
    m.competitive = false;
    m.live = true;
    m.workshop_mods.clear();
    EXPECT_EQ(persist::friendly_name_text(m), "SND,datacenter,casual,0,,true");
}

TEST(ReplayFormat, ReplayInfoLayout) {
    const auto m = sample_meta();
    std::vector<std::byte> info;
    persist::encode_replay_info(m, info);
    ASSERT_EQ(info.size(), 562u);
    EXPECT_EQ(u32_at(info, 0), 0x1CA2E27Fu);
    EXPECT_EQ(u32_at(info, 4), 6u);
    EXPECT_EQ(u32_at(info, 8), 123456u);
    EXPECT_EQ(u32_at(info, 12), 9u);
    EXPECT_EQ(u32_at(info, 16), 0u);
    EXPECT_EQ(static_cast<std::int32_t>(u32_at(info, 20)), -257);

    const std::string text = persist::friendly_name_text(m);
    for (std::size_t i = 0; i < text.size(); ++i) {
        EXPECT_EQ(info[24 + 2 * i], static_cast<std::byte>(text[i]));
        EXPECT_EQ(info[24 + 2 * i + 1], std::byte{0});
    }
    // Space padding up to the final NUL code unit.
    EXPECT_EQ(info[24 + 2 * text.size()], std::byte{0x20});
    EXPECT_EQ(info[24 + 2 * 255], std::byte{0x20});
    EXPECT_EQ(info[24 + 2 * 256], std::byte{0});
    EXPECT_EQ(info[24 + 2 * 256 + 1], std::byte{0});

    EXPECT_EQ(u32_at(info, 538), 0u);
    EXPECT_EQ(static_cast<std::int64_t>(persist::load_le64(info.data() + 542)), m.timestamp_ticks);
    EXPECT_EQ(u32_at(info, 550), 0u);
    EXPECT_EQ(u32_at(info, 554), 0u);
    EXPECT_EQ(u32_at(info, 558), 0u);
}

TEST(ReplayFormat, FriendlyNameTruncated) {
    auto m = sample_meta();
    m.friendly_name.assign(400, 'x');
    std::vector<std::byte> info;
    persist::encode_replay_info(m, info);
    ASSERT_EQ(info.size(), 562u);
    EXPECT_EQ(info[24 + 2 * 255], std::byte{'x'});
    EXPECT_EQ(info[24 + 2 * 256], std::byte{0});
    EXPECT_EQ(u32_at(info, 538), 0u);
}

TEST(ReplayFormat, AsciiFString) {
    std::vector<std::byte> out;
    persist::append_fstring(out, "kill");
    ASSERT_EQ(out.size(), 9u);
    EXPECT_EQ(persist::fstring_size("kill"), 9u);
    EXPECT_EQ(u32_at(out, 0), 5u);
    EXPECT_EQ(out[4], std::byte{'k'});
    EXPECT_EQ(out[8], std::byte{0});

    out.clear();
    persist::append_fstring(out, "");
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(u32_at(out, 0), 1u);
}

TEST(ReplayFormat, WideFString) {
    std::vector<std::byte> out;
    // "é" then U+1F600 (surrogate pair)
    const std::string text = "\xC3\xA9\xF0\x9F\x98\x80";
    persist::append_fstring(out, text);
    EXPECT_EQ(static_cast<std::int32_t>(u32_at(out, 0)), -4);
    ASSERT_EQ(out.size(), 4u + 8u);
    EXPECT_EQ(persist::fstring_size(text), out.size());
    EXPECT_EQ(out[4], std::byte{0xE9});
    EXPECT_EQ(out[5], std::byte{0x00});
    EXPECT_EQ(out[6], std::byte{0x3D});
    EXPECT_EQ(out[7], std::byte{0xD8});
    EXPECT_EQ(out[10], std::byte{0});
    EXPECT_EQ(out[11], std::byte{0});
}

TEST(ReplayFormat, InvalidUtf8BecomesReplacement) {
    const std::u16string units = persist::utf8_to_utf16("a\xFF" "b\xC3");
    EXPECT_EQ(units, (std::u16string{u'a', 0xFFFD, u'b', 0xFFFD}));
}

TEST(ReplayFormat, FrameHeaders) {
    std::vector<std::byte> out;
    std::string err;

    ASSERT_TRUE(persist::encode_frame_header(make_chunk(core::ChunkType::Header, 0, 0, "replay.header", 100), out, err));
    ASSERT_EQ(out.size(), 8u);
    EXPECT_EQ(u32_at(out, 0), 0u);
    EXPECT_EQ(u32_at(out, 4), 100u);

    ASSERT_TRUE(persist::encode_frame_header(make_chunk(core::ChunkType::Stream, 10, 20, "stream.0", 50), out, err));
    ASSERT_EQ(out.size(), 24u);
    EXPECT_EQ(u32_at(out, 0), 1u);
    EXPECT_EQ(u32_at(out, 4), 66u);
    EXPECT_EQ(u32_at(out, 8), 10u);
    EXPECT_EQ(u32_at(out, 12), 20u);
    EXPECT_EQ(u32_at(out, 16), 50u);
    EXPECT_EQ(u32_at(out, 20), 50u);

    auto ev = make_chunk(core::ChunkType::Event, 500, 500, "kill", 3);
    ev.group = "Pavlov";
    ev.metadata = "";
    ASSERT_TRUE(persist::encode_frame_header(ev, out, err));
    // prefix 8 + "kill" 9 + "Pavlov" 11 + "" 5 + trailer 12
    ASSERT_EQ(out.size(), 45u);
    EXPECT_EQ(u32_at(out, 0), 3u);
    EXPECT_EQ(u32_at(out, 4), 37u + 3u);
    EXPECT_EQ(u32_at(out, 33), 500u);
    EXPECT_EQ(u32_at(out, 37), 500u);
    EXPECT_EQ(u32_at(out, 41), 3u);
}

TEST(ReplayFormat, FrameHeaderRejectsOversizedBody) {
    std::vector<std::byte> out;
    std::string err;
    EXPECT_FALSE(
        persist::encode_frame_header(make_chunk(core::ChunkType::Stream, 0, 0, "stream.0", 0x7FFFFFF8u), out, err));
    EXPECT_NE(err.find("stream.0"), std::string::npos);
}

TEST(ReplayFormat, LayoutOffsetsAreCumulative) {
    auto cp0 = make_chunk(core::ChunkType::Checkpoint, 0, 1000, "cp0", 16);
    cp0.group = "checkpoint";
    auto cp1 = make_chunk(core::ChunkType::Checkpoint, 1000, 2000, "cp1", 8);
    cp1.group = "checkpoint";
    auto ev = make_chunk(core::ChunkType::Event, 500, 500, "kill", 4);
    ev.group = "Pavlov";
    const std::vector<core::ChunkDescriptor> chunks = {
        make_chunk(core::ChunkType::Header, 0, 0, "replay.header", 32),
        cp0,
        cp1,
        ev,
        make_chunk(core::ChunkType::Stream, 0, 2000, "stream.0", 64),
    };
    persist::ReplayLayout layout;
    std::string err;
    ASSERT_TRUE(persist::compute_layout(sample_meta(), chunks, layout, err)) << err;
    ASSERT_EQ(layout.index.size(), 5u);
    ASSERT_EQ(layout.frame_headers.size(), 5u);

    std::uint64_t expected = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& e = layout.index[i];
        EXPECT_EQ(e.frame_offset, expected) << i;
        EXPECT_EQ(e.payload_offset, expected + layout.frame_headers[i].size()) << i;
        EXPECT_EQ(e.payload_size, chunks[i].size) << i;
        EXPECT_EQ(e.remote_id, chunks[i].remote_id);
        expected = e.payload_offset + e.payload_size;
    }
    // cp0: 8 + "cp0" 8 + "checkpoint" 15 + "" 5 + 12
    EXPECT_EQ(layout.index[1].payload_offset, 40u + 48u);
    EXPECT_EQ(layout.payload_section_size, expected);
    EXPECT_EQ(layout.total_size, 562u + expected);
    EXPECT_EQ(layout.info.size(), 562u);
}
