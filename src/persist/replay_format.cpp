#include "persist/replay_format.hpp"

#include <algorithm>
#include <limits>

#include "persist/endianness.hpp"

namespace persist {
namespace {

constexpr char16_t kReplacement = 0xFFFD;

bool is_ascii(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

void append_u16_le(std::vector<std::byte>& out, char16_t u) {
    out.push_back(static_cast<std::byte>(u & 0xFF));
    out.push_back(static_cast<std::byte>((u >> 8) & 0xFF));
}

std::uint64_t body_size(const core::ChunkDescriptor& desc) {
    switch (desc.type) {
    case core::ChunkType::Header:
        return desc.size;
    case core::ChunkType::Stream:
        return stream_header_size + static_cast<std::uint64_t>(desc.size);
    case core::ChunkType::Checkpoint:
    case core::ChunkType::Event:
        return fstring_size(desc.remote_id) + fstring_size(desc.group) + fstring_size(desc.metadata) +
               event_trailer_size + static_cast<std::uint64_t>(desc.size);
    }
    return 0;
}

} // namespace

std::string friendly_name_text(const core::ReplayMeta& meta) {
    std::string s;
    s.reserve(meta.game_mode.size() + meta.friendly_name.size() + meta.workshop_mods.size() + 32);
    s += meta.game_mode;
    s += ',';
    s += meta.friendly_name;
    s += ',';
    s += meta.competitive ? "competitive" : "casual";
    s += ",0,";
    s += meta.workshop_mods;
    s += ',';
    s += meta.live ? "true" : "false";
    return s;
}

std::u16string utf8_to_utf16(std::string_view utf8) {
    std::u16string out;
    out.reserve(utf8.size());
    std::size_t i = 0;
    while (i < utf8.size()) {
        const auto b0 = static_cast<unsigned char>(utf8[i]);
        std::uint32_t cp = 0;
        std::size_t len = 0;
        std::uint32_t min_cp = 0;
        if (b0 < 0x80) {
            out.push_back(static_cast<char16_t>(b0));
            ++i;
            continue;
        }
        if ((b0 & 0xE0) == 0xC0) {
            cp = b0 & 0x1F;
            len = 2;
            min_cp = 0x80;
        } else if ((b0 & 0xF0) == 0xE0) {
            cp = b0 & 0x0F;
            len = 3;
            min_cp = 0x800;
        } else if ((b0 & 0xF8) == 0xF0) {
            cp = b0 & 0x07;
            len = 4;
            min_cp = 0x10000;
        } else {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        bool valid = i + len <= utf8.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto b = static_cast<unsigned char>(utf8[i + k]);
            if ((b & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (b & 0x3F);
        }
        if (!valid || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
        i += len;
    }
    return out;
}

void encode_replay_info(const core::ReplayMeta& meta, std::vector<std::byte>& out) {
    out.assign(replay_info_size, std::byte{0});
    std::byte* p = out.data();
    store_le32(p + info_offset::magic, replay_magic);
    store_le32(p + info_offset::file_version, replay_file_version);
    store_le32(p + info_offset::length_ms, meta.total_time_ms);
    store_le32(p + info_offset::network_version, meta.network_version);
    store_le32(p + info_offset::changelist, 0);
    store_le32(p + info_offset::name_length, static_cast<std::uint32_t>(friendly_name_length));

    // Space padded, final code unit left as NUL.
    std::byte* name = p + info_offset::name;
    for (std::size_t i = 0; i + 2 < friendly_name_bytes; i += 2) {
        name[i] = std::byte{0x20};
        name[i + 1] = std::byte{0x00};
    }
    const std::u16string units = utf8_to_utf16(friendly_name_text(meta));
    const std::size_t n = std::min(units.size(), friendly_name_max_units);
    for (std::size_t i = 0; i < n; ++i) {
        name[2 * i] = static_cast<std::byte>(units[i] & 0xFF);
        name[2 * i + 1] = static_cast<std::byte>((units[i] >> 8) & 0xFF);
    }

    store_le32(p + info_offset::is_live, meta.live ? 1u : 0u);
    store_le64(p + info_offset::timestamp, static_cast<std::uint64_t>(meta.timestamp_ticks));
    store_le32(p + info_offset::compressed, 0);
    store_le32(p + info_offset::encrypted, 0);
    store_le32(p + info_offset::key_length, 0);
}

std::size_t fstring_size(std::string_view utf8) {
    if (is_ascii(utf8)) {
        return 4 + utf8.size() + 1;
    }
    return 4 + 2 * (utf8_to_utf16(utf8).size() + 1);
}

void append_fstring(std::vector<std::byte>& out, std::string_view utf8) {
    if (is_ascii(utf8)) {
        append_le32(out, static_cast<std::uint32_t>(utf8.size() + 1));
        for (char c : utf8) {
            out.push_back(static_cast<std::byte>(c));
        }
        out.push_back(std::byte{0});
        return;
    }
    const std::u16string units = utf8_to_utf16(utf8);
    const auto len = static_cast<std::int32_t>(units.size() + 1);
    append_le32(out, static_cast<std::uint32_t>(-len));
    for (char16_t u : units) {
        append_u16_le(out, u);
    }
    append_u16_le(out, 0);
}

bool encode_frame_header(const core::ChunkDescriptor& desc, std::vector<std::byte>& out, std::string& err) {
    const std::uint64_t body = body_size(desc);
    if (body > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
        err = std::string(core::chunk_type_name(desc.type)) + " chunk " + desc.remote_id + " body of " +
              std::to_string(body) + " bytes exceeds the record size limit";
        return false;
    }
    out.clear();
    append_le32(out, static_cast<std::uint32_t>(desc.type));
    append_le32(out, static_cast<std::uint32_t>(body));
    switch (desc.type) {
    case core::ChunkType::Header:
        break;
    case core::ChunkType::Stream:
        append_le32(out, desc.start_ms);
        append_le32(out, desc.end_ms);
        append_le32(out, desc.size);
        append_le32(out, desc.size);
        break;
    case core::ChunkType::Checkpoint:
    case core::ChunkType::Event:
        append_fstring(out, desc.remote_id);
        append_fstring(out, desc.group);
        append_fstring(out, desc.metadata);
        append_le32(out, desc.start_ms);
        append_le32(out, desc.end_ms);
        append_le32(out, desc.size);
        break;
    }
    return true;
}

bool compute_layout(const core::ReplayMeta& meta,
                    const std::vector<core::ChunkDescriptor>& chunks,
                    ReplayLayout& out,
                    std::string& err) {
    ReplayLayout layout;
    encode_replay_info(meta, layout.info);
    layout.frame_headers.reserve(chunks.size());
    layout.index.reserve(chunks.size());

    std::uint64_t offset = 0;
    for (const auto& c : chunks) {
        std::vector<std::byte> header;
        if (!encode_frame_header(c, header, err)) {
            return false;
        }
        ChunkIndexEntry e;
        e.type = c.type;
        e.start_ms = c.start_ms;
        e.end_ms = c.end_ms;
        e.frame_offset = offset;
        e.payload_offset = offset + header.size();
        e.payload_size = c.size;
        e.remote_id = c.remote_id;
        offset = e.payload_offset + c.size;
        layout.index.push_back(std::move(e));
        layout.frame_headers.push_back(std::move(header));
    }
    layout.payload_section_size = offset;
    layout.total_size = replay_info_size + offset;
    out = std::move(layout);
    return true;
}

} // namespace persist
