#include "persist/replay_reader.hpp"

#include <fstream>
#include <iterator>
#include <limits>

#include "persist/endianness.hpp"
#include "persist/replay_format.hpp"

namespace persist {
namespace {

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string utf16le_to_utf8(const std::byte* p, std::size_t units) {
    std::string out;
    out.reserve(units);
    for (std::size_t i = 0; i < units; ++i) {
        const auto u = static_cast<std::uint32_t>(std::to_integer<unsigned>(p[2 * i]) |
                                                  (std::to_integer<unsigned>(p[2 * i + 1]) << 8));
        if (u >= 0xD800 && u <= 0xDBFF && i + 1 < units) {
            const auto lo = static_cast<std::uint32_t>(std::to_integer<unsigned>(p[2 * i + 2]) |
                                                       (std::to_integer<unsigned>(p[2 * i + 3]) << 8));
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                append_utf8(out, 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00));
                ++i;
                continue;
            }
        }
        append_utf8(out, (u >= 0xD800 && u <= 0xDFFF) ? 0xFFFD : u);
    }
    return out;
}

class ByteCursor {
public:
    ByteCursor(std::span<const std::byte> data, std::size_t pos, std::size_t end) : data_(data), pos_(pos), end_(end) {}

    bool u32(std::uint32_t& v) noexcept {
        if (remaining() < 4) {
            return false;
        }
        v = load_le32(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    ReplayReadStatus fstring(std::string& out, std::string& err) {
        std::uint32_t raw = 0;
        if (!u32(raw)) {
            err = "truncated string length";
            return ReplayReadStatus::Truncated;
        }
        const auto len = static_cast<std::int32_t>(raw);
        if (len == 0) {
            out.clear();
            return ReplayReadStatus::Ok;
        }
        if (len == std::numeric_limits<std::int32_t>::min()) {
            err = "invalid string length";
            return ReplayReadStatus::InvalidLength;
        }
        const bool wide = len < 0;
        const std::size_t units = static_cast<std::size_t>(wide ? -len : len);
        const std::size_t bytes = wide ? units * 2 : units;
        if (bytes > remaining()) {
            err = "string runs past end of record";
            return ReplayReadStatus::Truncated;
        }
        const std::byte* p = data_.data() + pos_;
        if (wide) {
            out = utf16le_to_utf8(p, units - 1);
        } else {
            out.assign(reinterpret_cast<const char*>(p), units - 1);
        }
        pos_ += bytes;
        return ReplayReadStatus::Ok;
    }

    std::size_t pos() const noexcept { return pos_; }
    std::size_t remaining() const noexcept { return end_ - pos_; }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
    std::size_t end_;
};

ReplayReadStatus parse_info(std::span<const std::byte> data, ReplayInfo& info, std::string& err) {
    if (data.size() < replay_info_size) {
        err = "file shorter than replay info header";
        return ReplayReadStatus::Truncated;
    }
    const std::byte* p = data.data();
    info.magic = load_le32(p + info_offset::magic);
    if (info.magic != replay_magic) {
        err = "bad magic";
        return ReplayReadStatus::BadMagic;
    }
    info.file_version = load_le32(p + info_offset::file_version);
    if (info.file_version != replay_file_version) {
        err = "unsupported file version " + std::to_string(info.file_version);
        return ReplayReadStatus::UnsupportedVersion;
    }
    info.length_ms = load_le32(p + info_offset::length_ms);
    info.network_version = load_le32(p + info_offset::network_version);
    info.changelist = load_le32(p + info_offset::changelist);
    if (static_cast<std::int32_t>(load_le32(p + info_offset::name_length)) != friendly_name_length) {
        err = "unexpected friendly name length";
        return ReplayReadStatus::InvalidLength;
    }
    const std::byte* name = p + info_offset::name;
    std::size_t units = 0;
    while (units < friendly_name_max_units &&
           (name[2 * units] != std::byte{0} || name[2 * units + 1] != std::byte{0})) {
        ++units;
    }
    info.friendly_name = utf16le_to_utf8(name, units);
    while (!info.friendly_name.empty() && info.friendly_name.back() == ' ') {
        info.friendly_name.pop_back();
    }
    info.live = load_le32(p + info_offset::is_live) != 0;
    info.timestamp_ticks = static_cast<std::int64_t>(load_le64(p + info_offset::timestamp));
    info.compressed = load_le32(p + info_offset::compressed);
    info.encrypted = load_le32(p + info_offset::encrypted);
    info.key_length = load_le32(p + info_offset::key_length);
    return ReplayReadStatus::Ok;
}

ReplayReadStatus parse_record(std::span<const std::byte> data, std::size_t& pos, ChunkRecord& rec, std::string& err) {
    ByteCursor prefix(data, pos, data.size());
    std::uint32_t type = 0;
    std::uint32_t raw_len = 0;
    if (!prefix.u32(type) || !prefix.u32(raw_len)) {
        err = "truncated chunk prefix";
        return ReplayReadStatus::Truncated;
    }
    if (type > static_cast<std::uint32_t>(core::ChunkType::Event)) {
        err = "unknown chunk type " + std::to_string(type);
        return ReplayReadStatus::UnknownChunkType;
    }
    const auto body_len = static_cast<std::int32_t>(raw_len);
    if (body_len < 0) {
        err = "negative chunk body size";
        return ReplayReadStatus::InvalidLength;
    }
    if (static_cast<std::size_t>(body_len) > prefix.remaining()) {
        err = "chunk body runs past end of file";
        return ReplayReadStatus::Truncated;
    }
    const std::size_t body_end = prefix.pos() + static_cast<std::size_t>(body_len);
    ByteCursor body(data, prefix.pos(), body_end);

    rec = ChunkRecord{};
    rec.type = static_cast<core::ChunkType>(type);
    rec.frame_offset = pos - replay_info_size;
    switch (rec.type) {
    case core::ChunkType::Header:
        break;
    case core::ChunkType::Stream: {
        std::uint32_t data_size = 0;
        std::uint32_t memory_size = 0;
        if (!body.u32(rec.start_ms) || !body.u32(rec.end_ms) || !body.u32(data_size) || !body.u32(memory_size)) {
            err = "truncated stream header";
            return ReplayReadStatus::Truncated;
        }
        if (data_size != body.remaining()) {
            err = "stream data size disagrees with record size";
            return ReplayReadStatus::InvalidLength;
        }
        break;
    }
    case core::ChunkType::Checkpoint:
    case core::ChunkType::Event: {
        for (std::string* s : {&rec.id, &rec.group, &rec.metadata}) {
            if (auto st = body.fstring(*s, err); st != ReplayReadStatus::Ok) {
                return st;
            }
        }
        std::uint32_t size = 0;
        if (!body.u32(rec.start_ms) || !body.u32(rec.end_ms) || !body.u32(size)) {
            err = "truncated event header";
            return ReplayReadStatus::Truncated;
        }
        if (size != body.remaining()) {
            err = "event payload size disagrees with record size";
            return ReplayReadStatus::InvalidLength;
        }
        break;
    }
    }
    rec.payload_offset = body.pos() - replay_info_size;
    rec.payload_size = static_cast<std::uint32_t>(body.remaining());
    pos = body_end;
    return ReplayReadStatus::Ok;
}

} // namespace

const char* replay_read_status_name(ReplayReadStatus s) noexcept {
    switch (s) {
    case ReplayReadStatus::Ok: return "Ok";
    case ReplayReadStatus::Truncated: return "Truncated";
    case ReplayReadStatus::BadMagic: return "BadMagic";
    case ReplayReadStatus::UnsupportedVersion: return "UnsupportedVersion";
    case ReplayReadStatus::InvalidLength: return "InvalidLength";
    case ReplayReadStatus::UnknownChunkType: return "UnknownChunkType";
    case ReplayReadStatus::IoError: return "IoError";
    }
    return "Unknown";
}

ReplayReadStatus parse_replay(std::span<const std::byte> data, ParsedReplay& out, std::string& err) {
    ParsedReplay parsed;
    if (auto st = parse_info(data, parsed.info, err); st != ReplayReadStatus::Ok) {
        return st;
    }
    std::size_t pos = replay_info_size;
    while (pos < data.size()) {
        ChunkRecord rec;
        if (auto st = parse_record(data, pos, rec, err); st != ReplayReadStatus::Ok) {
            err = "chunk " + std::to_string(parsed.chunks.size()) + ": " + err;
            return st;
        }
        parsed.chunks.push_back(std::move(rec));
    }
    out = std::move(parsed);
    return ReplayReadStatus::Ok;
}

ReplayReadStatus read_replay_file(const std::filesystem::path& path,
                                  std::vector<std::byte>& bytes,
                                  ParsedReplay& out,
                                  std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "cannot open " + path.string();
        return ReplayReadStatus::IoError;
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        err = "read error on " + path.string();
        return ReplayReadStatus::IoError;
    }
    bytes.resize(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        bytes[i] = static_cast<std::byte>(raw[i]);
    }
    return parse_replay(bytes, out, err);
}

std::span<const std::byte> payload_of(std::span<const std::byte> file, const ChunkRecord& rec) noexcept {
    const std::uint64_t begin = replay_info_size + rec.payload_offset;
    if (begin + rec.payload_size > file.size()) {
        return {};
    }
    return file.subspan(static_cast<std::size_t>(begin), rec.payload_size);
}

} // namespace persist
