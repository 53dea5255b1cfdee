#include "util/json_cursor.hpp"

#include <cctype>
#include <charconv>

namespace util {
namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

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

} // namespace

void JsonCursor::skip_ws() const noexcept {
    while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
    }
}

bool JsonCursor::consume(char c) noexcept {
    skip_ws();
    if (pos_ < src_.size() && src_[pos_] == c) {
        ++pos_;
        return true;
    }
    return false;
}

bool JsonCursor::expect(char c) noexcept {
    skip_ws();
    if (pos_ >= src_.size() || src_[pos_] != c) {
        return false;
    }
    ++pos_;
    return true;
}

char JsonCursor::peek() const noexcept {
    skip_ws();
    return pos_ < src_.size() ? src_[pos_] : '\0';
}

std::optional<std::string> JsonCursor::parse_string(std::string& err) {
    skip_ws();
    if (pos_ >= src_.size() || src_[pos_] != '"') {
        err = "Expected string";
        return std::nullopt;
    }
    ++pos_; // skip opening quote
    std::string out;
    while (pos_ < src_.size()) {
        const char c = src_[pos_++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos_ >= src_.size()) {
            err = "Invalid escape";
            return std::nullopt;
        }
        const char esc = src_[pos_++];
        switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                auto read_unit = [this](std::uint32_t& unit) noexcept {
                    if (pos_ + 4 > src_.size()) {
                        return false;
                    }
                    unit = 0;
                    for (int i = 0; i < 4; ++i) {
                        const int v = hex_value(src_[pos_++]);
                        if (v < 0) {
                            return false;
                        }
                        unit = (unit << 4) | static_cast<std::uint32_t>(v);
                    }
                    return true;
                };
                std::uint32_t cp = 0;
                if (!read_unit(cp)) {
                    err = "Invalid unicode escape";
                    return std::nullopt;
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    std::uint32_t low = 0;
                    if (pos_ + 2 > src_.size() || src_[pos_] != '\\' || src_[pos_ + 1] != 'u') {
                        err = "Unpaired surrogate";
                        return std::nullopt;
                    }
                    pos_ += 2;
                    if (!read_unit(low) || low < 0xDC00 || low > 0xDFFF) {
                        err = "Unpaired surrogate";
                        return std::nullopt;
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default:
                err = "Unsupported escape sequence";
                return std::nullopt;
        }
    }
    err = "Unterminated string";
    return std::nullopt;
}

std::optional<std::uint64_t> JsonCursor::parse_uint64(std::string& err) noexcept {
    skip_ws();
    const std::size_t start = pos_;
    while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
    }
    if (start == pos_) {
        err = "Expected integer";
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
    if (conv.ec != std::errc()) {
        err = "Invalid integer";
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> JsonCursor::parse_int64(std::string& err) noexcept {
    skip_ws();
    const std::size_t start = pos_;
    if (pos_ < src_.size() && src_[pos_] == '-') {
        ++pos_;
    }
    const std::size_t digits = pos_;
    while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
    }
    if (digits == pos_) {
        err = "Expected integer";
        return std::nullopt;
    }
    std::int64_t value = 0;
    const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
    if (conv.ec != std::errc()) {
        err = "Invalid integer";
        return std::nullopt;
    }
    // Integral values serialized as 12.0 are accepted; real fractions are not.
    if (pos_ < src_.size() && src_[pos_] == '.') {
        ++pos_;
        while (pos_ < src_.size() && src_[pos_] == '0') {
            ++pos_;
        }
        if (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            err = "Expected integer";
            return std::nullopt;
        }
    }
    return value;
}

bool JsonCursor::parse_literal(std::string_view literal) noexcept {
    skip_ws();
    if (src_.substr(pos_).compare(0, literal.size(), literal) == 0) {
        pos_ += literal.size();
        return true;
    }
    return false;
}

std::optional<bool> JsonCursor::parse_bool(std::string& err) noexcept {
    if (parse_literal("true")) {
        return true;
    }
    if (parse_literal("false")) {
        return false;
    }
    err = "Expected boolean";
    return std::nullopt;
}

bool JsonCursor::consume_null() noexcept {
    return parse_literal("null");
}

bool JsonCursor::parse_byte_array(std::vector<std::byte>& out, std::string& err) {
    out.clear();
    if (!expect('[')) {
        err = "Expected byte array";
        return false;
    }
    if (consume(']')) {
        return true;
    }
    while (true) {
        auto v = parse_uint64(err);
        if (!v) {
            return false;
        }
        if (*v > 0xFFu) {
            err = "Byte value out of range";
            return false;
        }
        out.push_back(static_cast<std::byte>(*v));
        if (consume(']')) {
            return true;
        }
        if (!consume(',')) {
            err = "Expected ','";
            return false;
        }
    }
}

bool JsonCursor::skip_number(std::string& err) noexcept {
    skip_ws();
    const std::size_t start = pos_;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.' || c == 'e' ||
            c == 'E') {
            ++pos_;
        } else {
            break;
        }
    }
    if (start == pos_) {
        err = "Unexpected character";
        return false;
    }
    return true;
}

bool JsonCursor::skip_value(std::string& err) {
    return skip_value_at_depth(err, 0);
}

bool JsonCursor::skip_value_at_depth(std::string& err, int depth) {
    if (depth > max_depth) {
        err = "Nesting too deep";
        return false;
    }
    const char c = peek();
    if (c == '"') {
        return parse_string(err).has_value();
    }
    if (c == '{') {
        expect('{');
        if (consume('}')) {
            return true;
        }
        while (true) {
            if (!parse_string(err)) {
                return false;
            }
            if (!expect(':')) {
                err = "Expected ':'";
                return false;
            }
            if (!skip_value_at_depth(err, depth + 1)) {
                return false;
            }
            if (consume('}')) {
                return true;
            }
            if (!consume(',')) {
                err = "Expected ','";
                return false;
            }
        }
    }
    if (c == '[') {
        expect('[');
        if (consume(']')) {
            return true;
        }
        while (true) {
            if (!skip_value_at_depth(err, depth + 1)) {
                return false;
            }
            if (consume(']')) {
                return true;
            }
            if (!consume(',')) {
                err = "Expected ','";
                return false;
            }
        }
    }
    if (parse_literal("true") || parse_literal("false") || parse_literal("null")) {
        return true;
    }
    return skip_number(err);
}

bool JsonCursor::eof() const noexcept {
    skip_ws();
    return pos_ >= src_.size();
}

} // namespace util
