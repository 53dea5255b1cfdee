#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace util {

// Forward-only cursor over a JSON document. Schema-specific parsers drive it
// key by key; it never allocates a DOM and never throws.
class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept;

    bool consume(char c) noexcept;
    bool expect(char c) noexcept;

    // Next non-whitespace character, or '\0' at end of input.
    char peek() const noexcept;

    std::optional<std::string> parse_string(std::string& err);
    std::optional<std::uint64_t> parse_uint64(std::string& err) noexcept;
    std::optional<std::int64_t> parse_int64(std::string& err) noexcept;
    std::optional<bool> parse_bool(std::string& err) noexcept;

    // Consumes a `null` literal if present.
    bool consume_null() noexcept;

    // Array of integers in [0, 255], as produced by Node's Buffer.toJSON().
    bool parse_byte_array(std::vector<std::byte>& out, std::string& err);

    // Skips any value (nested objects and arrays included).
    bool skip_value(std::string& err);

    bool eof() const noexcept;

private:
    bool parse_literal(std::string_view literal) noexcept;
    bool skip_number(std::string& err) noexcept;
    bool skip_value_at_depth(std::string& err, int depth);

    static constexpr int max_depth = 64;

    mutable std::size_t pos_{0};
    std::string_view src_;
};

} // namespace util
