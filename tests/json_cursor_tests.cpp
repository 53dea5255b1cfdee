#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "util/json_cursor.hpp"

TEST(JsonCursor, ParsesStringEscapes) {
    util::JsonCursor cur(R"(  "a\"b\\c\n\u00e9\ud83d\ude00" )");
    std::string err;
    auto s = cur.parse_string(err);
    ASSERT_TRUE(s.has_value()) << err;
    EXPECT_EQ(*s, "a\"b\\c\n\xC3\xA9\xF0\x9F\x98\x80");
    EXPECT_TRUE(cur.eof());
}

TEST(JsonCursor, RejectsUnpairedSurrogate) {
    util::JsonCursor cur(R"("\ud83d x")");
    std::string err;
    EXPECT_FALSE(cur.parse_string(err).has_value());
    EXPECT_EQ(err, "Unpaired surrogate");
}

TEST(JsonCursor, RejectsUnterminatedString) {
    util::JsonCursor cur(R"("abc)");
    std::string err;
    EXPECT_FALSE(cur.parse_string(err).has_value());
    EXPECT_EQ(err, "Unterminated string");
}

TEST(JsonCursor, ParsesIntegers) {
    std::string err;
    util::JsonCursor u("18446744073709551615");
    auto big = u.parse_uint64(err);
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(*big, 18446744073709551615ull);

    util::JsonCursor overflow("18446744073709551616");
    EXPECT_FALSE(overflow.parse_uint64(err).has_value());

    util::JsonCursor neg("-42");
    auto n = neg.parse_int64(err);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, -42);
}

TEST(JsonCursor, Int64AcceptsIntegralFractionOnly) {
    std::string err;
    util::JsonCursor whole("12.000");
    auto v = whole.parse_int64(err);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 12);
    EXPECT_TRUE(whole.eof());

    util::JsonCursor frac("12.5");
    EXPECT_FALSE(frac.parse_int64(err).has_value());
}

TEST(JsonCursor, ParsesBoolAndNull) {
    std::string err;
    util::JsonCursor cur("true , false null");
    EXPECT_EQ(cur.parse_bool(err), std::optional<bool>(true));
    EXPECT_TRUE(cur.consume(','));
    EXPECT_EQ(cur.parse_bool(err), std::optional<bool>(false));
    EXPECT_TRUE(cur.consume_null());
    EXPECT_TRUE(cur.eof());
}

TEST(JsonCursor, ParsesByteArray) {
    std::string err;
    std::vector<std::byte> out{std::byte{9}};
    util::JsonCursor cur("[0, 127,255]");
    ASSERT_TRUE(cur.parse_byte_array(out, err)) << err;
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], std::byte{0});
    EXPECT_EQ(out[1], std::byte{127});
    EXPECT_EQ(out[2], std::byte{255});

    util::JsonCursor empty("[]");
    ASSERT_TRUE(empty.parse_byte_array(out, err));
    EXPECT_TRUE(out.empty());

    util::JsonCursor bad("[1,256]");
    EXPECT_FALSE(bad.parse_byte_array(out, err));
    EXPECT_EQ(err, "Byte value out of range");
}

TEST(JsonCursor, SkipsNestedValues) {
    std::string err;
    util::JsonCursor cur(R"({"a":[1,{"b":null},"x"],"c":-1.5e3} "next")");
    ASSERT_TRUE(cur.skip_value(err)) << err;
    auto s = cur.parse_string(err);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(*s, "next");
}

TEST(JsonCursor, SkipRejectsExcessiveNesting) {
    std::string doc(100, '[');
    doc.append(100, ']');
    util::JsonCursor cur(doc);
    std::string err;
    EXPECT_FALSE(cur.skip_value(err));
    EXPECT_EQ(err, "Nesting too deep");
}
