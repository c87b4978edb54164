// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include "recede/io/json.hpp"

using namespace recede;
using namespace recede::io;

TEST(Json, ParsesNestedDocument) {
    auto root = parseJson(R"({"a": [1, -2.5e1, true, null], "b": {"c": "x\ty"}})");
    ASSERT_TRUE(root.isObject());
    const auto& a = root["a"].asArray();
    ASSERT_EQ(a.size(), 4u);
    EXPECT_EQ(a[0].asNumber(), 1.0);
    EXPECT_EQ(a[1].asNumber(), -25.0);
    EXPECT_TRUE(a[2].asBool());
    EXPECT_TRUE(a[3].isNull());
    EXPECT_EQ(root["b"]["c"].asString(), "x\ty");
}

TEST(Json, UnicodeEscapes) {
    auto v = parseJson(R"("caf\u00e9 \u2192")");
    EXPECT_EQ(v.asString(), "caf\xC3\xA9 \xE2\x86\x92");
}

TEST(Json, RejectsMalformedInput) {
    EXPECT_THROW((void)parseJson(""), std::runtime_error);
    EXPECT_THROW((void)parseJson("{\"a\":}"), std::runtime_error);
    EXPECT_THROW((void)parseJson("[1, 2"), std::runtime_error);
    EXPECT_THROW((void)parseJson("{} extra"), std::runtime_error);
    EXPECT_THROW((void)parseJson("-"), std::runtime_error);
    EXPECT_THROW((void)parseJson("\"unterminated"), std::runtime_error);
}

TEST(Json, TypedAccessorsThrowOnMismatch) {
    auto v = parseJson(R"({"n": 3})");
    EXPECT_THROW((void)v["n"].asString(), std::runtime_error);
    EXPECT_THROW((void)v["missing"], std::runtime_error);
    EXPECT_EQ(v.find("missing"), nullptr);
    EXPECT_EQ(v["n"].find("anything"), nullptr);
}

TEST(Json, WriterIsCompactAndOrdered) {
    JsonValue v{JsonObject{
        {"z", JsonValue{1.0}},
        {"a", JsonValue{JsonArray{JsonValue{0.1}, JsonValue{false}, JsonValue{nullptr}}}},
        {"s", JsonValue{std::string("q\"\n")}},
    }};
    EXPECT_EQ(dumpJson(v), R"({"z":1,"a":[0.1,false,null],"s":"q\"\n"})");
}

TEST(Json, WriterEscapesControlCharacters) {
    const std::string raw{'a', '\x01', '\b', '\f', '\x1f', 'z'};
    const std::string text = dumpJson(JsonValue{raw});
    EXPECT_EQ(text, R"("a\u0001\b\f\u001fz")");
    EXPECT_EQ(parseJson(text).asString(), raw);
}

TEST(Json, NestingDepthIsCapped) {
    auto nested = [](int depth) {
        return std::string(static_cast<std::size_t>(depth), '[') +
               std::string(static_cast<std::size_t>(depth), ']');
    };
    EXPECT_NO_THROW((void)parseJson(nested(kMaxJsonDepth)));
    EXPECT_THROW((void)parseJson(nested(kMaxJsonDepth + 1)), std::runtime_error);
    EXPECT_THROW((void)parseJson(nested(100000)), std::runtime_error);
    EXPECT_THROW((void)parseJson(std::string(100000, '{')), std::runtime_error);
}

TEST(Json, NumbersRoundTripExactly) {
    for (double x : {0.1, 1.0 / 3.0, -1e-300, 6.02214076e23, 0.3 * 3.14159265358979}) {
        EXPECT_EQ(parseJson(formatNumber(x)).asNumber(), x);
    }
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "null");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::quiet_NaN()), "null");
}

TEST(Json, VectorHelpers) {
    VecX v(3);
    v << 1.5, -2, 0;
    EXPECT_EQ(dumpJson(toJsonArray(v)), "[1.5,-2,0]");
    EXPECT_TRUE(toVecX(parseJson("[1.5,-2,0]")).isApprox(v));
    EXPECT_THROW((void)toVecX(parseJson("[1, \"x\"]")), std::runtime_error);
}

TEST(Json, MissingFileThrows) {
    EXPECT_THROW((void)readTextFile("/nonexistent/recede/file.json"), std::runtime_error);
}
