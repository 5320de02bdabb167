/// @file test_json_decoder.cpp
/// @brief Tests for schema-driven JSON decoding and the type-mismatch policy.

#include <yadec/yadec.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace yadec;

namespace json_test {

struct Sample {
    std::string str;
    int integer = 0;
    double float64 = 0;
    std::map<std::string, Value> object;
    std::vector<Value> slice;
};
YADEC_DEFINE_SCHEMA(Sample,
    (str,     R"(json:"string")"),
    (integer, R"(json:"int")"),
    (float64, R"(json:"float64")"),
    (object,  R"(json:"object")"),
    (slice,   R"(json:"slice")"))

Sample base_sample() {
    Sample s;
    s.str = "test";
    s.integer = 123;
    s.float64 = 123.123;
    s.object = {{"foo", Value("bar")}};
    s.slice = {Value(1.0), Value(2.0), Value(3.0)};
    return s;
}

bool operator==(const Sample& a, const Sample& b) {
    return a.str == b.str && a.integer == b.integer && a.float64 == b.float64 &&
           a.object == b.object && a.slice == b.slice;
}

std::ostream& operator<<(std::ostream& os, const Sample& s) {
    return os << "{string=\"" << s.str << "\" int=" << s.integer << " float64=" << s.float64
              << " object.size=" << s.object.size() << " slice.size=" << s.slice.size() << "}";
}

struct Simple {
    std::string s;
    int i = 0;
    double f = 0;
};
YADEC_DEFINE_SCHEMA(Simple, (s, R"(json:"S")"), (i, R"(json:"I")"), (f, R"(json:"F")"))

struct Address {
    std::string city;
    uint16_t zip = 0;
};
YADEC_DEFINE_SCHEMA(Address, (city, R"(json:"city")"), (zip, R"(json:"zip")"))

struct Person {
    std::string name;
    std::vector<Address> addresses;
    std::vector<int> scores;
    std::unordered_map<std::string, int> counts;
    std::optional<int> age;
    std::unique_ptr<Address> home;
    std::optional<std::vector<int>> tags;
    std::optional<std::map<std::string, int>> limits;
    Value extra;
    bool active = false;
    float ratio = 0;
    int8_t small = 0;
};
YADEC_DEFINE_SCHEMA(Person,
    (name,      R"(json:"name")"),
    (addresses, R"(json:"addresses")"),
    (scores,    R"(json:"scores")"),
    (counts,    R"(json:"counts")"),
    (age,       R"(json:"age")"),
    (home,      R"(json:"home")"),
    (tags,      R"(json:"tags")"),
    (limits,    R"(json:"limits")"),
    (extra,     R"(json:"extra")"),
    (active,    R"(json:"active")"),
    (ratio,     R"(json:"ratio")"),
    (small,     R"(json:"small")"))

struct WithSet {
    std::set<int> ids;
};
YADEC_DEFINE_SCHEMA(WithSet, (ids, R"(json:"ids")"))

struct Unregistered {
    int x = 0;
};

Sample decode_lenient(const std::string& input) {
    Sample s;
    json::Decoder dec(input);
    dec.allow_type_mismatch();
    dec.decode(s);
    return s;
}

} // namespace json_test

using namespace json_test;

// ═══════════════════════════════════════════════════════════════════════════════
// Mismatch recovery
// ═══════════════════════════════════════════════════════════════════════════════

struct MismatchCase {
    const char* name;
    const char* input;
    Sample (*expected)();
};

class MismatchRecovery : public ::testing::TestWithParam<MismatchCase> {};

TEST_P(MismatchRecovery, ZeroesOnlyTheMismatchedSlot) {
    const MismatchCase& tc = GetParam();
    Sample got;
    ASSERT_NO_THROW(got = decode_lenient(tc.input));
    EXPECT_EQ(got, tc.expected());
}

INSTANTIATE_TEST_SUITE_P(
    Json,
    MismatchRecovery,
    ::testing::Values(
        MismatchCase{"WholeRecord", R"("test")", [] { return Sample{}; }},
        MismatchCase{"StringGotNumber",
            R"({"string":123,"int":123,"float64":123.123,"object":{"foo":"bar"},"slice":[1,2,3]})",
            [] { auto s = base_sample(); s.str.clear(); return s; }},
        MismatchCase{"IntGotString",
            R"({"string":"test","int":"MISMATCHED_TYPE","float64":123.123,"object":{"foo":"bar"},"slice":[1,2,3]})",
            [] { auto s = base_sample(); s.integer = 0; return s; }},
        MismatchCase{"IntGotFloat",
            R"({"string":"test","int":123.123,"float64":123.123,"object":{"foo":"bar"},"slice":[1,2,3]})",
            [] { auto s = base_sample(); s.integer = 0; return s; }},
        MismatchCase{"FloatGotString",
            R"({"string":"test","int":123,"float64":"MISMATCHED_TYPE","object":{"foo":"bar"},"slice":[1,2,3]})",
            [] { auto s = base_sample(); s.float64 = 0; return s; }},
        MismatchCase{"ObjectGotString",
            R"({"string":"test","int":123,"float64":123.123,"object":"MISMATCHED_TYPE","slice":[1,2,3]})",
            [] { auto s = base_sample(); s.object.clear(); return s; }},
        MismatchCase{"SliceGotString",
            R"({"string":"test","int":123,"float64":123.123,"object":{"foo":"bar"},"slice":"MISMATCHED_TYPE"})",
            [] { auto s = base_sample(); s.slice.clear(); return s; }}),
    [](const ::testing::TestParamInfo<MismatchCase>& info) { return std::string(info.param.name); });

TEST(JsonDecoder, MixedMismatchesKeepSiblings) {
    Simple v;
    v.s = "old";
    json::Decoder dec(R"({"S":123,"I":"x","F":1.5})");
    dec.allow_type_mismatch();
    ASSERT_NO_THROW(dec.decode(v));
    EXPECT_EQ(v.s, "");
    EXPECT_EQ(v.i, 0);
    EXPECT_DOUBLE_EQ(v.f, 1.5);
}

TEST(JsonDecoder, ElementMismatchKeepsLength) {
    Person p;
    json::Decoder dec(R"({"scores":[1,"two",3,4.5,true]})");
    dec.allow_type_mismatch();
    dec.decode(p);
    EXPECT_EQ(p.scores, (std::vector<int>{1, 0, 3, 0, 0}));
}

TEST(JsonDecoder, NestedRecordMismatch) {
    Person p;
    json::Decoder dec(R"({"addresses":[{"city":"Oslo","zip":"x"},"nope",{"city":7,"zip":70000}]})");
    dec.allow_type_mismatch();
    dec.decode(p);
    ASSERT_EQ(p.addresses.size(), 3u);
    EXPECT_EQ(p.addresses[0].city, "Oslo");
    EXPECT_EQ(p.addresses[0].zip, 0);
    EXPECT_EQ(p.addresses[1].city, "");
    EXPECT_EQ(p.addresses[2].city, "");
    EXPECT_EQ(p.addresses[2].zip, 0);
}

TEST(JsonDecoder, OutOfRangeIntegerIsMismatch) {
    Person p;
    json::Decoder dec(R"({"small":300,"ratio":1e300})");
    dec.allow_type_mismatch();
    dec.decode(p);
    EXPECT_EQ(p.small, 0);
    EXPECT_EQ(p.ratio, 0.0f);
}

TEST(JsonDecoder, OptionalMismatch) {
    Person p;
    json::Decoder dec(R"({"age":"old","tags":"a,b","limits":[1],"home":5})");
    dec.allow_type_mismatch();
    dec.decode(p);
    EXPECT_FALSE(p.age.has_value());
    ASSERT_TRUE(p.tags.has_value());
    EXPECT_TRUE(p.tags->empty());
    EXPECT_FALSE(p.limits.has_value());
    EXPECT_FALSE(p.home);
}

TEST(JsonDecoder, MapValueMismatch) {
    Person p;
    json::Decoder dec(R"({"counts":{"a":1,"b":"x","c":3}})");
    dec.allow_type_mismatch();
    dec.decode(p);
    ASSERT_EQ(p.counts.size(), 3u);
    EXPECT_EQ(p.counts["a"], 1);
    EXPECT_EQ(p.counts["b"], 0);
    EXPECT_EQ(p.counts["c"], 3);
}

TEST(JsonDecoder, LenientDecodeIsIdempotent) {
    const char* input = R"({"string":5,"int":"x","float64":2.5,"object":[],"slice":{}})";
    Sample first = decode_lenient(input);
    Sample second = decode_lenient(input);
    EXPECT_EQ(first, second);
    EXPECT_DOUBLE_EQ(first.float64, 2.5);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Strict mode
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonDecoder, StrictReportsTypeError) {
    Simple v;
    json::Decoder dec(R"({"S":"ok","I":"x"})");
    try {
        dec.decode(v);
        FAIL() << "expected UnmarshalTypeError";
    } catch (const UnmarshalTypeError& e) {
        EXPECT_EQ(e.value(), "string");
        EXPECT_EQ(e.expected(), "int32");
        EXPECT_EQ(e.field(), "I");
        EXPECT_EQ(e.code(), make_error_code(errc::type_mismatch));
    }
    EXPECT_EQ(v.s, "ok");
}

TEST(JsonDecoder, StrictNumberDescription) {
    Simple v;
    try {
        json::decode(R"({"I":1.5})", v);
        FAIL() << "expected UnmarshalTypeError";
    } catch (const UnmarshalTypeError& e) {
        EXPECT_EQ(e.value(), "number 1.5");
    }
}

TEST(JsonDecoder, StrictFieldPath) {
    Person p;
    try {
        json::decode(R"({"addresses":[{"city":"a"},{"zip":"x"}]})", p);
        FAIL() << "expected UnmarshalTypeError";
    } catch (const UnmarshalTypeError& e) {
        EXPECT_EQ(e.field(), "addresses[1].zip");
        EXPECT_EQ(e.expected(), "uint16");
    }
}

TEST(JsonDecoder, StrictRootMismatch) {
    Sample s;
    try {
        json::decode(R"([1,2])", s);
        FAIL() << "expected UnmarshalTypeError";
    } catch (const UnmarshalTypeError& e) {
        EXPECT_EQ(e.value(), "array");
        EXPECT_EQ(e.expected(), "Sample");
        EXPECT_TRUE(e.field().empty());
    }
}

TEST(JsonDecoder, PolicyToggledBetweenCalls) {
    json::Decoder dec(R"({"I":"x"} {"I":"y"})");
    Simple v;
    dec.allow_type_mismatch();
    EXPECT_NO_THROW(dec.decode(v));
    dec.allow_type_mismatch(false);
    EXPECT_THROW(dec.decode(v), UnmarshalTypeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Fatal conditions
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonDecoder, SyntaxErrorNotSuppressed) {
    Sample s;
    json::Decoder dec(R"({"int": "x", "string": })");
    dec.allow_type_mismatch();
    EXPECT_THROW(dec.decode(s), SyntaxError);
}

TEST(JsonDecoder, SyntaxErrorInsideDiscardedValue) {
    Sample s;
    json::Decoder dec(R"({"int": {"a": [1, 2}, "string": "x"})");
    dec.allow_type_mismatch();
    EXPECT_THROW(dec.decode(s), SyntaxError);
}

TEST(JsonDecoder, SyntaxErrorInUnknownField) {
    Sample s;
    EXPECT_THROW(json::decode(R"({"unknown": [1,,2]})", s), SyntaxError);
}

TEST(JsonDecoder, UnterminatedContainers) {
    Sample s;
    std::error_code ec = json::try_decode(R"({"slice":[1,2)", s);
    EXPECT_EQ(ec, make_error_code(errc::unterminated_array));
    ec = json::try_decode(R"({"string":"a")", s);
    EXPECT_EQ(ec, make_error_code(errc::unterminated_object));
}

TEST(JsonDecoder, DepthLimit) {
    DecodeOptions opts;
    opts.max_depth = 4;
    Value v;
    EXPECT_NO_THROW(json::decode("[[[[1]]]]", v, opts));
    try {
        json::decode("[[[[[1]]]]]", v, opts);
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::max_depth_exceeded));
    }
}

TEST(JsonDecoder, DepthLimitAppliesToSkippedValues) {
    DecodeOptions opts;
    opts.max_depth = 3;
    opts.allow_type_mismatch = true;
    Sample s;
    EXPECT_THROW(json::decode(R"({"int":[[[[1]]]]})", s, opts), SyntaxError);
}

TEST(JsonDecoder, UnsupportedTypeAlwaysFatal) {
    WithSet w;
    DecodeOptions opts = DecodeOptions::lenient();
    EXPECT_THROW(json::decode(R"({"ids":[1]})", w, opts), UnsupportedTypeError);

    Unregistered u;
    EXPECT_THROW(json::decode("{}", u, opts), UnsupportedTypeError);
}

TEST(JsonDecoder, EmptyInput) {
    Sample s;
    EXPECT_EQ(json::try_decode("   ", s), make_error_code(errc::unexpected_end_of_input));
}

TEST(JsonDecoder, TrailingContent) {
    Sample s;
    EXPECT_EQ(json::try_decode(R"({} {})", s), make_error_code(errc::trailing_content));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Ordinary decoding
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonDecoder, FullDocument) {
    Person p = json::decode<Person>(R"({
        "name": "Ada",
        "addresses": [{"city": "London", "zip": 1815}],
        "scores": [1, 2, 3],
        "counts": {"x": 1},
        "age": 36,
        "home": {"city": "Marylebone"},
        "tags": [7],
        "limits": {"cpu": 2},
        "extra": {"k": [true, null, "s"]},
        "active": true,
        "ratio": 0.5,
        "small": -5
    })");
    EXPECT_EQ(p.name, "Ada");
    ASSERT_EQ(p.addresses.size(), 1u);
    EXPECT_EQ(p.addresses[0].zip, 1815);
    EXPECT_EQ(p.scores.size(), 3u);
    EXPECT_EQ(p.counts.at("x"), 1);
    EXPECT_EQ(p.age.value_or(0), 36);
    ASSERT_TRUE(p.home);
    EXPECT_EQ(p.home->city, "Marylebone");
    ASSERT_TRUE(p.tags.has_value());
    EXPECT_EQ(*p.tags, (std::vector<int>{7}));
    ASSERT_TRUE(p.limits.has_value());
    EXPECT_EQ(p.limits->at("cpu"), 2);
    EXPECT_TRUE(p.extra["k"][0].as_bool());
    EXPECT_TRUE(p.extra["k"][1].is_null());
    EXPECT_TRUE(p.active);
    EXPECT_FLOAT_EQ(p.ratio, 0.5f);
    EXPECT_EQ(p.small, -5);
}

TEST(JsonDecoder, CaseInsensitiveKeys) {
    Simple v;
    json::decode(R"({"s":"lower","i":4})", v);
    EXPECT_EQ(v.s, "lower");
    EXPECT_EQ(v.i, 4);

    DecodeOptions exact;
    exact.case_insensitive_keys = false;
    Simple w;
    json::decode(R"({"s":"lower","S":"upper"})", w, exact);
    EXPECT_EQ(w.s, "upper");
}

TEST(JsonDecoder, UnknownFieldsSkipped) {
    Simple v;
    json::decode(R"({"zzz":{"deep":[1,{"x":null}]},"I":9})", v);
    EXPECT_EQ(v.i, 9);
}

TEST(JsonDecoder, AbsentFieldsUntouched) {
    Person p;
    p.name = "kept";
    p.scores = {5};
    json::decode(R"({"active":true})", p);
    EXPECT_EQ(p.name, "kept");
    EXPECT_EQ(p.scores, (std::vector<int>{5}));
}

TEST(JsonDecoder, NullHandling) {
    Person p;
    p.name = "kept";
    p.scores = {1};
    p.age = 3;
    p.home = std::make_unique<Address>();
    json::decode(R"({"name":null,"scores":null,"age":null,"home":null})", p);
    EXPECT_EQ(p.name, "kept");
    EXPECT_TRUE(p.scores.empty());
    EXPECT_FALSE(p.age.has_value());
    EXPECT_FALSE(p.home);
}

TEST(JsonDecoder, SequenceReplacedMapMerged) {
    Person p;
    p.scores = {9, 9, 9};
    p.counts = {{"old", 1}};
    json::decode(R"({"scores":[1],"counts":{"new":2}})", p);
    EXPECT_EQ(p.scores, (std::vector<int>{1}));
    EXPECT_EQ(p.counts.size(), 2u);
}

TEST(JsonDecoder, ValueTarget) {
    Value v = json::decode<Value>(R"({"a":[1,"b",{"c":false}],"d":null})");
    ASSERT_TRUE(v.is_object());
    EXPECT_DOUBLE_EQ(v["a"][0].as_number(), 1.0);
    EXPECT_EQ(v["a"][1].as_string(), "b");
    EXPECT_FALSE(v["a"][2]["c"].as_bool());
    EXPECT_TRUE(v["d"].is_null());
}

TEST(JsonDecoder, ValueNumberOverflow) {
    Value v;
    EXPECT_THROW(json::decode("1e400", v), UnmarshalTypeError);
    DecodeOptions opts;
    opts.allow_type_mismatch = true;
    json::decode("1e400", v, opts);
    EXPECT_TRUE(v.is_null());
}

TEST(JsonDecoder, ValueStream) {
    json::Decoder dec(R"({"I":1} {"I":2}
        {"I":3})");
    std::vector<int> seen;
    while (dec.more()) {
        Simple v;
        dec.decode(v);
        seen.push_back(v.i);
    }
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
    EXPECT_NO_THROW(dec.expect_end());
}

TEST(JsonDecoder, FromStream) {
    std::istringstream in(R"({"S":"stream","I":11})");
    json::Decoder dec(in);
    Simple v;
    dec.decode(v);
    EXPECT_EQ(v.s, "stream");
    EXPECT_EQ(v.i, 11);
    EXPECT_FALSE(dec.more());
}

TEST(JsonDecoder, CommentsAndTrailingCommas) {
    const char* input = R"({
        // line comment
        "S": "x", /* block */
        "I": 2,
    })";
    Simple v;
    EXPECT_THROW(json::decode(input, v), SyntaxError);
    EXPECT_NO_THROW(json::decode(input, v, DecodeOptions::lenient()));
    EXPECT_EQ(v.i, 2);

    Person p;
    json::decode(R"({"scores":[1,2,],})", p, DecodeOptions::lenient());
    EXPECT_EQ(p.scores, (std::vector<int>{1, 2}));
}

TEST(JsonDecoder, TryDecodeReportsCodes) {
    Simple v;
    json::Decoder dec(R"({"I":"x"})");
    std::error_code ec = dec.try_decode(v);
    EXPECT_EQ(ec, make_error_code(errc::type_mismatch));
    EXPECT_EQ(ec.category().name(), std::string("yadec"));
}

TEST(JsonDecoder, InjectedCache) {
    DescriptorCache cache;
    json::Decoder dec(R"({"I":1})", cache);
    Simple v;
    dec.decode(v);
    EXPECT_TRUE(cache.contains<Simple>());
    EXPECT_EQ(v.i, 1);
}
