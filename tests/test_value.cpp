/// @file test_value.cpp
/// @brief Unit tests for yadec::Value: constructors, types, access and mutation.

#include <yadec/yadec.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace yadec;

// ═══════════════════════════════════════════════════════════════════════════════
// Constructors and type checking
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, DefaultConstructorIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type(), Type::Null);
}

TEST(Value, NullptrConstructor) {
    Value v(nullptr);
    EXPECT_TRUE(v.is_null());
}

TEST(Value, BoolConstructor) {
    Value t(true);
    Value f(false);

    EXPECT_TRUE(t.is_bool());
    EXPECT_TRUE(f.is_bool());
    EXPECT_EQ(t.as_bool(), true);
    EXPECT_EQ(f.as_bool(), false);
    EXPECT_EQ(t.type(), Type::Bool);
}

TEST(Value, NumbersAreDoubles) {
    Value i(42);
    Value d(3.14);

    EXPECT_TRUE(i.is_number());
    EXPECT_TRUE(d.is_number());
    EXPECT_DOUBLE_EQ(i.as_number(), 42.0);
    EXPECT_DOUBLE_EQ(d.as_number(), 3.14);
    EXPECT_EQ(i, Value(42.0));
}

TEST(Value, StringConstructors) {
    Value v1("hello");
    EXPECT_TRUE(v1.is_string());
    EXPECT_EQ(v1.as_string(), "hello");

    std::string s = "world";
    Value v2(s);
    EXPECT_EQ(v2.as_string(), "world");

    Value v3(std::string_view("view"));
    EXPECT_EQ(v3.as_string(), "view");

    const char* none = nullptr;
    Value v4(none);
    EXPECT_TRUE(v4.is_null());
}

TEST(Value, ArrayConstructor) {
    Array arr = {Value(1), Value(2), Value(3)};
    Value v(arr);

    EXPECT_TRUE(v.is_array());
    EXPECT_EQ(v.size(), 3u);
    EXPECT_DOUBLE_EQ(v[0].as_number(), 1.0);
    EXPECT_DOUBLE_EQ(v[2].as_number(), 3.0);
}

TEST(Value, ObjectConstructor) {
    Object obj = {{"name", Value("test")}, {"value", Value(42)}};
    Value v(obj);

    EXPECT_TRUE(v.is_object());
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v["name"].as_string(), "test");
    EXPECT_DOUBLE_EQ(v["value"].as_number(), 42.0);
}

TEST(Value, StaticFactories) {
    auto arr = Value::array();
    auto obj = Value::object();

    EXPECT_TRUE(arr.is_array());
    EXPECT_TRUE(obj.is_object());
    EXPECT_EQ(arr.size(), 0u);
    EXPECT_EQ(obj.size(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Access errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, WrongTypeAccessThrows) {
    Value v("text");
    EXPECT_THROW(v.as_bool(), TypeError);
    EXPECT_THROW(v.as_number(), TypeError);
    EXPECT_THROW(v.as_array(), TypeError);
    EXPECT_THROW(v.as_object(), TypeError);
}

TEST(Value, TypeErrorCarriesCode) {
    Value v(true);
    try {
        (void)v.as_string();
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::type_mismatch));
        EXPECT_NE(std::string(e.what()).find("expected string, got bool"), std::string::npos);
    }
}

TEST(Value, IndexOutOfRangeThrows) {
    Value v(Array{Value(1)});
    EXPECT_THROW(v[1], OutOfRangeError);
}

TEST(Value, IntIndexSelectsArrayElement) {
    const Value v(Array{Value("a"), Value("b")});
    const int i = 1;
    EXPECT_EQ(v[0].as_string(), "a");
    EXPECT_EQ(&v[i], &v[size_t{1}]);
    EXPECT_THROW(v[-1], OutOfRangeError);
}

TEST(Value, MissingKeyThrows) {
    Value v = Value::object();
    EXPECT_THROW(v["missing"], OutOfRangeError);
    EXPECT_EQ(v.find("missing"), nullptr);
    EXPECT_FALSE(v.contains("missing"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Mutation
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, PushBack) {
    Value v = Value::array();
    v.push_back(Value("a"));
    v.push_back(Value(2));
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0].as_string(), "a");
}

TEST(Value, InsertReplacesInPlace) {
    Value v = Value::object();
    v.insert("a", Value(1));
    v.insert("b", Value(2));
    v.insert("a", Value(3));

    ASSERT_EQ(v.size(), 2u);
    const Object& obj = v.as_object();
    EXPECT_EQ(obj[0].first, "a");
    EXPECT_DOUBLE_EQ(obj[0].second.as_number(), 3.0);
    EXPECT_EQ(obj[1].first, "b");
}

TEST(Value, PushBackOnNonArrayThrows) {
    Value v(1);
    EXPECT_THROW(v.push_back(Value(2)), TypeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Comparison
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, Equality) {
    EXPECT_EQ(Value(), Value(nullptr));
    EXPECT_EQ(Value("x"), Value(std::string("x")));
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_NE(Value(true), Value(false));

    Value a(Object{{"k", Value(Array{Value(1), Value("two")})}});
    Value b(Object{{"k", Value(Array{Value(1), Value("two")})}});
    EXPECT_EQ(a, b);
}

TEST(Value, TypeNames) {
    EXPECT_STREQ(type_name(Type::Null), "null");
    EXPECT_STREQ(type_name(Type::Number), "number");
    EXPECT_STREQ(type_name(Type::Object), "object");
}
