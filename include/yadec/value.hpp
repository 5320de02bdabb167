#pragma once

/// @file value.hpp
/// @author Aleksandr Loshkarev
/// @brief Value: the type-erased intermediate document model.
///
/// A decode target of type yadec::Value accepts any document node. JSON
/// numbers are held as double, XML element content as its character data.
/// Objects keep keys in document order; inserting an existing key replaces
/// its value in place (last write wins).

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace yadec {

class Value {
public:
    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool v) noexcept : kind_(Type::Bool), b_(v) {}
    Value(int v) noexcept : kind_(Type::Number), d_(static_cast<double>(v)) {}
    Value(double v) noexcept : kind_(Type::Number), d_(v) {}
    Value(const char* v) : kind_(v ? Type::String : Type::Null), s_(v ? v : "") {}
    Value(std::string_view v) : kind_(Type::String), s_(v) {}
    Value(std::string v) noexcept : kind_(Type::String), s_(std::move(v)) {}
    Value(Array v) noexcept : kind_(Type::Array), arr_(std::move(v)) {}
    Value(Object v) noexcept : kind_(Type::Object), obj_(std::move(v)) {}

    [[nodiscard]] static Value array() { return Value(Array{}); }
    [[nodiscard]] static Value object() { return Value(Object{}); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()   const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == Type::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()  const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Type::Object; }

    bool as_bool() const {
        if (YADEC_UNLIKELY(!is_bool()))
            throw TypeError("expected bool, got " + std::string(type_name(type())));
        return b_;
    }
    double as_number() const {
        if (YADEC_UNLIKELY(!is_number()))
            throw TypeError("expected number, got " + std::string(type_name(type())));
        return d_;
    }
    [[nodiscard]] const std::string& as_string() const {
        if (YADEC_UNLIKELY(!is_string()))
            throw TypeError("expected string, got " + std::string(type_name(type())));
        return s_;
    }
    [[nodiscard]] const Array& as_array() const {
        if (YADEC_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name(type())));
        return arr_;
    }
    Array& as_array() {
        if (YADEC_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name(type())));
        return arr_;
    }
    [[nodiscard]] const Object& as_object() const {
        if (YADEC_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name(type())));
        return obj_;
    }
    Object& as_object() {
        if (YADEC_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name(type())));
        return obj_;
    }

    const Value& operator[](size_t index) const {
        const auto& a = as_array();
        if (YADEC_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) + " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }
    const Value& operator[](std::string_view key) const {
        const Value* p = find(key);
        if (YADEC_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
        return *p;
    }
    const Value& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] const Value* find(std::string_view key) const {
        if (!is_object()) return nullptr;
        for (const auto& [k, v] : obj_) {
            if (k == key) return &v;
        }
        return nullptr;
    }
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return arr_.size();
        if (is_object()) return obj_.size();
        return 0;
    }

    void push_back(Value v) { as_array().push_back(std::move(v)); }

    /// Insert or replace; an existing key keeps its position.
    void insert(std::string key, Value v) {
        auto& obj = as_object();
        for (auto& entry : obj) {
            if (entry.first == key) {
                entry.second = std::move(v);
                return;
            }
        }
        obj.emplace_back(std::move(key), std::move(v));
    }

    [[nodiscard]] bool operator==(const Value& other) const {
        if (kind_ != other.kind_) return false;
        switch (kind_) {
            case Type::Null:   return true;
            case Type::Bool:   return b_ == other.b_;
            case Type::Number: return d_ == other.d_;
            case Type::String: return s_ == other.s_;
            case Type::Array:  return arr_ == other.arr_;
            case Type::Object: return obj_ == other.obj_;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Type kind_ = Type::Null;
    bool b_ = false;
    double d_ = 0.0;
    std::string s_;
    Array arr_;
    Object obj_;
};

} // namespace yadec
