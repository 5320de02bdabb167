#pragma once

/// @file fwd.hpp
/// @author Aleksandr Loshkarev
/// @brief Forward declarations, kind enumerations and type aliases for yadec.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace yadec {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
struct Descriptor;
class DescriptorCache;
class DescriptorBuilder;

/// Intermediate value types (the type-erased document model)
enum class Type : uint8_t {
    Null   = 0,
    Bool   = 1,
    Number = 2,
    String = 3,
    Array  = 4,
    Object = 5
};

/// @brief Returns the string representation of a value type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Array:  return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

/// Shape of a decode target, one per descriptor alternative.
enum class Shape : uint8_t {
    Unsupported = 0,
    Scalar      = 1,
    Sequence    = 2,
    Mapping     = 3,
    Record      = 4,
    Optional    = 5,
    Any         = 6
};

/// @brief Returns the string representation of a target shape.
inline const char* shape_name(Shape s) noexcept {
    switch (s) {
        case Shape::Unsupported: return "unsupported";
        case Shape::Scalar:      return "scalar";
        case Shape::Sequence:    return "sequence";
        case Shape::Mapping:     return "mapping";
        case Shape::Record:      return "record";
        case Shape::Optional:    return "optional";
        case Shape::Any:         return "any";
    }
    return "unknown";
}

/// Leaf kinds a scalar target can hold.
enum class ScalarKind : uint8_t {
    String   = 0,
    Boolean  = 1,
    Integer  = 2,
    Unsigned = 3,
    Float    = 4
};

/// Kind of document node observed at the cursor, for both formats.
enum class NodeKind : uint8_t {
    Null    = 0,
    Boolean = 1,
    Number  = 2,
    String  = 3,
    Array   = 4,
    Object  = 5,
    Element = 6,   ///< XML child element
    Text    = 7    ///< XML character data
};

/// @brief Returns the string representation of a document node kind.
inline const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Null:    return "null";
        case NodeKind::Boolean: return "bool";
        case NodeKind::Number:  return "number";
        case NodeKind::String:  return "string";
        case NodeKind::Array:   return "array";
        case NodeKind::Object:  return "object";
        case NodeKind::Element: return "element";
        case NodeKind::Text:    return "text";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// Ordered collection of values.
using Array = std::vector<Value>;

/// Key-value pairs in document order; keys are unique (last write wins).
using Object = std::vector<std::pair<std::string, Value>>;

} // namespace yadec
