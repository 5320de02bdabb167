#pragma once

/// @file descriptor.hpp
/// @author Aleksandr Loshkarev
/// @brief Target descriptors: runtime metadata describing how to fill a C++ type.
///
/// A Descriptor is a closed tagged variant over the target shapes. Each
/// alternative carries only what its shape needs plus type-erased slot
/// operations generated by the TypeTraits in reflect.hpp. Slots are passed
/// as void* and are only ever interpreted through their own descriptor.
///
/// Descriptors are built once per C++ type by a DescriptorCache and are
/// immutable once published.

#include "config.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace yadec {

// =====================================================================
// Scalar
// =====================================================================

/// Converted leaf value handed to ScalarInfo::store. Only the member
/// matching the scalar kind is meaningful.
struct ScalarValue {
    bool        b = false;
    int64_t     i = 0;
    uint64_t    u = 0;
    double      d = 0.0;
    std::string s;
};

struct ScalarInfo {
    ScalarKind kind = ScalarKind::String;
    int64_t    min = 0;             ///< Integer: smallest storable value
    int64_t    max = 0;             ///< Integer: largest storable value
    uint64_t   umax = 0;            ///< Unsigned: largest storable value
    bool       single_precision = false;  ///< Float: target is float
    void (*store)(void* slot, ScalarValue&& v) = nullptr;
};

// =====================================================================
// Sequence / Mapping / Optional
// =====================================================================

struct SequenceInfo {
    const Descriptor* element = nullptr;
    /// Empty the sequence; it stays allocated.
    void (*clear)(void* slot) = nullptr;
    /// Append a zero element; the pointer is valid until the next append.
    void* (*append)(void* slot) = nullptr;
    /// Number of elements currently held.
    size_t (*size)(const void* slot) = nullptr;
};

struct MappingInfo {
    const Descriptor* value = nullptr;
    /// Reset @p key's entry to a fresh zero value and return it.
    void* (*entry)(void* slot, std::string&& key) = nullptr;
};

struct OptionalInfo {
    const Descriptor* inner = nullptr;
    /// Return the inner slot, engaging it with a zero value when empty.
    /// An engaged value is kept, so repeated XML elements can append to it.
    void* (*engage)(void* slot) = nullptr;
};

// =====================================================================
// Record
// =====================================================================

/// Where an XML field is read from.
enum class Placement : uint8_t {
    Element   = 0,   ///< Child element (possibly behind wrapper elements)
    Attribute = 1,   ///< Attribute of the record's element
    CharData  = 2    ///< Character data directly inside the record's element
};

struct FieldInfo {
    std::string identifier;                ///< Member name in the C++ type
    std::string json_name;
    bool        json_ignored = false;
    std::string xml_name;                  ///< Leaf element or attribute name
    std::vector<std::string> xml_parents;  ///< Wrapper elements, outermost first
    Placement   placement = Placement::Element;
    bool        xml_ignored = false;
    const Descriptor* type = nullptr;
    std::function<void*(void*)> locate;    ///< record slot -> member slot
};

namespace detail {

inline bool ascii_iequal(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

} // namespace detail

struct RecordInfo {
    std::string xml_name;                  ///< Expected element name; empty = any
    std::vector<FieldInfo> fields;

    /// Hash index over JSON names, built for records above the threshold.
    std::unordered_map<std::string_view, size_t> json_index;

    /// @brief Resolve a JSON object key to a field.
    /// Exact match first, then (when @p fold is set) ASCII case-insensitive.
    [[nodiscard]] const FieldInfo* find_json(std::string_view key, bool fold) const {
        if (!json_index.empty()) {
            auto it = json_index.find(key);
            if (it != json_index.end()) return &fields[it->second];
        } else {
            for (const auto& f : fields) {
                if (!f.json_ignored && f.json_name == key) return &f;
            }
        }
        if (fold) {
            for (const auto& f : fields) {
                if (!f.json_ignored && detail::ascii_iequal(f.json_name, key)) return &f;
            }
        }
        return nullptr;
    }

    void build_index() {
        json_index.clear();
        if (fields.size() < YADEC_FIELD_LINEAR_THRESHOLD) return;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (!fields[i].json_ignored) json_index.emplace(fields[i].json_name, i);
        }
    }
};

// =====================================================================
// Descriptor
// =====================================================================

struct Descriptor {
    Shape shape = Shape::Unsupported;
    std::string type_name;
    /// Write the type's zero value into the slot.
    void (*reset)(void* slot) = nullptr;
    std::variant<std::monostate, ScalarInfo, SequenceInfo, MappingInfo,
                 RecordInfo, OptionalInfo> info;

    [[nodiscard]] const ScalarInfo&   scalar()   const { return std::get<ScalarInfo>(info); }
    [[nodiscard]] const SequenceInfo& sequence() const { return std::get<SequenceInfo>(info); }
    [[nodiscard]] const MappingInfo&  mapping()  const { return std::get<MappingInfo>(info); }
    [[nodiscard]] const RecordInfo&   record()   const { return std::get<RecordInfo>(info); }
    [[nodiscard]] const OptionalInfo& optional() const { return std::get<OptionalInfo>(info); }
};

} // namespace yadec
