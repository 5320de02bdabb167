#pragma once

/// @file reflect.hpp
/// @author Aleksandr Loshkarev
/// @brief Compile-time type traits that build runtime Target Descriptors.
///
/// Provides:
///   - TypeTraits<T> for scalars, std::string, std::vector, string-keyed maps,
///     std::optional, std::unique_ptr and yadec::Value
///   - RecordBuilder<T> and the YADEC_DEFINE_SCHEMA() / YADEC_DEFINE_XML_SCHEMA()
///     macros for user records
///   - DescriptorBuilder, which resolves nested types while a descriptor
///     graph is under construction
///
/// @example
/// @code
///   struct Item {
///       std::string name;
///       std::vector<int> sizes;
///       int id;
///   };
///   YADEC_DEFINE_SCHEMA(Item,
///       (name,  R"(json:"name" xml:"name")"),
///       (sizes, R"(json:"sizes" xml:"sizes>size")"),
///       (id,    R"(json:"id" xml:"id,attr")"))
/// @endcode
///
/// Any other type resolves to an Unsupported descriptor; decoding into it
/// throws UnsupportedTypeError.

#include "descriptor.hpp"
#include "error.hpp"
#include "tag.hpp"
#include "value.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace yadec {

template <typename T, typename Enable = void>
struct TypeTraits;

// =====================================================================
// DescriptorBuilder
// =====================================================================

/// @brief Builds one descriptor graph.
///
/// Every type reached while building goes into a pending table before its
/// traits run, so self-referential records resolve to the descriptor that
/// is still being filled. Types already published in the cache are reused.
class DescriptorBuilder {
public:
    using PendingMap = std::unordered_map<std::type_index, std::unique_ptr<Descriptor>>;
    using Lookup = std::function<const Descriptor*(std::type_index)>;

    explicit DescriptorBuilder(Lookup published)
        : published_(std::move(published)) {}

    DescriptorBuilder(const DescriptorBuilder&) = delete;
    DescriptorBuilder& operator=(const DescriptorBuilder&) = delete;

    template <typename T>
    const Descriptor* resolve() {
        const std::type_index key(typeid(T));
        if (const Descriptor* d = published_(key)) return d;
        auto it = pending_.find(key);
        if (it != pending_.end()) return it->second.get();

        auto owned = std::make_unique<Descriptor>();
        Descriptor* d = owned.get();
        pending_.emplace(key, std::move(owned));
        TypeTraits<T>::describe(*d, *this);
        return d;
    }

    /// Hand over every descriptor built so far.
    [[nodiscard]] PendingMap take_pending() noexcept { return std::move(pending_); }

private:
    Lookup published_;
    PendingMap pending_;
};

namespace detail {

template <typename T>
void reset_slot(void* slot) {
    *static_cast<T*>(slot) = T{};
}

} // namespace detail

// =====================================================================
// Unsupported (primary template)
// =====================================================================

template <typename T, typename Enable>
struct TypeTraits {
    static void describe(Descriptor& d, DescriptorBuilder&) {
        d.shape = Shape::Unsupported;
        d.type_name = typeid(T).name();
    }
};

// =====================================================================
// Scalars
// =====================================================================

template <>
struct TypeTraits<bool> {
    static void describe(Descriptor& d, DescriptorBuilder&) {
        ScalarInfo info;
        info.kind = ScalarKind::Boolean;
        info.store = [](void* slot, ScalarValue&& v) { *static_cast<bool*>(slot) = v.b; };
        d.shape = Shape::Scalar;
        d.type_name = "bool";
        d.reset = &detail::reset_slot<bool>;
        d.info = info;
    }
};

template <typename T>
struct TypeTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static void describe(Descriptor& d, DescriptorBuilder&) {
        ScalarInfo info;
        const std::string bits = std::to_string(sizeof(T) * 8);
        if constexpr (std::is_signed_v<T>) {
            info.kind = ScalarKind::Integer;
            info.min = static_cast<int64_t>(std::numeric_limits<T>::min());
            info.max = static_cast<int64_t>(std::numeric_limits<T>::max());
            info.store = [](void* slot, ScalarValue&& v) { *static_cast<T*>(slot) = static_cast<T>(v.i); };
            d.type_name = "int" + bits;
        } else {
            info.kind = ScalarKind::Unsigned;
            info.umax = static_cast<uint64_t>(std::numeric_limits<T>::max());
            info.store = [](void* slot, ScalarValue&& v) { *static_cast<T*>(slot) = static_cast<T>(v.u); };
            d.type_name = "uint" + bits;
        }
        d.shape = Shape::Scalar;
        d.reset = &detail::reset_slot<T>;
        d.info = info;
    }
};

template <typename T>
struct TypeTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static void describe(Descriptor& d, DescriptorBuilder&) {
        ScalarInfo info;
        info.kind = ScalarKind::Float;
        info.single_precision = sizeof(T) <= sizeof(float);
        info.store = [](void* slot, ScalarValue&& v) { *static_cast<T*>(slot) = static_cast<T>(v.d); };
        d.shape = Shape::Scalar;
        d.type_name = info.single_precision ? "float32" : "float64";
        d.reset = &detail::reset_slot<T>;
        d.info = info;
    }
};

template <>
struct TypeTraits<std::string> {
    static void describe(Descriptor& d, DescriptorBuilder&) {
        ScalarInfo info;
        info.kind = ScalarKind::String;
        info.store = [](void* slot, ScalarValue&& v) { *static_cast<std::string*>(slot) = std::move(v.s); };
        d.shape = Shape::Scalar;
        d.type_name = "string";
        d.reset = &detail::reset_slot<std::string>;
        d.info = info;
    }
};

template <>
struct TypeTraits<Value> {
    static void describe(Descriptor& d, DescriptorBuilder&) {
        d.shape = Shape::Any;
        d.type_name = "any";
        d.reset = &detail::reset_slot<Value>;
    }
};

// =====================================================================
// Containers
// =====================================================================

// std::vector<bool> has no addressable elements and stays Unsupported.
template <typename T, typename A>
struct TypeTraits<std::vector<T, A>, std::enable_if_t<!std::is_same_v<T, bool>>> {
    using Vec = std::vector<T, A>;

    static void describe(Descriptor& d, DescriptorBuilder& b) {
        d.shape = Shape::Sequence;
        d.reset = &detail::reset_slot<Vec>;
        SequenceInfo info;
        info.element = b.resolve<T>();
        info.clear = [](void* slot) { static_cast<Vec*>(slot)->clear(); };
        info.append = [](void* slot) -> void* {
            auto& v = *static_cast<Vec*>(slot);
            v.emplace_back();
            return &v.back();
        };
        info.size = [](const void* slot) { return static_cast<const Vec*>(slot)->size(); };
        d.type_name = "[]" + info.element->type_name;
        d.info = info;
    }
};

namespace detail {

template <typename Map>
void describe_mapping(Descriptor& d, DescriptorBuilder& b) {
    using V = typename Map::mapped_type;
    d.shape = Shape::Mapping;
    d.reset = [](void* slot) { static_cast<Map*>(slot)->clear(); };
    MappingInfo info;
    info.value = b.resolve<V>();
    info.entry = [](void* slot, std::string&& key) -> void* {
        auto& ref = (*static_cast<Map*>(slot))[std::move(key)];
        ref = V{};
        return &ref;
    };
    d.type_name = "map[string]" + info.value->type_name;
    d.info = info;
}

} // namespace detail

template <typename V, typename C, typename A>
struct TypeTraits<std::map<std::string, V, C, A>> {
    static void describe(Descriptor& d, DescriptorBuilder& b) {
        detail::describe_mapping<std::map<std::string, V, C, A>>(d, b);
    }
};

template <typename V, typename H, typename E, typename A>
struct TypeTraits<std::unordered_map<std::string, V, H, E, A>> {
    static void describe(Descriptor& d, DescriptorBuilder& b) {
        detail::describe_mapping<std::unordered_map<std::string, V, H, E, A>>(d, b);
    }
};

template <typename T>
struct TypeTraits<std::optional<T>> {
    static void describe(Descriptor& d, DescriptorBuilder& b) {
        d.shape = Shape::Optional;
        d.reset = [](void* slot) { static_cast<std::optional<T>*>(slot)->reset(); };
        OptionalInfo info;
        info.inner = b.resolve<T>();
        info.engage = [](void* slot) -> void* {
            auto& o = *static_cast<std::optional<T>*>(slot);
            if (!o) o.emplace();
            return &*o;
        };
        d.type_name = "*" + info.inner->type_name;
        d.info = info;
    }
};

template <typename T>
struct TypeTraits<std::unique_ptr<T>> {
    static void describe(Descriptor& d, DescriptorBuilder& b) {
        d.shape = Shape::Optional;
        d.reset = [](void* slot) { static_cast<std::unique_ptr<T>*>(slot)->reset(); };
        OptionalInfo info;
        info.inner = b.resolve<T>();
        info.engage = [](void* slot) -> void* {
            auto& p = *static_cast<std::unique_ptr<T>*>(slot);
            if (!p) p = std::make_unique<T>();
            return p.get();
        };
        d.type_name = "*" + info.inner->type_name;
        d.info = info;
    }
};

// =====================================================================
// Records
// =====================================================================

/// @brief Collects the fields of record type T.
///
/// Used by the functions YADEC_DEFINE_SCHEMA generates; can also be
/// driven by hand from a `yadec_describe(RecordBuilder<T>&)` overload
/// found by ADL.
template <typename T>
class RecordBuilder {
public:
    RecordBuilder(Descriptor& d, DescriptorBuilder& b)
        : descriptor_(d), builder_(b) {}

    RecordInfo& info() { return std::get<RecordInfo>(descriptor_.info); }

    RecordBuilder& name(std::string_view type_name) {
        descriptor_.type_name = std::string(type_name);
        return *this;
    }

    /// Expected XML element name for this record.
    RecordBuilder& xml_name(std::string_view element) {
        info().xml_name = std::string(element);
        return *this;
    }

    template <typename M>
    RecordBuilder& field(std::string_view identifier, std::string_view tag, M T::*member) {
        FieldInfo f;
        f.identifier = std::string(identifier);
        f.type = builder_.resolve<M>();
        f.locate = [member](void* record) -> void* {
            return &(static_cast<T*>(record)->*member);
        };
        apply_json_tag(f, tag);
        apply_xml_tag(f, tag);

        if (!f.xml_ignored && f.placement != Placement::Element && !holds_text(*f.type)) {
            throw UnsupportedTypeError(descriptor_.type_name + "." + f.identifier + ": " +
                                       f.type->type_name +
                                       " cannot hold an XML attribute or character data");
        }
        for (const auto& other : info().fields) {
            if (!f.json_ignored && !other.json_ignored && other.json_name == f.json_name) {
                throw UnsupportedTypeError(descriptor_.type_name + ": duplicate JSON field name \"" +
                                           f.json_name + "\"");
            }
            if (!f.xml_ignored && !other.xml_ignored && xml_conflict(f, other)) {
                throw UnsupportedTypeError(descriptor_.type_name + ": XML name \"" + xml_path(f) +
                                           "\" of " + f.identifier + " conflicts with \"" +
                                           xml_path(other) + "\" of " + other.identifier);
            }
        }
        info().fields.push_back(std::move(f));
        return *this;
    }

private:
    static std::string xml_path(const FieldInfo& f) {
        std::string out;
        for (const auto& p : f.xml_parents) {
            out += p;
            out += '>';
        }
        return out + f.xml_name;
    }

    /// Attributes clash on equal names. Elements clash when one path is a
    /// prefix of the other, since the shorter one would capture the element.
    static bool xml_conflict(const FieldInfo& a, const FieldInfo& b) {
        if (a.placement != b.placement) return false;
        if (a.placement == Placement::Attribute) return a.xml_name == b.xml_name;
        if (a.placement != Placement::Element) return false;

        const FieldInfo& shorter = a.xml_parents.size() <= b.xml_parents.size() ? a : b;
        const FieldInfo& longer = &shorter == &a ? b : a;
        for (size_t i = 0; i < shorter.xml_parents.size(); ++i) {
            if (shorter.xml_parents[i] != longer.xml_parents[i]) return false;
        }
        const size_t depth = shorter.xml_parents.size();
        const std::string& next = depth < longer.xml_parents.size() ? longer.xml_parents[depth]
                                                                    : longer.xml_name;
        return next == shorter.xml_name;
    }

    /// Scalars, Value, and optionals of those.
    static bool holds_text(const Descriptor& d) noexcept {
        if (d.shape == Shape::Scalar || d.shape == Shape::Any) return true;
        if (d.shape != Shape::Optional) return false;
        const auto* opt = std::get_if<OptionalInfo>(&d.info);
        return opt && opt->inner && holds_text(*opt->inner);
    }

    static void apply_json_tag(FieldInfo& f, std::string_view tag) {
        f.json_name = f.identifier;
        auto value = lookup_tag(tag, "json");
        if (!value) return;
        if (*value == "-") {
            f.json_ignored = true;
            return;
        }
        TagValue tv = parse_tag_value(*value);
        if (!tv.name.empty()) f.json_name = std::string(tv.name);
    }

    void apply_xml_tag(FieldInfo& f, std::string_view tag) const {
        f.xml_name = f.identifier;
        auto value = lookup_tag(tag, "xml");
        if (!value) return;
        if (*value == "-") {
            f.xml_ignored = true;
            return;
        }
        TagValue tv = parse_tag_value(*value);
        if (tv.has_option("attr")) {
            f.placement = Placement::Attribute;
        } else if (tv.has_option("chardata")) {
            f.placement = Placement::CharData;
        }

        if (tv.name.empty()) return;
        std::vector<std::string> path = tv.path();
        for (const auto& segment : path) {
            if (segment.empty()) {
                throw UnsupportedTypeError(descriptor_.type_name + "." + f.identifier +
                                           ": invalid XML tag path \"" + std::string(tv.name) + "\"");
            }
        }
        if (path.size() > 1 && f.placement != Placement::Element) {
            throw UnsupportedTypeError(descriptor_.type_name + "." + f.identifier +
                                       ": XML tag path \"" + std::string(tv.name) +
                                       "\" is only valid for element fields");
        }
        f.xml_name = std::move(path.back());
        path.pop_back();
        f.xml_parents = std::move(path);
    }

    Descriptor& descriptor_;
    DescriptorBuilder& builder_;
};

namespace detail {

// Only class types are probed: RecordBuilder<T> is ill-formed for anything else.
template <typename T, typename = void>
struct has_schema : std::false_type {};

template <typename T>
struct has_schema<T, std::void_t<decltype(yadec_describe(std::declval<RecordBuilder<T>&>()))>>
    : std::true_type {};

} // namespace detail

template <typename T>
struct TypeTraits<T, std::enable_if_t<std::conjunction_v<std::is_class<T>, detail::has_schema<T>>>> {
    static void describe(Descriptor& d, DescriptorBuilder& b) {
        // Shape and variant first: nested resolves of T must see a record.
        d.shape = Shape::Record;
        d.type_name = typeid(T).name();
        d.reset = &detail::reset_slot<T>;
        d.info = RecordInfo{};
        RecordBuilder<T> rb(d, b);
        yadec_describe(rb);
        rb.info().build_index();
    }
};

} // namespace yadec

// =====================================================================
// Preprocessor FOREACH utilities (support up to 20 fields)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define YADEC_PP_CAT_I(a, b) a##b
#define YADEC_PP_CAT(a, b) YADEC_PP_CAT_I(a, b)

#define YADEC_PP_NARG_I(...) \
    YADEC_PP_ARG_N(__VA_ARGS__, \
    20,19,18,17,16,15,14,13,12,11,10,9,8,7,6,5,4,3,2,1,0)
#define YADEC_PP_ARG_N( \
    _1,_2,_3,_4,_5,_6,_7,_8,_9,_10, \
    _11,_12,_13,_14,_15,_16,_17,_18,_19,_20, N,...) N

#define YADEC_PP_FE_1(m,x) m(x)
#define YADEC_PP_FE_2(m,x,...) m(x) YADEC_PP_FE_1(m,__VA_ARGS__)
#define YADEC_PP_FE_3(m,x,...) m(x) YADEC_PP_FE_2(m,__VA_ARGS__)
#define YADEC_PP_FE_4(m,x,...) m(x) YADEC_PP_FE_3(m,__VA_ARGS__)
#define YADEC_PP_FE_5(m,x,...) m(x) YADEC_PP_FE_4(m,__VA_ARGS__)
#define YADEC_PP_FE_6(m,x,...) m(x) YADEC_PP_FE_5(m,__VA_ARGS__)
#define YADEC_PP_FE_7(m,x,...) m(x) YADEC_PP_FE_6(m,__VA_ARGS__)
#define YADEC_PP_FE_8(m,x,...) m(x) YADEC_PP_FE_7(m,__VA_ARGS__)
#define YADEC_PP_FE_9(m,x,...) m(x) YADEC_PP_FE_8(m,__VA_ARGS__)
#define YADEC_PP_FE_10(m,x,...) m(x) YADEC_PP_FE_9(m,__VA_ARGS__)
#define YADEC_PP_FE_11(m,x,...) m(x) YADEC_PP_FE_10(m,__VA_ARGS__)
#define YADEC_PP_FE_12(m,x,...) m(x) YADEC_PP_FE_11(m,__VA_ARGS__)
#define YADEC_PP_FE_13(m,x,...) m(x) YADEC_PP_FE_12(m,__VA_ARGS__)
#define YADEC_PP_FE_14(m,x,...) m(x) YADEC_PP_FE_13(m,__VA_ARGS__)
#define YADEC_PP_FE_15(m,x,...) m(x) YADEC_PP_FE_14(m,__VA_ARGS__)
#define YADEC_PP_FE_16(m,x,...) m(x) YADEC_PP_FE_15(m,__VA_ARGS__)
#define YADEC_PP_FE_17(m,x,...) m(x) YADEC_PP_FE_16(m,__VA_ARGS__)
#define YADEC_PP_FE_18(m,x,...) m(x) YADEC_PP_FE_17(m,__VA_ARGS__)
#define YADEC_PP_FE_19(m,x,...) m(x) YADEC_PP_FE_18(m,__VA_ARGS__)
#define YADEC_PP_FE_20(m,x,...) m(x) YADEC_PP_FE_19(m,__VA_ARGS__)

#define YADEC_PP_FOREACH(m,...) \
    YADEC_PP_CAT(YADEC_PP_FE_, YADEC_PP_NARG_I(__VA_ARGS__))(m, __VA_ARGS__)

// Field-level macros: each field is a parenthesized (member, "tag") pair.
#define YADEC_DETAIL_FIELD_I(member, tag) \
    r.field(#member, tag, &yadec_record_type::member);
#define YADEC_DETAIL_FIELD(pair) YADEC_DETAIL_FIELD_I pair

/// Register a record type; use in the same namespace as the type.
#define YADEC_DEFINE_SCHEMA(Type, ...) \
    inline void yadec_describe(::yadec::RecordBuilder<Type>& r) { \
        using yadec_record_type = Type; \
        r.name(#Type); \
        YADEC_PP_FOREACH(YADEC_DETAIL_FIELD, __VA_ARGS__) \
    }

/// Register a record type whose XML element must be named @p Element.
#define YADEC_DEFINE_XML_SCHEMA(Type, Element, ...) \
    inline void yadec_describe(::yadec::RecordBuilder<Type>& r) { \
        using yadec_record_type = Type; \
        r.name(#Type); \
        r.xml_name(Element); \
        YADEC_PP_FOREACH(YADEC_DETAIL_FIELD, __VA_ARGS__) \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
