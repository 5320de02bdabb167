#pragma once

/// @file scalar.hpp
/// @author Aleksandr Loshkarev
/// @brief Leaf conversions from document text to scalar targets.
///
/// JSON number literals arrive already validated by the lexer; XML text
/// arrives raw. A conversion that fails (wrong grammar, fraction or exponent
/// for an integer, value outside the target's range) returns false and the
/// caller hands the node to the mismatch policy.

#include "../descriptor.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace yadec::detail {

/// @brief Strip ASCII whitespace from both ends.
inline std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kSpace = " \t\r\n\v\f";
    const size_t first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    const size_t last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

inline bool is_blank(std::string_view s) noexcept { return trim(s).empty(); }

// ─── Primitive parsers ─────────────────────────────────────────────────

/// @brief Parse a whole string as a base-10 signed integer ('+' allowed).
inline bool parse_int64(std::string_view s, int64_t& out) noexcept {
    if (s.size() > 1 && s[0] == '+' && s[1] != '-') s.remove_prefix(1);
    if (s.empty()) return false;
    const char* end = s.data() + s.size();
    auto [p, ec] = std::from_chars(s.data(), end, out);
    return ec == std::errc{} && p == end;
}

/// @brief Parse a whole string as a base-10 unsigned integer (no sign).
inline bool parse_uint64(std::string_view s, uint64_t& out) noexcept {
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    const char* end = s.data() + s.size();
    auto [p, ec] = std::from_chars(s.data(), end, out);
    return ec == std::errc{} && p == end;
}

/// @brief Parse a whole string as a double; overflow to infinity fails.
inline bool parse_double(std::string_view s, double& out) {
    if (s.empty()) return false;
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    {
        std::string_view body = s;
        if (body.size() > 1 && body[0] == '+' && body[1] != '-') body.remove_prefix(1);
        const char* end = body.data() + body.size();
        auto [p, ec] = std::from_chars(body.data(), end, out);
        if (ec == std::errc{} && p == end) return true;
        if (ec != std::errc::result_out_of_range) return false;
    }
#endif
    // Full-precision fallback; also sorts underflow (rounds to zero, accepted)
    // from overflow (infinity, rejected).
    std::string buf(s);
    char* end_ptr = nullptr;
    out = std::strtod(buf.c_str(), &end_ptr);
    if (end_ptr != buf.c_str() + buf.size()) return false;
    if (std::isinf(out) && s.find_first_of("0123456789") != std::string_view::npos) return false;
    return true;
}

/// @brief Boolean spellings accepted in XML text.
inline bool parse_bool(std::string_view s, bool& out) noexcept {
    if (s == "1" || s == "t" || s == "T" || s == "true" || s == "TRUE" || s == "True") {
        out = true;
        return true;
    }
    if (s == "0" || s == "f" || s == "F" || s == "false" || s == "FALSE" || s == "False") {
        out = false;
        return true;
    }
    return false;
}

// ─── Numeric range checks ──────────────────────────────────────────────

inline bool convert_integer(const ScalarInfo& info, std::string_view s, ScalarValue& out) noexcept {
    int64_t v = 0;
    if (!parse_int64(s, v) || v < info.min || v > info.max) return false;
    out.i = v;
    return true;
}

inline bool convert_unsigned(const ScalarInfo& info, std::string_view s, ScalarValue& out) noexcept {
    uint64_t v = 0;
    if (!parse_uint64(s, v) || v > info.umax) return false;
    out.u = v;
    return true;
}

inline bool convert_float(const ScalarInfo& info, std::string_view s, ScalarValue& out) {
    double v = 0.0;
    if (!parse_double(s, v)) return false;
    if (info.single_precision && std::isfinite(v) &&
        std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max())) {
        return false;
    }
    out.d = v;
    return true;
}

// ─── Document leaves ───────────────────────────────────────────────────

/// @brief Convert a JSON number literal for a numeric target.
/// String and boolean targets never accept a number.
inline bool convert_json_number(const ScalarInfo& info, std::string_view literal, ScalarValue& out) {
    switch (info.kind) {
        case ScalarKind::Integer:  return convert_integer(info, literal, out);
        case ScalarKind::Unsigned: return convert_unsigned(info, literal, out);
        case ScalarKind::Float:    return convert_float(info, literal, out);
        case ScalarKind::String:
        case ScalarKind::Boolean:  return false;
    }
    return false;
}

/// @brief Convert XML character data or an attribute value.
///
/// Strings take the text verbatim. Empty text yields the zero value.
/// Other kinds ignore surrounding whitespace, so text that is only
/// whitespace does not convert.
inline bool convert_xml_text(const ScalarInfo& info, std::string_view text, ScalarValue& out) {
    if (info.kind == ScalarKind::String) {
        out.s = std::string(text);
        return true;
    }
    if (text.empty()) {
        out = ScalarValue{};
        return true;
    }
    const std::string_view t = trim(text);
    switch (info.kind) {
        case ScalarKind::Boolean:  return parse_bool(t, out.b);
        case ScalarKind::Integer:  return convert_integer(info, t, out);
        case ScalarKind::Unsigned: return convert_unsigned(info, t, out);
        case ScalarKind::Float:    return convert_float(info, t, out);
        case ScalarKind::String:   break;
    }
    return false;
}

} // namespace yadec::detail
