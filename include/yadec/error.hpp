#pragma once

/// @file error.hpp
/// @author Aleksandr Loshkarev
/// @brief Error types for yadec: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: SyntaxError, UnmarshalTypeError, UnsupportedTypeError
///   - Via error_code: yadec::errc enum + yadec_category() (exception-free)
///
/// Use Decoder::try_decode(target) for exception-free decoding.

#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <string>
#include <system_error>
#include <utility>

namespace yadec {

// =====================================================================
// Source position for syntax errors
// =====================================================================

/// @brief Position in the source document.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

namespace detail {

/// @brief Line and column of byte @p offset in @p text.
inline SourceLocation locate(std::string_view text, size_t offset) noexcept {
    SourceLocation loc;
    loc.offset = offset;
    const size_t stop = offset < text.size() ? offset : text.size();
    for (size_t i = 0; i < stop; ++i) {
        if (text[i] == '\n') { ++loc.line; loc.column = 1; }
        else { ++loc.column; }
    }
    return loc;
}

} // namespace detail

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief Decoder error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Syntax errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_array      = 7,
    unterminated_object     = 8,
    trailing_content        = 9,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,
    mismatched_tag          = 12,
    unterminated_markup     = 13,
    invalid_entity          = 14,
    duplicate_attribute     = 15,

    // Schema binding errors (50-79)
    type_mismatch           = 50,
    unsupported_type        = 51,

    // Value access errors (80-99)
    out_of_range            = 80,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class yadec_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "yadec";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::trailing_content:        return "trailing content after document";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_literal:         return "invalid literal";
            case errc::mismatched_tag:          return "mismatched element tag";
            case errc::unterminated_markup:     return "unterminated markup";
            case errc::invalid_entity:          return "invalid entity reference";
            case errc::duplicate_attribute:     return "duplicate attribute";
            case errc::type_mismatch:           return "type mismatch";
            case errc::unsupported_type:        return "unsupported target type";
            case errc::out_of_range:            return "index out of range";
            default:                            return "unknown yadec error";
        }
    }
};

} // namespace detail

/// @brief Get the yadec error category singleton.
inline const std::error_category& yadec_category() noexcept {
    static const detail::yadec_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from yadec::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), yadec_category()};
}

/// @brief Create an error_condition from yadec::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), yadec_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Malformed document, with source position information.
///
/// Never suppressed by the type-mismatch policy.
class SyntaxError : public std::system_error {
public:
    SyntaxError(const std::string& message, SourceLocation loc,
                errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "syntax error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) +
               " (offset " + std::to_string(loc.offset) + "): " + msg;
    }

    SourceLocation location_;
};

/// @brief Shape or kind disagreement between a document value and its target.
///
/// Thrown only while the type-mismatch policy is disabled.
class UnmarshalTypeError : public std::system_error {
public:
    UnmarshalTypeError(std::string value, std::string expected, std::string field)
        : std::system_error(make_error_code(errc::type_mismatch),
                            format_message(value, expected, field))
        , value_(std::move(value))
        , expected_(std::move(expected))
        , field_(std::move(field)) {}

    /// @brief Description of the document value, e.g. "string" or "number 1.5".
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    /// @brief Target kind the schema asked for.
    [[nodiscard]] const std::string& expected() const noexcept { return expected_; }

    /// @brief Dotted field path from the root target; empty for the root.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    static std::string format_message(const std::string& value,
                                      const std::string& expected,
                                      const std::string& field) {
        std::string msg = "cannot decode " + value + " into " + expected;
        if (!field.empty()) msg += " field " + field;
        return msg;
    }

    std::string value_;
    std::string expected_;
    std::string field_;
};

/// @brief The target schema itself cannot be decoded into.
class UnsupportedTypeError : public std::system_error {
public:
    explicit UnsupportedTypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::unsupported_type), msg) {}
};

/// @brief Type mismatch error when accessing a Value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index or missing key) on a Value.
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::out_of_range), msg) {}
};

} // namespace yadec

// Register yadec::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<yadec::errc> : true_type {};
} // namespace std
