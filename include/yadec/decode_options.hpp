#pragma once

/// @file decode_options.hpp
/// @author Aleksandr Loshkarev
/// @brief Decoder configuration: mismatch policy, limits, JSON extensions.
///
/// Available extensions (JSON only, all disabled by default):
///   - C/C++ style comments (// and /* */)
///   - Trailing commas in arrays and objects

#include <cstddef>

namespace yadec {

/// @brief Per-decoder configuration.
struct DecodeOptions {
    // ─── Type-mismatch policy ────────────────────────────────────────────

    /// Write the zero value and keep going instead of failing when a document
    /// value does not fit the shape of its target.
    bool allow_type_mismatch    = false;

    // ─── Name resolution ─────────────────────────────────────────────────

    /// Fall back to ASCII case-insensitive matching of JSON object keys
    /// when no field name matches exactly.
    bool case_insensitive_keys  = true;

    // ─── Non-standard JSON extensions ────────────────────────────────────

    /// Allow C/C++ comments: // line, /* block */
    bool allow_comments         = false;

    /// Allow trailing commas: [1,2,3,] and {"a":1,"b":2,}
    bool allow_trailing_commas  = false;

    // ─── Limits ──────────────────────────────────────────────────────────

    /// Maximum nesting depth (0 = use the value from config.hpp)
    size_t max_depth = 0;

    // ─── Factory methods ─────────────────────────────────────────────────

    /// Strict decoding: standard grammar, mismatches are fatal.
    static constexpr DecodeOptions strict() noexcept {
        return {};
    }

    /// Lenient decoding: mismatches zero the field, JSON extensions on.
    static constexpr DecodeOptions lenient() noexcept {
        DecodeOptions opts;
        opts.allow_type_mismatch   = true;
        opts.allow_comments        = true;
        opts.allow_trailing_commas = true;
        return opts;
    }
};

} // namespace yadec
