#pragma once

/// @file config.hpp
/// @author Aleksandr Loshkarev
/// @brief Configuration macros for the yadec library.
///
/// Controls:
///   - Branch prediction hints
///   - Nesting depth ceiling
///   - Descriptor lookup thresholds

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define YADEC_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define YADEC_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define YADEC_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define YADEC_LIKELY(x)   (x)
    #define YADEC_UNLIKELY(x) (x)
    #define YADEC_NOINLINE    __declspec(noinline)
#else
    #define YADEC_LIKELY(x)   (x)
    #define YADEC_UNLIKELY(x) (x)
    #define YADEC_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Applies to both the JSON and the XML decoder. Override per call with
// DecodeOptions::max_depth.

#if !defined(YADEC_MAX_DEPTH)
    #define YADEC_MAX_DEPTH 512
#endif

// =====================================================================
// Small record threshold for linear vs hash field lookup
// =====================================================================

#if !defined(YADEC_FIELD_LINEAR_THRESHOLD)
    #define YADEC_FIELD_LINEAR_THRESHOLD 16
#endif
