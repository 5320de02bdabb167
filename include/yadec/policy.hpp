#pragma once

/// @file policy.hpp
/// @author Aleksandr Loshkarev
/// @brief Type-mismatch policy and per-call decode state.
///
/// Every assignment point in both decoders asks MismatchPolicy what to do
/// when the document node does not fit its target:
///   - disabled: throw UnmarshalTypeError (value, expected, field path)
///   - enabled:  write the slot's zero value, return zero_and_discard, and
///               let the caller drop the rest of the node
///
/// Unsupported targets are fatal under both settings.

#include "config.hpp"
#include "descriptor.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace yadec {

/// Outcome of one assignment point.
enum class Decision : uint8_t {
    assign           = 0,   ///< The node fits; decode it into the slot
    zero_and_discard = 1    ///< The slot holds its zero value; skip the node
};

class MismatchPolicy {
public:
    explicit MismatchPolicy(bool lenient) noexcept : lenient_(lenient) {}

    [[nodiscard]] bool lenient() const noexcept { return lenient_; }

    /// @brief Whether @p target accepts a node of kind @p observed at all.
    ///
    /// Composite kinds must match the target shape; scalar nodes fit any
    /// scalar target and are checked again by reject() after conversion.
    /// Null is never passed here.
    Decision admit(const Descriptor& target, NodeKind observed,
                   void* slot, const std::string& path) const {
        if (YADEC_UNLIKELY(target.shape == Shape::Unsupported)) {
            throw UnsupportedTypeError("unsupported target type " + target.type_name +
                                       (path.empty() ? std::string() : " at field " + path));
        }
        if (YADEC_LIKELY(fits(target.shape, observed))) return Decision::assign;
        return reject(node_kind_name(observed), target, slot, path);
    }

    /// @brief Report a node that cannot be stored into @p target.
    /// @param observed  Document description, e.g. "string" or "number 1.5".
    Decision reject(std::string_view observed, const Descriptor& target,
                    void* slot, const std::string& path) const {
        if (!lenient_) {
            throw UnmarshalTypeError(std::string(observed), target.type_name, path);
        }
        target.reset(slot);
        return Decision::zero_and_discard;
    }

private:
    static bool fits(Shape shape, NodeKind observed) noexcept {
        switch (shape) {
            case Shape::Scalar:
                return observed == NodeKind::Boolean || observed == NodeKind::Number ||
                       observed == NodeKind::String  || observed == NodeKind::Text;
            case Shape::Sequence: return observed == NodeKind::Array;
            case Shape::Mapping:  return observed == NodeKind::Object;
            case Shape::Record:   return observed == NodeKind::Object || observed == NodeKind::Element;
            case Shape::Optional:
            case Shape::Any:      return true;
            case Shape::Unsupported: return false;
        }
        return false;
    }

    bool lenient_;
};

/// @brief State owned by one decode() call.
///
/// Holds the policy (flag copied when the call starts) and the field path
/// of the slot being filled, for diagnostics.
class DecodeContext {
public:
    explicit DecodeContext(bool lenient) noexcept : policy_(lenient) {}

    DecodeContext(const DecodeContext&) = delete;
    DecodeContext& operator=(const DecodeContext&) = delete;

    [[nodiscard]] const MismatchPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// @brief Extends the path for the lifetime of the scope.
    class PathScope {
    public:
        PathScope(DecodeContext& ctx, std::string_view field)
            : ctx_(ctx), saved_(ctx.path_.size()) {
            if (!ctx.path_.empty()) ctx.path_.push_back('.');
            ctx.path_.append(field);
        }
        PathScope(DecodeContext& ctx, size_t index)
            : ctx_(ctx), saved_(ctx.path_.size()) {
            ctx.path_.push_back('[');
            ctx.path_.append(std::to_string(index));
            ctx.path_.push_back(']');
        }
        ~PathScope() { ctx_.path_.resize(saved_); }

        PathScope(const PathScope&) = delete;
        PathScope& operator=(const PathScope&) = delete;

    private:
        DecodeContext& ctx_;
        size_t saved_;
    };

    /// Shorthand for policy().admit() at the current path.
    Decision admit(const Descriptor& target, NodeKind observed, void* slot) const {
        return policy_.admit(target, observed, slot, path_);
    }

    /// Shorthand for policy().reject() at the current path.
    Decision reject(std::string_view observed, const Descriptor& target, void* slot) const {
        return policy_.reject(observed, target, slot, path_);
    }

private:
    MismatchPolicy policy_;
    std::string path_;
};

} // namespace yadec
