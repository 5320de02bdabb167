#pragma once

/// @file json_decoder.hpp
/// @author Aleksandr Loshkarev
/// @brief Schema-driven JSON decoding into C++ objects.
///
/// The reader pulls tokens from a JsonLexer and streams them straight into
/// the slots a Descriptor describes. Nodes that do not fit their target go
/// through the MismatchPolicy; nodes without a target (unknown keys, values
/// after a mismatch) are consumed in discard mode, which still checks the
/// grammar.
///
/// @example
/// @code
///   struct Row { std::string name; int count; };
///   YADEC_DEFINE_SCHEMA(Row, (name, R"(json:"name")"), (count, R"(json:"count")"))
///
///   Row row;
///   yadec::json::Decoder dec(R"({"name":"a","count":"oops"})");
///   dec.allow_type_mismatch();
///   dec.decode(row);   // row.name == "a", row.count == 0
/// @endcode

#include "config.hpp"
#include "decode_options.hpp"
#include "descriptor.hpp"
#include "descriptor_cache.hpp"
#include "error.hpp"
#include "json_lexer.hpp"
#include "policy.hpp"
#include "value.hpp"
#include "detail/scalar.hpp"
#include "detail/stream.hpp"

#include <cstddef>
#include <istream>
#include <new>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace yadec {
namespace detail {

/// @brief Recursive descent over one JSON value, driven by a descriptor.
class JsonReader {
public:
    JsonReader(JsonLexer& lex, DecodeContext& ctx, const DecodeOptions& opts) noexcept
        : lex_(lex), ctx_(ctx), opts_(opts) {}

    /// @brief Consume exactly one value into @p slot.
    Decision decode(const Descriptor& d, void* slot) {
        const json::Token& t = lex_.peek();
        const NodeKind observed = node_kind(t);

        if (YADEC_UNLIKELY(d.shape == Shape::Unsupported)) {
            ctx_.admit(d, observed, slot);
        }

        if (observed == NodeKind::Null) {
            lex_.take();
            store_null(d, slot);
            return Decision::assign;
        }

        switch (d.shape) {
            case Shape::Optional: return decode_optional(d, slot);
            case Shape::Any:
                read_value(d, *static_cast<Value*>(slot));
                return Decision::assign;
            default:
                break;
        }

        if (ctx_.admit(d, observed, slot) == Decision::zero_and_discard) {
            skip_value();
            return Decision::zero_and_discard;
        }

        switch (d.shape) {
            case Shape::Scalar:   return decode_scalar(d, slot);
            case Shape::Sequence: return decode_sequence(d, slot);
            case Shape::Mapping:  return decode_mapping(d, slot);
            case Shape::Record:   return decode_record(d, slot);
            default:              break;
        }
        return Decision::assign;
    }

    /// @brief Consume and validate one value without storing it.
    void skip_value() {
        switch (lex_.peek().kind) {
            case json::TokenKind::begin_object:
                read_object([this](std::string&&) { skip_value(); });
                return;
            case json::TokenKind::begin_array:
                read_array([this] { skip_value(); });
                return;
            case json::TokenKind::string:
            case json::TokenKind::number:
            case json::TokenKind::true_literal:
            case json::TokenKind::false_literal:
            case json::TokenKind::null_literal:
                lex_.take();
                return;
            default:
                lex_.fail_unexpected(lex_.peek());
        }
    }

private:
    /// Kind of the value starting at @p t; punctuation is a syntax error.
    NodeKind node_kind(const json::Token& t) const {
        switch (t.kind) {
            case json::TokenKind::begin_object:  return NodeKind::Object;
            case json::TokenKind::begin_array:   return NodeKind::Array;
            case json::TokenKind::string:        return NodeKind::String;
            case json::TokenKind::number:        return NodeKind::Number;
            case json::TokenKind::true_literal:
            case json::TokenKind::false_literal: return NodeKind::Boolean;
            case json::TokenKind::null_literal:  return NodeKind::Null;
            default:
                lex_.fail_unexpected(t);
        }
    }

    /// null empties containers and optionals; scalars and records keep their value.
    static void store_null(const Descriptor& d, void* slot) {
        switch (d.shape) {
            case Shape::Sequence:
            case Shape::Mapping:
            case Shape::Optional:
            case Shape::Any:
                d.reset(slot);
                break;
            default:
                break;
        }
    }

    Decision decode_optional(const Descriptor& d, void* slot) {
        const OptionalInfo& info = d.optional();
        void* inner = info.engage(slot);
        const Decision r = decode(*info.inner, inner);
        // A mismatched sequence stays engaged (allocated, empty).
        if (r == Decision::zero_and_discard && info.inner->shape != Shape::Sequence) {
            d.reset(slot);
        }
        return r;
    }

    Decision decode_scalar(const Descriptor& d, void* slot) {
        const ScalarInfo& info = d.scalar();
        json::Token t = lex_.take();
        ScalarValue v;
        std::string observed;

        switch (t.kind) {
            case json::TokenKind::string:
                if (info.kind == ScalarKind::String) {
                    v.s = std::move(t.text);
                    info.store(slot, std::move(v));
                    return Decision::assign;
                }
                observed = "string";
                break;
            case json::TokenKind::number:
                if (convert_json_number(info, t.raw, v)) {
                    info.store(slot, std::move(v));
                    return Decision::assign;
                }
                observed = (info.kind == ScalarKind::String || info.kind == ScalarKind::Boolean)
                               ? std::string("number")
                               : "number " + std::string(t.raw);
                break;
            default:
                if (info.kind == ScalarKind::Boolean) {
                    v.b = t.kind == json::TokenKind::true_literal;
                    info.store(slot, std::move(v));
                    return Decision::assign;
                }
                observed = "bool";
                break;
        }
        return ctx_.reject(observed, d, slot);
    }

    Decision decode_sequence(const Descriptor& d, void* slot) {
        const SequenceInfo& info = d.sequence();
        info.clear(slot);
        size_t index = 0;
        read_array([&] {
            DecodeContext::PathScope scope(ctx_, index++);
            decode(*info.element, info.append(slot));
        });
        return Decision::assign;
    }

    Decision decode_mapping(const Descriptor& d, void* slot) {
        const MappingInfo& info = d.mapping();
        read_object([&](std::string&& key) {
            DecodeContext::PathScope scope(ctx_, key);
            decode(*info.value, info.entry(slot, std::move(key)));
        });
        return Decision::assign;
    }

    Decision decode_record(const Descriptor& d, void* slot) {
        const RecordInfo& info = d.record();
        read_object([&](std::string&& key) {
            const FieldInfo* f = info.find_json(key, opts_.case_insensitive_keys);
            if (!f) {
                skip_value();
                return;
            }
            DecodeContext::PathScope scope(ctx_, f->json_name);
            decode(*f->type, f->locate(slot));
        });
        return Decision::assign;
    }

    /// @brief Materialize a sub-tree into a Value.
    /// @param any  Descriptor of yadec::Value, used for mismatch reports.
    void read_value(const Descriptor& any, Value& out) {
        const json::Token& t = lex_.peek();
        switch (t.kind) {
            case json::TokenKind::null_literal:
                lex_.take();
                out = Value();
                return;
            case json::TokenKind::true_literal:
            case json::TokenKind::false_literal:
                out = Value(lex_.take().kind == json::TokenKind::true_literal);
                return;
            case json::TokenKind::string:
                out = Value(std::move(lex_.take().text));
                return;
            case json::TokenKind::number: {
                const json::Token num = lex_.take();
                double d = 0.0;
                if (parse_double(num.raw, d)) {
                    out = Value(d);
                } else {
                    ctx_.reject("number " + std::string(num.raw), any, &out);
                }
                return;
            }
            case json::TokenKind::begin_array: {
                out = Value::array();
                size_t index = 0;
                read_array([&] {
                    DecodeContext::PathScope scope(ctx_, index++);
                    Value element;
                    read_value(any, element);
                    out.push_back(std::move(element));
                });
                return;
            }
            case json::TokenKind::begin_object:
                out = Value::object();
                read_object([&](std::string&& key) {
                    DecodeContext::PathScope scope(ctx_, key);
                    Value member;
                    read_value(any, member);
                    out.insert(std::move(key), std::move(member));
                });
                return;
            default:
                lex_.fail_unexpected(t);
        }
    }

    // ─── Grammar ───────────────────────────────────────────────────────

    /// @brief Consume an array, calling @p on_element once per element.
    /// @p on_element must consume exactly one value.
    template <typename Fn>
    void read_array(Fn&& on_element) {
        const json::Token open = lex_.take();
        lex_.push_depth(open.offset);

        if (lex_.peek().kind == json::TokenKind::end_array) {
            lex_.take();
            lex_.pop_depth();
            return;
        }

        for (;;) {
            on_element();
            const json::Token sep = lex_.take();
            if (sep.kind == json::TokenKind::comma) {
                if (opts_.allow_trailing_commas &&
                    lex_.peek().kind == json::TokenKind::end_array) {
                    lex_.take();
                    break;
                }
                continue;
            }
            if (sep.kind == json::TokenKind::end_array) break;
            if (sep.kind == json::TokenKind::end_of_input) {
                lex_.fail(open.offset, "unterminated array", errc::unterminated_array);
            }
            lex_.fail(sep.offset, std::string("expected ',' or ']', got ") +
                                      json::token_kind_name(sep.kind));
        }
        lex_.pop_depth();
    }

    /// @brief Consume an object, calling @p on_member(key) once per member.
    /// @p on_member must consume exactly one value.
    template <typename Fn>
    void read_object(Fn&& on_member) {
        const json::Token open = lex_.take();
        lex_.push_depth(open.offset);

        if (lex_.peek().kind == json::TokenKind::end_object) {
            lex_.take();
            lex_.pop_depth();
            return;
        }

        for (;;) {
            json::Token key = lex_.take();
            if (YADEC_UNLIKELY(key.kind != json::TokenKind::string)) {
                if (key.kind == json::TokenKind::end_of_input) {
                    lex_.fail(open.offset, "unterminated object", errc::unterminated_object);
                }
                lex_.fail(key.offset, std::string("expected string key, got ") +
                                          json::token_kind_name(key.kind));
            }
            const json::Token colon = lex_.take();
            if (YADEC_UNLIKELY(colon.kind != json::TokenKind::colon)) {
                if (colon.kind == json::TokenKind::end_of_input) {
                    lex_.fail(open.offset, "unterminated object", errc::unterminated_object);
                }
                lex_.fail(colon.offset, std::string("expected ':', got ") +
                                            json::token_kind_name(colon.kind));
            }

            on_member(std::move(key.text));

            const json::Token sep = lex_.take();
            if (sep.kind == json::TokenKind::comma) {
                if (opts_.allow_trailing_commas &&
                    lex_.peek().kind == json::TokenKind::end_object) {
                    lex_.take();
                    break;
                }
                continue;
            }
            if (sep.kind == json::TokenKind::end_object) break;
            if (sep.kind == json::TokenKind::end_of_input) {
                lex_.fail(open.offset, "unterminated object", errc::unterminated_object);
            }
            lex_.fail(sep.offset, std::string("expected ',' or '}', got ") +
                                      json::token_kind_name(sep.kind));
        }
        lex_.pop_depth();
    }

    JsonLexer& lex_;
    DecodeContext& ctx_;
    const DecodeOptions& opts_;
};

} // namespace detail

namespace json {

/// @brief Decodes a stream of JSON values into C++ objects.
///
/// Usage example:
/// @code
///   yadec::json::Decoder dec(input);
///   dec.allow_type_mismatch();
///   Config cfg;
///   if (auto ec = dec.try_decode(cfg)) {
///       std::cerr << ec.message() << '\n';
///   }
/// @endcode
///
/// A view-constructed decoder does not own its input; the caller keeps the
/// buffer alive for the decoder's lifetime.
class Decoder {
public:
    explicit Decoder(std::string_view input, DescriptorCache& cache = DescriptorCache::global())
        : cache_(&cache), lexer_(input, options_) {}

    /// @brief Read the whole stream (blocking) into an owned buffer.
    explicit Decoder(std::istream& is, DescriptorCache& cache = DescriptorCache::global())
        : cache_(&cache), buffer_(detail::read_stream(is)), lexer_(buffer_, options_) {}

    // Non-copyable, non-movable (the lexer points at members)
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /// @brief Turn mismatch leniency on or off; applies from the next decode().
    Decoder& allow_type_mismatch(bool enable = true) noexcept {
        options_.allow_type_mismatch = enable;
        return *this;
    }

    [[nodiscard]] DecodeOptions& options() noexcept { return options_; }
    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

    /// @brief Decode the next top-level value into @p target.
    /// @throws SyntaxError, UnmarshalTypeError (policy disabled), UnsupportedTypeError
    template <typename T>
    void decode(T& target) {
        const Descriptor& d = cache_->get<T>();
        DecodeContext ctx(options_.allow_type_mismatch);
        detail::JsonReader reader(lexer_, ctx, options_);
        lexer_.reset_depth();
        if (YADEC_UNLIKELY(lexer_.at_end())) {
            lexer_.fail_unexpected(lexer_.peek());
        }
        reader.decode(d, &target);
    }

    /// @brief Exception-free decode().
    template <typename T>
    std::error_code try_decode(T& target) noexcept {
        try {
            decode(target);
            return {};
        } catch (const std::system_error& e) {
            return e.code();
        } catch (const std::bad_alloc&) {
            return std::make_error_code(std::errc::not_enough_memory);
        }
    }

    /// @brief Whether another top-level value follows.
    [[nodiscard]] bool more() const { return !lexer_.at_end(); }

    /// @brief Byte offset of the next unconsumed token.
    [[nodiscard]] size_t input_offset() const noexcept { return lexer_.offset(); }

    /// @brief Fail unless only whitespace (and permitted comments) remains.
    void expect_end() const {
        if (YADEC_UNLIKELY(!lexer_.at_end())) {
            lexer_.fail(lexer_.offset(), "unexpected trailing content", errc::trailing_content);
        }
    }

private:
    DescriptorCache* cache_;
    DecodeOptions options_;
    std::string buffer_;
    // Lookahead is filled lazily, also from const queries.
    mutable detail::JsonLexer lexer_;
};

// ─── Free functions ────────────────────────────────────────────────────

/// @brief Decode one complete JSON document into @p target.
template <typename T>
void decode(std::string_view input, T& target, const DecodeOptions& opts = {}) {
    Decoder dec(input);
    dec.options() = opts;
    dec.decode(target);
    dec.expect_end();
}

/// @brief Decode one complete JSON document into a new T.
template <typename T>
[[nodiscard]] T decode(std::string_view input, const DecodeOptions& opts = {}) {
    T target{};
    decode(input, target, opts);
    return target;
}

/// @brief Exception-free decode() of one complete document.
template <typename T>
std::error_code try_decode(std::string_view input, T& target, const DecodeOptions& opts = {}) noexcept {
    try {
        decode(input, target, opts);
        return {};
    } catch (const std::system_error& e) {
        return e.code();
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

} // namespace json
} // namespace yadec
