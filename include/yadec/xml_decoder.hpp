#pragma once

/// @file xml_decoder.hpp
/// @author Aleksandr Loshkarev
/// @brief Schema-driven XML decoding into C++ objects.
///
/// Mapping rules:
///   - a record reads its fields from the element's attributes (`,attr`),
///     child elements (`name` or `a>b>name` through wrapper elements) and
///     direct character data (`,chardata`)
///   - a scalar reads the element's character data
///   - a sequence appends one element per occurrence
///   - yadec::Value receives the element's character data as a string
///   - unknown attributes and child elements are skipped
///
/// Mapping targets (std::map, std::unordered_map) have no XML form and
/// raise UnsupportedTypeError when an element reaches them.
///
/// @example
/// @code
///   struct Point { int x; int y; };
///   YADEC_DEFINE_XML_SCHEMA(Point, "point",
///       (x, R"(xml:"x,attr")"),
///       (y, R"(xml:"y,attr")"))
///
///   auto p = yadec::xml::decode<Point>(R"(<point x="1" y="2"/>)");
/// @endcode

#include "config.hpp"
#include "decode_options.hpp"
#include "descriptor.hpp"
#include "descriptor_cache.hpp"
#include "error.hpp"
#include "policy.hpp"
#include "value.hpp"
#include "xml_lexer.hpp"
#include "detail/scalar.hpp"
#include "detail/stream.hpp"

#include <cstddef>
#include <istream>
#include <new>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace yadec {
namespace detail {

/// @brief Recursive descent over one XML element, driven by a descriptor.
class XmlReader {
public:
    XmlReader(XmlLexer& lex, DecodeContext& ctx) noexcept
        : lex_(lex), ctx_(ctx) {}

    /// @brief Decode the element opened by @p start, through its end tag.
    Decision decode_element(const Descriptor& d, void* slot, const xml::Token& start) {
        switch (d.shape) {
            case Shape::Unsupported:
                ctx_.admit(d, NodeKind::Element, slot);
                break;
            case Shape::Mapping:
                throw UnsupportedTypeError(d.type_name + ": mapping targets cannot be decoded from XML" +
                                           (ctx_.path().empty() ? std::string() : " (field " + ctx_.path() + ")"));
            case Shape::Optional: {
                const OptionalInfo& info = d.optional();
                const Decision r = decode_element(*info.inner, info.engage(slot), start);
                if (r == Decision::zero_and_discard && info.inner->shape != Shape::Sequence) {
                    d.reset(slot);
                }
                return r;
            }
            case Shape::Sequence: {
                const SequenceInfo& info = d.sequence();
                DecodeContext::PathScope scope(ctx_, info.size(slot));
                decode_element(*info.element, info.append(slot), start);
                return Decision::assign;
            }
            case Shape::Any: {
                bool nested = false;
                *static_cast<Value*>(slot) = Value(collect_text(nested));
                return Decision::assign;
            }
            case Shape::Scalar: {
                bool nested = false;
                const std::string text = collect_text(nested);
                if (nested) return ctx_.reject("element", d, slot);
                return store_text(d, slot, text);
            }
            case Shape::Record:
                return decode_record(d, slot, start);
        }
        return Decision::assign;
    }

    /// @brief Consume the rest of the current element, end tag included.
    void skip_element() {
        size_t depth = 1;
        while (depth > 0) {
            const xml::Token t = lex_.take();
            switch (t.kind) {
                case xml::TokenKind::start_element: ++depth; break;
                case xml::TokenKind::end_element:   --depth; break;
                case xml::TokenKind::end_of_input:  fail_truncated(t); break;
                default: break;
            }
        }
    }

private:
    static std::string describe_text(std::string_view text) {
        return "text \"" + std::string(trim(text)) + "\"";
    }

    [[noreturn]] void fail_truncated(const xml::Token& t) const {
        lex_.fail(t.offset, "unexpected end of input", errc::unexpected_end_of_input);
    }

    /// Character data of the current element; child elements are skipped
    /// and reported through @p nested.
    std::string collect_text(bool& nested) {
        std::string text;
        for (;;) {
            xml::Token t = lex_.take();
            switch (t.kind) {
                case xml::TokenKind::end_element:
                    return text;
                case xml::TokenKind::char_data:
                    text += t.text;
                    break;
                case xml::TokenKind::start_element:
                    nested = true;
                    skip_element();
                    break;
                case xml::TokenKind::end_of_input:
                    fail_truncated(t);
                default:
                    break;
            }
        }
    }

    /// @brief Store attribute or character data text into a text-shaped target.
    Decision store_text(const Descriptor& d, void* slot, const std::string& text) {
        switch (d.shape) {
            case Shape::Scalar: {
                const ScalarInfo& info = d.scalar();
                ScalarValue v;
                if (convert_xml_text(info, text, v)) {
                    info.store(slot, std::move(v));
                    return Decision::assign;
                }
                return ctx_.reject(describe_text(text), d, slot);
            }
            case Shape::Optional: {
                const OptionalInfo& info = d.optional();
                const Decision r = store_text(*info.inner, info.engage(slot), text);
                if (r == Decision::zero_and_discard) d.reset(slot);
                return r;
            }
            case Shape::Any:
                *static_cast<Value*>(slot) = Value(text);
                return Decision::assign;
            default:
                return ctx_.admit(d, NodeKind::Text, slot);
        }
    }

    Decision decode_record(const Descriptor& d, void* slot, const xml::Token& start) {
        const RecordInfo& info = d.record();
        if (!info.xml_name.empty() && xml::local_name(start.name) != info.xml_name) {
            const Decision r = ctx_.reject("element <" + start.name + ">", d, slot);
            skip_element();
            return r;
        }

        const FieldInfo* chardata = nullptr;
        for (const FieldInfo& f : info.fields) {
            if (f.xml_ignored) continue;
            if (f.placement == Placement::CharData && !chardata) chardata = &f;
            if (f.placement != Placement::Attribute) continue;
            for (const xml::Attribute& a : start.attributes) {
                if (a.name.compare(0, 5, "xmlns") == 0) continue;
                if (xml::local_name(a.name) == f.xml_name) {
                    DecodeContext::PathScope scope(ctx_, f.xml_name);
                    store_text(*f.type, f.locate(slot), a.value);
                    break;
                }
            }
        }

        std::string text;
        std::vector<std::string_view> parents;
        read_content(info, slot, parents, chardata ? &text : nullptr);

        if (chardata) {
            DecodeContext::PathScope scope(ctx_, chardata->identifier);
            store_text(*chardata->type, chardata->locate(slot), text);
        }
        return Decision::assign;
    }

    /// Children of the record element, up to and including its end tag.
    void read_content(const RecordInfo& info, void* slot,
                      std::vector<std::string_view>& parents, std::string* text) {
        for (;;) {
            xml::Token t = lex_.take();
            switch (t.kind) {
                case xml::TokenKind::end_element:
                    return;
                case xml::TokenKind::start_element:
                    route(info, slot, parents, t);
                    break;
                case xml::TokenKind::char_data:
                    if (text) text->append(t.text);
                    break;
                case xml::TokenKind::end_of_input:
                    fail_truncated(t);
                default:
                    break;
            }
        }
    }

    /// Body of a wrapper element. Non-blank text means the wrapper is not
    /// the container the schema expects.
    void read_wrapper(const RecordInfo& info, void* slot, std::vector<std::string_view>& parents) {
        for (;;) {
            xml::Token t = lex_.take();
            switch (t.kind) {
                case xml::TokenKind::end_element:
                    return;
                case xml::TokenKind::start_element:
                    route(info, slot, parents, t);
                    break;
                case xml::TokenKind::char_data:
                    if (!is_blank(t.text)) {
                        reject_wrapped(info, slot, parents, describe_text(t.text));
                        skip_element();
                        return;
                    }
                    break;
                case xml::TokenKind::end_of_input:
                    fail_truncated(t);
                default:
                    break;
            }
        }
    }

    static bool under(const FieldInfo& f, const std::vector<std::string_view>& parents) {
        if (f.xml_parents.size() < parents.size()) return false;
        for (size_t i = 0; i < parents.size(); ++i) {
            if (f.xml_parents[i] != parents[i]) return false;
        }
        return true;
    }

    /// @brief Send child element @p start to its field, a wrapper, or discard.
    void route(const RecordInfo& info, void* slot,
               std::vector<std::string_view>& parents, const xml::Token& start) {
        const std::string_view name = xml::local_name(start.name);
        bool wrapper = false;
        for (const FieldInfo& f : info.fields) {
            if (f.xml_ignored || f.placement != Placement::Element || !under(f, parents)) continue;
            if (f.xml_parents.size() == parents.size()) {
                if (f.xml_name == name) {
                    DecodeContext::PathScope scope(ctx_, f.xml_name);
                    decode_element(*f.type, f.locate(slot), start);
                    return;
                }
            } else if (f.xml_parents[parents.size()] == name) {
                wrapper = true;
            }
        }
        if (!wrapper) {
            skip_element();
            return;
        }
        DecodeContext::PathScope scope(ctx_, name);
        parents.push_back(name);
        read_wrapper(info, slot, parents);
        parents.pop_back();
    }

    /// @brief Every field routed through the current wrapper gets its zero value.
    void reject_wrapped(const RecordInfo& info, void* slot,
                        const std::vector<std::string_view>& parents, const std::string& observed) {
        for (const FieldInfo& f : info.fields) {
            if (f.xml_ignored || f.placement != Placement::Element || !under(f, parents)) continue;
            DecodeContext::PathScope scope(ctx_, f.xml_name);
            void* field = f.locate(slot);
            const Descriptor* type = f.type;
            // An optional sequence stays engaged and empty.
            if (type->shape == Shape::Optional && type->optional().inner->shape == Shape::Sequence) {
                field = type->optional().engage(field);
                type = type->optional().inner;
            }
            ctx_.reject(observed, *type, field);
        }
    }

    XmlLexer& lex_;
    DecodeContext& ctx_;
};

} // namespace detail

namespace xml {

/// @brief A standard XML header suitable for prepending to a document.
inline constexpr std::string_view kHeader = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

/// @brief Decodes a sequence of XML root elements into C++ objects.
///
/// Usage example:
/// @code
///   std::ifstream in("feed.xml");
///   yadec::xml::Decoder dec(in);
///   dec.allow_type_mismatch();
///   Feed feed;
///   dec.decode(feed);
/// @endcode
///
/// Whitespace, comments, processing instructions and directives between
/// root elements are skipped.
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

    /// @brief Decode the next root element into @p target.
    /// @throws SyntaxError, UnmarshalTypeError (policy disabled), UnsupportedTypeError
    template <typename T>
    void decode(T& target) {
        const Descriptor& d = cache_->get<T>();
        DecodeContext ctx(options_.allow_type_mismatch);
        detail::XmlReader reader(lexer_, ctx);
        if (YADEC_UNLIKELY(!more())) {
            lexer_.fail(lexer_.offset(), "no root element", errc::unexpected_end_of_input);
        }
        const xml::Token start = lexer_.take();
        reader.decode_element(d, &target, start);
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

    /// @brief Whether another root element follows.
    [[nodiscard]] bool more() const {
        for (;;) {
            const xml::Token& t = lexer_.peek();
            if (t.kind == TokenKind::start_element) return true;
            if (t.kind == TokenKind::end_of_input) return false;
            if (t.kind == TokenKind::char_data && !detail::is_blank(t.text)) {
                lexer_.fail(t.offset, "character data outside the root element");
            }
            lexer_.take();
        }
    }

    /// @brief Byte offset of the next unconsumed token.
    [[nodiscard]] size_t input_offset() const noexcept { return lexer_.offset(); }

    /// @brief Fail unless only whitespace and markup without content remains.
    void expect_end() const {
        if (YADEC_UNLIKELY(more())) {
            lexer_.fail(lexer_.offset(), "unexpected trailing content", errc::trailing_content);
        }
    }

private:
    DescriptorCache* cache_;
    DecodeOptions options_;
    std::string buffer_;
    // Lookahead is filled lazily, also from const queries.
    mutable detail::XmlLexer lexer_;
};

// ─── Free functions ────────────────────────────────────────────────────

/// @brief Decode one complete XML document into @p target.
template <typename T>
void decode(std::string_view input, T& target, const DecodeOptions& opts = {}) {
    Decoder dec(input);
    dec.options() = opts;
    dec.decode(target);
    dec.expect_end();
}

/// @brief Decode one complete XML document into a new T.
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

} // namespace xml
} // namespace yadec
