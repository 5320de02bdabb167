#pragma once

/// @file xml_lexer.hpp
/// @author Aleksandr Loshkarev
/// @brief Lazy, forward-only XML 1.0 token stream.
///
/// Features:
///   - One token of lookahead (peek / take), produced on demand
///   - Self-closing elements produce a start and an end token
///   - Predefined entities and numeric character references decoded in
///     character data and attribute values
///   - CDATA sections produced as character data
///   - Comments, processing instructions (including the XML declaration)
///     and <!DOCTYPE ...> directives produced as their own tokens
///   - Tag balance checked against a stack of open elements
///
/// External entities and DTD-defined entities are not expanded.

#include "config.hpp"
#include "decode_options.hpp"
#include "error.hpp"
#include "detail/utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace yadec {
namespace xml {

enum class TokenKind : uint8_t {
    start_element,
    end_element,
    char_data,
    comment,
    proc_inst,
    directive,
    end_of_input
};

inline const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::start_element: return "start element";
        case TokenKind::end_element:   return "end element";
        case TokenKind::char_data:     return "character data";
        case TokenKind::comment:       return "comment";
        case TokenKind::proc_inst:     return "processing instruction";
        case TokenKind::directive:     return "directive";
        case TokenKind::end_of_input:  return "end of input";
    }
    return "unknown";
}

struct Attribute {
    std::string name;    ///< As written, prefix included
    std::string value;   ///< Entity-decoded
};

struct Token {
    TokenKind   kind = TokenKind::end_of_input;
    std::string name;                    ///< Element name or PI target, as written
    std::vector<Attribute> attributes;   ///< start_element only
    std::string text;                    ///< Decoded char data, comment, PI or directive body
    size_t      offset = 0;
};

/// @brief Name without its namespace prefix ("a:b" -> "b").
inline std::string_view local_name(std::string_view name) noexcept {
    const size_t colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

} // namespace xml

namespace detail {

class XmlLexer {
public:
    XmlLexer(std::string_view input, const DecodeOptions& opts) noexcept
        : input_(input), opts_(&opts) {}

    XmlLexer(const XmlLexer&) = delete;
    XmlLexer& operator=(const XmlLexer&) = delete;

    // ─── Token access ──────────────────────────────────────────────────

    const xml::Token& peek() {
        if (!has_token_) {
            scan();
            has_token_ = true;
        }
        return token_;
    }

    xml::Token take() {
        peek();
        has_token_ = false;
        return std::move(token_);
    }

    [[nodiscard]] bool at_end() { return peek().kind == xml::TokenKind::end_of_input; }

    /// Byte offset of the next unconsumed token.
    [[nodiscard]] size_t offset() const noexcept { return has_token_ ? token_.offset : pos_; }

    /// Number of currently open elements.
    [[nodiscard]] size_t depth() const noexcept { return open_.size(); }

    // ─── Error reporting ───────────────────────────────────────────────

    [[nodiscard]] SourceLocation location_of(size_t offset) const noexcept {
        return locate(input_, offset);
    }

    [[noreturn]] YADEC_NOINLINE void fail(size_t offset, const std::string& msg,
                                          errc code = errc::unexpected_character) const {
        throw SyntaxError(msg, location_of(offset), code);
    }

    // ─── Entities ──────────────────────────────────────────────────────

    /// @brief Decode predefined entities and numeric char refs in a slice.
    /// @param base  Offset of @p in within the input, for error positions.
    void decode_entities(std::string_view in, std::string& out, size_t base) const {
        out.reserve(out.size() + in.size());
        for (size_t i = 0; i < in.size();) {
            const char ch = in[i];
            if (ch != '&') {
                out.push_back(ch);
                ++i;
                continue;
            }
            const size_t semi = in.find(';', i + 1);
            if (semi == std::string_view::npos) {
                fail(base + i, "unterminated entity reference", errc::invalid_entity);
            }
            const std::string_view ent = in.substr(i + 1, semi - (i + 1));
            if (ent == "lt")        out.push_back('<');
            else if (ent == "gt")   out.push_back('>');
            else if (ent == "amp")  out.push_back('&');
            else if (ent == "apos") out.push_back('\'');
            else if (ent == "quot") out.push_back('"');
            else if (!ent.empty() && ent[0] == '#') {
                if (!append_char_ref(ent, out)) {
                    fail(base + i, "invalid character reference &" + std::string(ent) + ";",
                         errc::invalid_entity);
                }
            } else {
                fail(base + i, "unknown entity &" + std::string(ent) + ";", errc::invalid_entity);
            }
            i = semi + 1;
        }
    }

private:
    // ─── Cursor helpers ────────────────────────────────────────────────

    [[nodiscard]] bool eof() const noexcept { return pos_ >= input_.size(); }

    bool match(std::string_view s) noexcept {
        if (input_.compare(pos_, s.size(), s) != 0) return false;
        pos_ += s.size();
        return true;
    }

    static bool is_space(char ch) noexcept {
        return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
    }

    static bool is_name_start(char ch) noexcept {
        return ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
               static_cast<unsigned char>(ch) >= 0x80;
    }

    static bool is_name_char(char ch) noexcept {
        return is_name_start(ch) || ch == '-' || ch == '.' || (ch >= '0' && ch <= '9');
    }

    void skip_spaces() noexcept {
        while (!eof() && is_space(input_[pos_])) ++pos_;
    }

    std::string_view read_name() noexcept {
        const size_t start = pos_;
        if (eof() || !is_name_start(input_[pos_])) return {};
        ++pos_;
        while (!eof() && is_name_char(input_[pos_])) ++pos_;
        return input_.substr(start, pos_ - start);
    }

    /// Body up to @p terminator, which is consumed.
    std::string_view read_until(std::string_view terminator, size_t start, const char* what) {
        const size_t end = input_.find(terminator, pos_);
        if (end == std::string_view::npos) {
            fail(start, std::string("unterminated ") + what, errc::unterminated_markup);
        }
        std::string_view body = input_.substr(pos_, end - pos_);
        pos_ = end + terminator.size();
        return body;
    }

    // ─── Token scanning ────────────────────────────────────────────────

    void scan() {
        xml::Token& t = token_;
        t.name.clear();
        t.attributes.clear();
        t.text.clear();
        t.offset = pos_;

        if (pending_end_) {
            pending_end_ = false;
            t.kind = xml::TokenKind::end_element;
            t.name = std::move(open_.back());
            open_.pop_back();
            return;
        }

        if (eof()) {
            if (!open_.empty()) {
                fail(pos_, "unexpected end of input inside <" + open_.back() + ">",
                     errc::unexpected_end_of_input);
            }
            t.kind = xml::TokenKind::end_of_input;
            return;
        }

        if (input_[pos_] != '<') {
            scan_text();
            return;
        }

        const size_t start = pos_;
        ++pos_;
        if (eof()) fail(start, "unexpected end of input after '<'", errc::unexpected_end_of_input);

        if (match("?")) {
            scan_proc_inst(start);
        } else if (match("!--")) {
            t.kind = xml::TokenKind::comment;
            t.text = std::string(read_until("-->", start, "comment"));
        } else if (match("![CDATA[")) {
            t.kind = xml::TokenKind::char_data;
            t.text = std::string(read_until("]]>", start, "CDATA section"));
        } else if (match("!")) {
            scan_directive(start);
        } else if (match("/")) {
            scan_end_tag(start);
        } else {
            scan_start_tag(start);
        }
    }

    void scan_text() {
        const size_t start = pos_;
        const size_t end = input_.find('<', pos_);
        pos_ = end == std::string_view::npos ? input_.size() : end;
        token_.kind = xml::TokenKind::char_data;
        decode_entities(input_.substr(start, pos_ - start), token_.text, start);
    }

    void scan_proc_inst(size_t start) {
        const std::string_view target = read_name();
        if (target.empty()) fail(pos_, "invalid processing instruction target");
        token_.kind = xml::TokenKind::proc_inst;
        token_.name = std::string(target);
        skip_spaces();
        token_.text = std::string(read_until("?>", start, "processing instruction"));
    }

    /// <!DOCTYPE ...> and other declarations; an internal subset in [] may hold '>'.
    void scan_directive(size_t start) {
        const size_t body = pos_;
        int brackets = 0;
        char quote = 0;
        for (; !eof(); ++pos_) {
            const char ch = input_[pos_];
            if (quote) {
                if (ch == quote) quote = 0;
            } else if (ch == '"' || ch == '\'') {
                quote = ch;
            } else if (ch == '[') {
                ++brackets;
            } else if (ch == ']') {
                if (brackets > 0) --brackets;
            } else if (ch == '>' && brackets == 0) {
                break;
            }
        }
        if (eof()) fail(start, "unterminated directive", errc::unterminated_markup);
        token_.kind = xml::TokenKind::directive;
        token_.text = std::string(input_.substr(body, pos_ - body));
        ++pos_;
    }

    void scan_end_tag(size_t start) {
        const std::string_view name = read_name();
        if (name.empty()) fail(pos_, "invalid end tag name");
        skip_spaces();
        if (eof()) fail(start, "unterminated end tag", errc::unterminated_markup);
        if (input_[pos_] != '>') fail(pos_, "expected '>' after end tag name");
        ++pos_;

        if (open_.empty()) {
            fail(start, "end tag </" + std::string(name) + "> without matching start tag",
                 errc::mismatched_tag);
        }
        if (open_.back() != name) {
            fail(start, "element <" + open_.back() + "> closed by </" + std::string(name) + ">",
                 errc::mismatched_tag);
        }
        token_.kind = xml::TokenKind::end_element;
        token_.name = std::move(open_.back());
        open_.pop_back();
    }

    void scan_start_tag(size_t start) {
        const std::string_view name = read_name();
        if (name.empty()) {
            fail(pos_, std::string("unexpected character '") + input_[pos_] + "' after '<'");
        }
        token_.kind = xml::TokenKind::start_element;
        token_.name = std::string(name);

        for (;;) {
            const bool spaced = !eof() && is_space(input_[pos_]);
            skip_spaces();
            if (eof()) fail(start, "unterminated start tag", errc::unterminated_markup);
            const char ch = input_[pos_];
            if (ch == '>') {
                ++pos_;
                break;
            }
            if (ch == '/') {
                ++pos_;
                if (eof() || input_[pos_] != '>') fail(pos_, "expected '>' after '/'");
                ++pos_;
                pending_end_ = true;
                break;
            }
            if (!spaced) fail(pos_, "expected whitespace before attribute");
            scan_attribute();
        }

        const size_t limit = opts_->max_depth > 0 ? opts_->max_depth : YADEC_MAX_DEPTH;
        if (YADEC_UNLIKELY(open_.size() + 1 > limit)) {
            fail(start, "maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
        open_.push_back(token_.name);
    }

    void scan_attribute() {
        const size_t name_start = pos_;
        const std::string_view name = read_name();
        if (name.empty()) fail(pos_, "invalid attribute name");
        for (const auto& a : token_.attributes) {
            if (a.name == name) {
                fail(name_start, "duplicate attribute \"" + std::string(name) + "\"",
                     errc::duplicate_attribute);
            }
        }
        skip_spaces();
        if (eof() || input_[pos_] != '=') fail(pos_, "expected '=' after attribute name");
        ++pos_;
        skip_spaces();
        if (eof()) fail(pos_, "unexpected end of input in attribute", errc::unexpected_end_of_input);
        const char quote = input_[pos_];
        if (quote != '"' && quote != '\'') fail(pos_, "unquoted attribute value");
        const size_t value_start = ++pos_;
        const size_t end = input_.find(quote, pos_);
        if (end == std::string_view::npos) {
            fail(value_start - 1, "unterminated attribute value", errc::unterminated_markup);
        }
        const std::string_view raw = input_.substr(value_start, end - value_start);
        if (raw.find('<') != std::string_view::npos) {
            fail(value_start + raw.find('<'), "'<' in attribute value");
        }
        pos_ = end + 1;

        xml::Attribute attr;
        attr.name = std::string(name);
        decode_entities(raw, attr.value, value_start);
        token_.attributes.push_back(std::move(attr));
    }

    /// Append a numeric char ref body ("#10", "#x1F4A9") as UTF-8.
    static bool append_char_ref(std::string_view ent, std::string& out) {
        if (ent.size() < 2) return false;
        uint32_t code = 0;
        const bool hex = ent[1] == 'x' || ent[1] == 'X';
        const size_t first = hex ? 2 : 1;
        if (first >= ent.size()) return false;
        for (size_t i = first; i < ent.size(); ++i) {
            const char c = ent[i];
            uint32_t v = 0;
            if (c >= '0' && c <= '9') v = static_cast<uint32_t>(c - '0');
            else if (hex && c >= 'a' && c <= 'f') v = static_cast<uint32_t>(c - 'a' + 10);
            else if (hex && c >= 'A' && c <= 'F') v = static_cast<uint32_t>(c - 'A' + 10);
            else return false;
            code = hex ? (code << 4) | v : code * 10u + v;
            if (code > 0x10FFFF) return false;
        }
        if (!utf8::is_xml_char(code)) return false;
        return utf8::encode(code, out);
    }

    std::string_view input_;
    size_t pos_ = 0;
    const DecodeOptions* opts_;
    std::vector<std::string> open_;   ///< Names of open elements, innermost last
    bool pending_end_ = false;        ///< Self-closing tag still owes its end token
    bool has_token_ = false;
    xml::Token token_;
};

} // namespace detail
} // namespace yadec
