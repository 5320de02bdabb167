#pragma once

/// @file json_lexer.hpp
/// @author Aleksandr Loshkarev
/// @brief Lazy, forward-only JSON token stream.
///
/// Features:
///   - One token of lookahead (peek / take), produced on demand
///   - Strings fully decoded (\uXXXX escapes and surrogate pairs to UTF-8)
///   - Numbers validated against the RFC 8259 grammar, kept as raw literals
///   - Optional comments (// and /* */), see DecodeOptions
///   - Nesting depth accounting for the reader above it
///
/// Grammar between tokens (commas, colons, bracket matching) is checked by
/// the reader; the lexer only knows single tokens.

#include "config.hpp"
#include "decode_options.hpp"
#include "error.hpp"
#include "detail/utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace yadec {
namespace json {

enum class TokenKind : uint8_t {
    begin_object,
    end_object,
    begin_array,
    end_array,
    colon,
    comma,
    string,
    number,
    true_literal,
    false_literal,
    null_literal,
    end_of_input
};

inline const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::begin_object:  return "'{'";
        case TokenKind::end_object:    return "'}'";
        case TokenKind::begin_array:   return "'['";
        case TokenKind::end_array:     return "']'";
        case TokenKind::colon:         return "':'";
        case TokenKind::comma:         return "','";
        case TokenKind::string:        return "string";
        case TokenKind::number:        return "number";
        case TokenKind::true_literal:  return "true";
        case TokenKind::false_literal: return "false";
        case TokenKind::null_literal:  return "null";
        case TokenKind::end_of_input:  return "end of input";
    }
    return "unknown";
}

struct Token {
    TokenKind        kind = TokenKind::end_of_input;
    std::string_view raw;      ///< Source bytes of the token
    std::string      text;     ///< Decoded content (strings only)
    size_t           offset = 0;
};

} // namespace json

namespace detail {

class JsonLexer {
public:
    JsonLexer(std::string_view input, const DecodeOptions& opts) noexcept
        : begin_(input.data())
        , ptr_(input.data())
        , end_(input.data() + input.size())
        , opts_(&opts) {}

    JsonLexer(const JsonLexer&) = delete;
    JsonLexer& operator=(const JsonLexer&) = delete;

    // ─── Token access ──────────────────────────────────────────────────

    const json::Token& peek() {
        if (!has_token_) {
            scan();
            has_token_ = true;
        }
        return token_;
    }

    json::Token take() {
        peek();
        has_token_ = false;
        return std::move(token_);
    }

    [[nodiscard]] bool at_end() { return peek().kind == json::TokenKind::end_of_input; }

    /// Byte offset of the next unconsumed token.
    [[nodiscard]] size_t offset() const noexcept {
        return has_token_ ? token_.offset : static_cast<size_t>(ptr_ - begin_);
    }

    // ─── Depth tracking ────────────────────────────────────────────────

    /// Called by the reader when it enters an array or object.
    void push_depth(size_t at) {
        const size_t limit = opts_->max_depth > 0 ? opts_->max_depth : YADEC_MAX_DEPTH;
        if (YADEC_UNLIKELY(++depth_ > limit)) {
            fail(at, "maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }

    void pop_depth() noexcept { --depth_; }

    /// Forget depth left over from a document abandoned by an exception.
    void reset_depth() noexcept { depth_ = 0; }

    // ─── Error reporting ───────────────────────────────────────────────

    [[nodiscard]] SourceLocation location_of(size_t offset) const noexcept {
        return locate(std::string_view(begin_, static_cast<size_t>(end_ - begin_)), offset);
    }

    [[noreturn]] YADEC_NOINLINE void fail(size_t offset, const std::string& msg,
                                          errc code = errc::unexpected_character) const {
        throw SyntaxError(msg, location_of(offset), code);
    }

    /// A token the grammar does not allow at this point.
    [[noreturn]] YADEC_NOINLINE void fail_unexpected(const json::Token& t) const {
        if (t.kind == json::TokenKind::end_of_input) {
            fail(t.offset, "unexpected end of input", errc::unexpected_end_of_input);
        }
        fail(t.offset, std::string("unexpected ") + json::token_kind_name(t.kind));
    }

private:
    [[nodiscard]] size_t pos() const noexcept { return static_cast<size_t>(ptr_ - begin_); }

    [[noreturn]] void fail_here(const std::string& msg, errc code = errc::unexpected_character) const {
        fail(pos(), msg, code);
    }

    // ─── Whitespace and comments ───────────────────────────────────────

    void skip_whitespace() noexcept {
        while (ptr_ < end_) {
            const char c = *ptr_;
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') ++ptr_;
            else return;
        }
    }

    void skip_ws_and_comments() {
        skip_whitespace();
        if (YADEC_LIKELY(!opts_->allow_comments)) return;
        while (ptr_ + 1 < end_ && *ptr_ == '/') {
            if (ptr_[1] == '/') {
                ptr_ += 2;
                while (ptr_ < end_ && *ptr_ != '\n') ++ptr_;
            } else if (ptr_[1] == '*') {
                const size_t start = pos();
                ptr_ += 2;
                for (;;) {
                    if (ptr_ + 1 >= end_) {
                        fail(start, "unterminated block comment", errc::unexpected_end_of_input);
                    }
                    if (ptr_[0] == '*' && ptr_[1] == '/') {
                        ptr_ += 2;
                        break;
                    }
                    ++ptr_;
                }
            } else {
                return;
            }
            skip_whitespace();
        }
    }

    // ─── Token scanning ────────────────────────────────────────────────

    void scan() {
        skip_ws_and_comments();
        token_.text.clear();
        token_.offset = pos();
        const char* start = ptr_;

        if (ptr_ >= end_) {
            token_.kind = json::TokenKind::end_of_input;
            token_.raw = {};
            return;
        }

        switch (*ptr_) {
            case '{': ++ptr_; token_.kind = json::TokenKind::begin_object; break;
            case '}': ++ptr_; token_.kind = json::TokenKind::end_object;   break;
            case '[': ++ptr_; token_.kind = json::TokenKind::begin_array;  break;
            case ']': ++ptr_; token_.kind = json::TokenKind::end_array;    break;
            case ':': ++ptr_; token_.kind = json::TokenKind::colon;        break;
            case ',': ++ptr_; token_.kind = json::TokenKind::comma;        break;
            case '"':
                scan_string();
                token_.kind = json::TokenKind::string;
                break;
            case 't':
                expect_literal("true");
                token_.kind = json::TokenKind::true_literal;
                break;
            case 'f':
                expect_literal("false");
                token_.kind = json::TokenKind::false_literal;
                break;
            case 'n':
                expect_literal("null");
                token_.kind = json::TokenKind::null_literal;
                break;
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                scan_number();
                token_.kind = json::TokenKind::number;
                break;
            default:
                fail_here(std::string("unexpected character '") + *ptr_ + "'");
        }
        token_.raw = std::string_view(start, static_cast<size_t>(ptr_ - start));
    }

    template <size_t N>
    void expect_literal(const char (&literal)[N]) {
        constexpr size_t len = N - 1;
        if (YADEC_UNLIKELY(static_cast<size_t>(end_ - ptr_) < len) ||
            YADEC_UNLIKELY(std::memcmp(ptr_, literal, len) != 0)) {
            fail_here(std::string("expected '") + literal + "'", errc::invalid_literal);
        }
        ptr_ += len;
    }

    // ─── Strings ───────────────────────────────────────────────────────

    void scan_string() {
        const size_t start = pos();
        ++ptr_;
        std::string& out = token_.text;
        for (;;) {
            const char* run = ptr_;
            while (ptr_ < end_ && *ptr_ != '"' && *ptr_ != '\\' &&
                   static_cast<unsigned char>(*ptr_) >= 0x20) {
                ++ptr_;
            }
            if (ptr_ > run) out.append(run, static_cast<size_t>(ptr_ - run));

            if (YADEC_UNLIKELY(ptr_ >= end_)) {
                fail(start, "unterminated string", errc::unterminated_string);
            }
            const char c = *ptr_;
            if (YADEC_LIKELY(c == '"')) {
                ++ptr_;
                return;
            }
            if (c != '\\') fail_here("control character in string");
            ++ptr_;
            parse_escape(out);
        }
    }

    void parse_escape(std::string& out) {
        if (YADEC_UNLIKELY(ptr_ >= end_))
            fail_here("unterminated escape sequence", errc::invalid_escape);
        const char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case 'u':  parse_unicode_escape(out); return;
            default:
                --ptr_;
                fail_here(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
    }

    static int hex_value(char h) noexcept {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return h - 'a' + 10;
        if (h >= 'A' && h <= 'F') return h - 'A' + 10;
        return -1;
    }

    uint32_t parse_hex4() {
        if (YADEC_UNLIKELY(end_ - ptr_ < 4))
            fail_here("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const int nib = hex_value(ptr_[i]);
            if (YADEC_UNLIKELY(nib < 0))
                fail_here("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            val = (val << 4) | static_cast<uint32_t>(nib);
        }
        ptr_ += 4;
        return val;
    }

    void parse_unicode_escape(std::string& out) {
        uint32_t cp = parse_hex4();

        if (utf8::is_high_surrogate(cp)) {
            if (YADEC_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u')) {
                fail_here("missing low surrogate", errc::invalid_unicode_escape);
            }
            ptr_ += 2;
            const uint32_t low = parse_hex4();
            if (YADEC_UNLIKELY(!utf8::is_low_surrogate(low))) {
                fail_here("invalid low surrogate value", errc::invalid_unicode_escape);
            }
            cp = utf8::combine_surrogates(cp, low);
        } else if (YADEC_UNLIKELY(utf8::is_low_surrogate(cp))) {
            fail_here("unexpected low surrogate", errc::invalid_unicode_escape);
        }
        utf8::encode(cp, out);
    }

    // ─── Numbers ───────────────────────────────────────────────────────

    static bool is_digit(char c) noexcept { return static_cast<unsigned>(c - '0') <= 9u; }

    void scan_number() {
        if (*ptr_ == '-') ++ptr_;
        if (YADEC_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_))) {
            fail_here("invalid number", errc::invalid_number);
        }
        if (*ptr_ == '0') {
            ++ptr_;
        } else {
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (ptr_ < end_ && *ptr_ == '.') {
            ++ptr_;
            if (YADEC_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_))) {
                fail_here("expected digit after decimal point", errc::invalid_number);
            }
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            ++ptr_;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) ++ptr_;
            if (YADEC_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_))) {
                fail_here("expected digit in exponent", errc::invalid_number);
            }
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }
    }

    const char* begin_;
    const char* ptr_;
    const char* end_;
    const DecodeOptions* opts_;
    size_t depth_ = 0;
    bool has_token_ = false;
    json::Token token_;
};

} // namespace detail
} // namespace yadec
