#pragma once

/// @file tag.hpp
/// @author Aleksandr Loshkarev
/// @brief Field tag strings: `json:"name,opts" xml:"a>b>name,opts"`.
///
/// A tag is a space-separated list of `key:"value"` pairs. The value's
/// first comma-separated element is the serialized name; the rest are
/// options. Malformed pairs end the scan (the remaining text is ignored).

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yadec {

/// @brief Name and options of one tag value, e.g. "sliceInt>i,omitempty".
struct TagValue {
    std::string_view name;
    std::string_view options;

    /// Whether @p option appears in the comma-separated option list.
    [[nodiscard]] bool has_option(std::string_view option) const noexcept {
        std::string_view rest = options;
        while (!rest.empty()) {
            const size_t comma = rest.find(',');
            std::string_view item = rest.substr(0, comma);
            if (item == option) return true;
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
        return false;
    }

    /// The name split at '>' into wrapper segments plus the leaf name.
    [[nodiscard]] std::vector<std::string> path() const {
        std::vector<std::string> segments;
        std::string_view rest = name;
        for (;;) {
            const size_t gt = rest.find('>');
            segments.emplace_back(rest.substr(0, gt));
            if (gt == std::string_view::npos) break;
            rest.remove_prefix(gt + 1);
        }
        return segments;
    }
};

/// @brief Split a tag value at the first comma.
[[nodiscard]] inline TagValue parse_tag_value(std::string_view value) noexcept {
    TagValue tv;
    const size_t comma = value.find(',');
    if (comma == std::string_view::npos) {
        tv.name = value;
    } else {
        tv.name = value.substr(0, comma);
        tv.options = value.substr(comma + 1);
    }
    return tv;
}

/// @brief Find the value stored under @p key in a tag string.
/// @return std::nullopt when the key is absent or the tag is malformed
///         before the key is reached.
[[nodiscard]] inline std::optional<std::string_view> lookup_tag(std::string_view tag,
                                                                std::string_view key) noexcept {
    size_t i = 0;
    const size_t n = tag.size();
    while (i < n) {
        while (i < n && tag[i] == ' ') ++i;
        if (i >= n) break;

        // Key: non-control, non-space, non-quote, non-colon characters.
        const size_t key_start = i;
        while (i < n && tag[i] > ' ' && tag[i] != ':' && tag[i] != '"' && tag[i] != 0x7f) ++i;
        if (i == key_start || i + 1 >= n || tag[i] != ':' || tag[i + 1] != '"') break;
        const std::string_view name = tag.substr(key_start, i - key_start);
        i += 2;

        // Quoted value; backslash escapes the next character.
        const size_t value_start = i;
        while (i < n && tag[i] != '"') {
            if (tag[i] == '\\') ++i;
            ++i;
        }
        if (i >= n) break;
        const std::string_view value = tag.substr(value_start, i - value_start);
        ++i;

        if (name == key) return value;
    }
    return std::nullopt;
}

} // namespace yadec
