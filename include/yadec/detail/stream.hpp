#pragma once

/// @file stream.hpp
/// @author Aleksandr Loshkarev
/// @brief Read a whole std::istream into an owned buffer.

#include <cstddef>
#include <istream>
#include <string>

namespace yadec::detail {

/// @brief Efficiently read an entire istream into a string.
///
/// Strategy:
///   1. Seekable streams (files): determine size, reserve, read in one pass.
///   2. Non-seekable streams (pipes, sockets): read in 64 KB chunks.
///
/// Blocks until end of stream.
inline std::string read_stream(std::istream& is) {
    std::string content;

    const auto start_pos = is.tellg();
    if (start_pos != std::istream::pos_type(-1)) {
        is.seekg(0, std::ios::end);
        const auto end_pos = is.tellg();
        if (end_pos != std::istream::pos_type(-1) && end_pos > start_pos) {
            const auto size = static_cast<size_t>(end_pos - start_pos);
            content.resize(size);
            is.seekg(start_pos);
            is.read(content.data(), static_cast<std::streamsize>(size));
            content.resize(static_cast<size_t>(is.gcount()));
            return content;
        }
        is.seekg(start_pos);
    }

    constexpr size_t kChunkSize = 65536;
    char buf[kChunkSize];
    while (is.read(buf, sizeof(buf)) || is.gcount() > 0) {
        content.append(buf, static_cast<size_t>(is.gcount()));
    }
    return content;
}

} // namespace yadec::detail
