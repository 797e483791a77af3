#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <vector>

// --- Helper Namespace ---
namespace MailAuth::detail {

// Two modes:
//   {}          compact lowercase hex on one line
//   {:x} {:16X} hexdump with offsets and an ASCII column, optional width
// Both accept a trailing L<N> to cap the number of bytes shown ({:L32}, {:xL64}).
template <typename ByteType, typename FormatContext>
auto format_bytes(const std::vector<ByteType>& data, FormatContext& ctx,
                  size_t width, char presentation, size_t limit) {
    auto out = ctx.out();
    if (data.empty()) {
        return std::format_to(out, "[empty]");
    }

    const size_t shown = std::min(data.size(), limit);

    if (presentation == 'c') {
        for (size_t i = 0; i < shown; ++i) {
            out = std::format_to(out, "{:02x}", static_cast<uint8_t>(data[i]));
        }
    } else {
        std::string ascii;
        ascii.reserve(width);
        for (size_t i = 0; i < shown; ++i) {
            const uint8_t byte_value = static_cast<uint8_t>(data[i]);
            if (i % width == 0) {
                if (i > 0) {
                    out = std::format_to(out, " |{}|\n", ascii);
                    ascii.clear();
                }
                out = std::format_to(out, "{:04X}: ", i);
            }
            out = presentation == 'X' ? std::format_to(out, "{:02X} ", byte_value)
                                      : std::format_to(out, "{:02x} ", byte_value);
            ascii += std::isprint(byte_value) ? static_cast<char>(byte_value) : '.';
            if (i == shown - 1) {
                for (size_t j = (i % width) + 1; j < width; ++j) {
                    out = std::format_to(out, "   ");
                }
                out = std::format_to(out, " |{}|", ascii);
            }
        }
    }

    if (shown < data.size()) {
        out = std::format_to(out, presentation == 'c' ? "... ({} bytes left)" : "\n({} bytes left)",
                             data.size() - shown);
    }
    return out;
}

inline constexpr auto parse_bytes_spec(std::format_parse_context& ctx,
                                       size_t& width, char& presentation,
                                       size_t& limit) {
    auto it = ctx.begin(), end = ctx.end();
    limit = SIZE_MAX;

    if (it != end && *it >= '0' && *it <= '9') {
        size_t w = 0;
        do {
            w = w * 10 + static_cast<size_t>(*it - '0');
            ++it;
        } while (it != end && *it >= '0' && *it <= '9');
        if (w > 0) {
            width = w;
        }
        presentation = 'x';
    }

    if (it != end && (*it == 'x' || *it == 'X')) {
        presentation = *it;
        ++it;
    }

    if (it != end && (*it == 'l' || *it == 'L')) {
        ++it;
        if (it == end || *it < '0' || *it > '9') {
            throw std::format_error("invalid limit specifier: 'L' must be followed by digits");
        }
        size_t lim_val = 0;
        do {
            lim_val = lim_val * 10 + static_cast<size_t>(*it - '0');
            ++it;
        } while (it != end && *it >= '0' && *it <= '9');
        limit = lim_val;
    }

    if (it != end && *it != '}') {
        throw std::format_error("invalid format specifier for byte vector");
    }
    return it;
}

} // namespace MailAuth::detail

namespace std {

struct mailauth_bytes_formatter_base {
    char presentation = 'c';
    size_t width = 16;
    size_t limit = SIZE_MAX;

    constexpr auto parse(format_parse_context& ctx) {
        return MailAuth::detail::parse_bytes_spec(ctx, width, presentation, limit);
    }
};

template <>
struct formatter<std::vector<uint8_t>> : public mailauth_bytes_formatter_base {
    template <typename FormatContext>
    auto format(const std::vector<uint8_t>& data, FormatContext& ctx) const {
        return MailAuth::detail::format_bytes(data, ctx, width, presentation, limit);
    }
};

template <>
struct formatter<std::vector<char>> : public mailauth_bytes_formatter_base {
    template <typename FormatContext>
    auto format(const std::vector<char>& data, FormatContext& ctx) const {
        return MailAuth::detail::format_bytes(data, ctx, width, presentation, limit);
    }
};

} // namespace std
