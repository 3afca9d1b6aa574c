/// @file color.hpp
/// @brief Packed ARGB color values and component accessors.

#pragma once

#include <cstdint>

namespace spanned_html_cpp {

/// A color packed as 0xAARRGGBB into a signed 32-bit integer.
///
/// The signed representation is observable: background color class names
/// embed the decimal value, so opaque colors produce negative numbers
/// (e.g. opaque green 0xFF00FF00 becomes `bg_-16711936`).
using PackedColor = std::int32_t;

/// Pack alpha, red, green and blue components (each 0..255) into a color.
constexpr auto argb(std::uint8_t a, std::uint8_t r,
                    std::uint8_t g, std::uint8_t b) noexcept -> PackedColor {
    return static_cast<PackedColor>(
        (static_cast<std::uint32_t>(a) << 24) |
        (static_cast<std::uint32_t>(r) << 16) |
        (static_cast<std::uint32_t>(g) << 8) |
        static_cast<std::uint32_t>(b));
}

/// Pack an opaque color.
constexpr auto rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept -> PackedColor {
    return argb(0xFF, r, g, b);
}

constexpr auto alpha(PackedColor c) noexcept -> int {
    return static_cast<int>((static_cast<std::uint32_t>(c) >> 24) & 0xFF);
}

constexpr auto red(PackedColor c) noexcept -> int {
    return static_cast<int>((static_cast<std::uint32_t>(c) >> 16) & 0xFF);
}

constexpr auto green(PackedColor c) noexcept -> int {
    return static_cast<int>((static_cast<std::uint32_t>(c) >> 8) & 0xFF);
}

constexpr auto blue(PackedColor c) noexcept -> int {
    return static_cast<int>(static_cast<std::uint32_t>(c) & 0xFF);
}

}  // namespace spanned_html_cpp
