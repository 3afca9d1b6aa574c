/// @file html_utils.hpp
/// @brief HTML escaping and CSS formatting helpers.

#pragma once

#include <spanned-html-cpp/color.hpp>

#include <string>
#include <string_view>

namespace spanned_html_cpp {

/// Escape UTF-8 text for inclusion in HTML.
///
/// Matches the escaping rules of Android's `Html.escapeHtml`:
/// - `<`, `>` and `&` become `&lt;`, `&gt;` and `&amp;`.
/// - Code points below U+0020 or above U+007E become decimal numeric
///   character references (so CR and LF become `&#13;` and `&#10;`).
/// - In a run of spaces every space except the last becomes `&nbsp;`.
/// - Malformed UTF-8 bytes become `&#65533;`.
auto escape_html(std::string_view text) -> std::string;

/// Format a color as a CSS `rgba()` value, e.g. `rgba(255,0,0,0.502)`.
///
/// The alpha channel is written as alpha/255 with three decimals. Output
/// does not depend on the current locale.
auto to_css_rgba(PackedColor color) -> std::string;

/// Build a selector matching elements with `class_name` and all their
/// descendants: `.c,.c *`.
auto css_all_class_descendants_selector(std::string_view class_name) -> std::string;

}  // namespace spanned_html_cpp
