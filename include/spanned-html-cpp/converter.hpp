/// @file converter.hpp
/// @brief Conversion of SpannedText into an HTML fragment plus CSS rules.

#pragma once

#include <spanned-html-cpp/spanned_text.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace spanned_html_cpp {

/// An HTML fragment and the CSS rule sets it needs.
struct HtmlAndCss {
    /// Escaped text interleaved with markup.
    std::string html;

    /// CSS rule sets used to style `html`.
    ///
    /// Each key is a CSS selector and each value a declaration block
    /// without braces (e.g. `prop1:val1;prop2:val2;`).
    std::map<std::string, std::string> css_rule_sets;

    auto operator==(const HtmlAndCss&) const -> bool = default;
};

/// Convert spanned text into HTML, adding tags and styling that match its
/// spans. All textual content is HTML-escaped and line breaks become
/// `<br>`.
///
/// Overlapping (crossing) spans produce overlapping tags. Lenient HTML
/// renderers such as WebView handle these the same way a native text view
/// would render the spans, so no attempt is made to split them into a
/// strictly nested tree.
///
/// @param text The spanned text to convert.
/// @param display_density Screen density (device px per dip), > 0. Used to
///     convert non-dip absolute sizes into CSS px.
auto convert(const SpannedText& text, float display_density) -> HtmlAndCss;

/// Convert possibly-absent spanned text. `nullopt` yields an empty result.
auto convert(const std::optional<SpannedText>& text, float display_density) -> HtmlAndCss;

/// Convert plain text with no spans: the result is the escaped text and no
/// CSS.
auto convert(std::string_view text, float display_density) -> HtmlAndCss;

}  // namespace spanned_html_cpp
