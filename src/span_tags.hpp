#pragma once

// Per-kind mapping from a SpanKind to its opening and closing markup.
//
// opening_tag() and closing_tag() are always called as a pair: whenever a
// kind yields an opening tag it must also yield a closing tag. Kinds (or
// payloads) that have no HTML rendition yield nullopt from both and are
// dropped from the output, leaving their text unstyled.
//
// Internal header — not installed.

#include <spanned-html-cpp/span.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace spanned_html_cpp::detail {

/// The markup opening `kind`, or nullopt if the kind has no rendition.
/// `display_density` converts non-dip absolute sizes into CSS px.
auto opening_tag(const SpanKind& kind, float display_density) -> std::optional<std::string>;

/// The markup closing `kind`. Ruby closing markup carries the escaped
/// ruby text.
auto closing_tag(const SpanKind& kind) -> std::optional<std::string>;

/// CSS `text-emphasis-style` value for an emphasis mark.
auto text_emphasis_style(EmphasisMark mark) -> std::string_view;

/// CSS `text-emphasis-position` value for an emphasis position.
auto text_emphasis_position(EmphasisPosition position) -> std::string_view;

/// Escape a slice of text and turn escaped line breaks (`&#10;`, and
/// `&#13;&#10;` pairs) into a single `<br>`.
auto escape_text(std::string_view text) -> std::string;

}  // namespace spanned_html_cpp::detail
