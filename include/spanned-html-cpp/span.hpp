/// @file span.hpp
/// @brief Annotation kinds and the Span type that places them on text.

#pragma once

#include <spanned-html-cpp/color.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace spanned_html_cpp {

// -- Enumerations -------------------------------------------------------------

/// Font style carried by a StyleSpan.
enum class TextStyle : std::uint8_t {
    normal,       ///< No styling; produces no markup.
    bold,         ///< Bold weight.
    italic,       ///< Italic slant.
    bold_italic,  ///< Both bold and italic.
};

/// Convert a TextStyle to its string representation.
constexpr auto to_string_view(TextStyle style) noexcept -> std::string_view {
    switch (style) {
        case TextStyle::normal:      return "normal";
        case TextStyle::bold:        return "bold";
        case TextStyle::italic:      return "italic";
        case TextStyle::bold_italic: return "bold_italic";
    }
    return "unknown";
}

/// Where ruby text is placed relative to its base text.
enum class RubyPosition : std::uint8_t {
    unknown,  ///< Not specified by the source; rendered as `unset`.
    over,     ///< Above the base text (horizontal) or right of it (vertical).
    under,    ///< Below the base text (horizontal) or left of it (vertical).
};

/// Convert a RubyPosition to its string representation.
constexpr auto to_string_view(RubyPosition position) noexcept -> std::string_view {
    switch (position) {
        case RubyPosition::unknown: return "unknown";
        case RubyPosition::over:    return "over";
        case RubyPosition::under:   return "under";
    }
    return "unknown";
}

/// Shape of a text emphasis mark.
enum class EmphasisMark : std::uint8_t {
    unknown,
    auto_mark,  ///< Chosen by the renderer based on writing mode.
    filled_circle,
    filled_dot,
    filled_sesame,
    open_circle,
    open_dot,
    open_sesame,
};

/// Convert an EmphasisMark to its string representation.
constexpr auto to_string_view(EmphasisMark mark) noexcept -> std::string_view {
    switch (mark) {
        case EmphasisMark::unknown:       return "unknown";
        case EmphasisMark::auto_mark:     return "auto";
        case EmphasisMark::filled_circle: return "filled_circle";
        case EmphasisMark::filled_dot:    return "filled_dot";
        case EmphasisMark::filled_sesame: return "filled_sesame";
        case EmphasisMark::open_circle:   return "open_circle";
        case EmphasisMark::open_dot:      return "open_dot";
        case EmphasisMark::open_sesame:   return "open_sesame";
    }
    return "unknown";
}

/// Placement of text emphasis marks relative to the text.
enum class EmphasisPosition : std::uint8_t {
    unknown,
    before,   ///< Over the text (horizontal) or right of it (vertical).
    after,    ///< Under the text (horizontal) or left of it (vertical).
    outside,  ///< Outside the line box; treated as `before`.
};

/// Convert an EmphasisPosition to its string representation.
constexpr auto to_string_view(EmphasisPosition position) noexcept -> std::string_view {
    switch (position) {
        case EmphasisPosition::unknown: return "unknown";
        case EmphasisPosition::before:  return "before";
        case EmphasisPosition::after:   return "after";
        case EmphasisPosition::outside: return "outside";
    }
    return "unknown";
}

// -- Span kinds ---------------------------------------------------------------

/// Draws a line through the text.
struct Strikethrough {
    auto operator==(const Strikethrough&) const -> bool = default;
};

/// Sets the text color.
struct ForegroundColor {
    PackedColor color{0};
    auto operator==(const ForegroundColor&) const -> bool = default;
};

/// Sets the background color behind the text and everything nested in it.
struct BackgroundColor {
    PackedColor color{0};
    auto operator==(const BackgroundColor&) const -> bool = default;
};

/// Lays out horizontal text upright in a vertical line (tate-chu-yoko).
struct HorizontalTextInVertical {
    auto operator==(const HorizontalTextInVertical&) const -> bool = default;
};

/// Sets an absolute font size.
struct AbsoluteSize {
    float size{0.0f};  ///< Size in device pixels, or in dips if `dip` is set.
    bool dip{false};   ///< True if `size` is already density independent.
    auto operator==(const AbsoluteSize&) const -> bool = default;
};

/// Scales the font size relative to the surrounding text.
struct RelativeSize {
    float size_change{1.0f};  ///< Multiplier, e.g. 1.5 for 150%.
    auto operator==(const RelativeSize&) const -> bool = default;
};

/// Sets the font family. A typeface without a family produces no markup.
struct Typeface {
    std::optional<std::string> family;
    auto operator==(const Typeface&) const -> bool = default;
};

/// Bold and/or italic styling.
struct StyleSpan {
    TextStyle style{TextStyle::normal};
    auto operator==(const StyleSpan&) const -> bool = default;
};

/// Ruby annotation text attached to the spanned base text.
struct Ruby {
    std::string text;  ///< The annotation text (unescaped).
    RubyPosition position{RubyPosition::unknown};
    auto operator==(const Ruby&) const -> bool = default;
};

/// Underlines the text.
struct Underline {
    auto operator==(const Underline&) const -> bool = default;
};

/// Emphasis marks drawn next to each character.
struct TextEmphasis {
    EmphasisMark mark{EmphasisMark::unknown};
    EmphasisPosition position{EmphasisPosition::unknown};
    auto operator==(const TextEmphasis&) const -> bool = default;
};

/// The closed set of annotation kinds that can be attached to text.
using SpanKind = std::variant<
    Strikethrough,
    ForegroundColor,
    BackgroundColor,
    HorizontalTextInVertical,
    AbsoluteSize,
    RelativeSize,
    Typeface,
    StyleSpan,
    Ruby,
    Underline,
    TextEmphasis
>;

/// An annotation placed on the range [start, end) of a SpannedText.
///
/// Offsets are UTF-8 code-unit offsets. Spans may overlap or share
/// offsets arbitrarily; `start == end` is allowed.
struct Span {
    std::size_t start{0};  ///< Start offset (inclusive).
    std::size_t end{0};    ///< End offset (exclusive).
    SpanKind kind;         ///< What the span does.

    auto operator==(const Span&) const -> bool = default;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Ruby& r) { printf("ruby: %s\n", r.text.c_str()); },
///     [](const auto&) { printf("other\n"); },
/// }, span.kind);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace spanned_html_cpp
