#include "span_tags.hpp"

#include "format.hpp"

#include <spanned-html-cpp/html_utils.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace spanned_html_cpp::detail {

namespace {

constexpr std::string_view span_close = "</span>";

}  // anonymous namespace

auto opening_tag(const SpanKind& kind, float display_density) -> std::optional<std::string> {
    return std::visit(overload{
        [](const Strikethrough&) -> std::optional<std::string> {
            return "<span style='text-decoration:line-through;'>";
        },
        [](const ForegroundColor& k) -> std::optional<std::string> {
            return "<span style='color:" + to_css_rgba(k.color) + ";'>";
        },
        [](const BackgroundColor& k) -> std::optional<std::string> {
            return "<span class='bg_" + std::to_string(k.color) + "'>";
        },
        [](const HorizontalTextInVertical&) -> std::optional<std::string> {
            return "<span style='text-combine-upright:all;'>";
        },
        [&](const AbsoluteSize& k) -> std::optional<std::string> {
            const auto size_css_px = k.dip ? k.size : k.size / display_density;
            return "<span style='font-size:" + format_fixed(size_css_px, 2) + "px;'>";
        },
        [](const RelativeSize& k) -> std::optional<std::string> {
            return "<span style='font-size:" + format_fixed(k.size_change * 100, 2) + "%;'>";
        },
        [](const Typeface& k) -> std::optional<std::string> {
            if (!k.family) return std::nullopt;
            return "<span style='font-family:\"" + *k.family + "\";'>";
        },
        [](const StyleSpan& k) -> std::optional<std::string> {
            switch (k.style) {
                case TextStyle::bold:        return "<b>";
                case TextStyle::italic:      return "<i>";
                case TextStyle::bold_italic: return "<b><i>";
                case TextStyle::normal:      break;
            }
            return std::nullopt;
        },
        [](const Ruby& k) -> std::optional<std::string> {
            switch (k.position) {
                case RubyPosition::over:    return "<ruby style='ruby-position:over;'>";
                case RubyPosition::under:   return "<ruby style='ruby-position:under;'>";
                case RubyPosition::unknown: return "<ruby style='ruby-position:unset;'>";
            }
            return std::nullopt;
        },
        [](const Underline&) -> std::optional<std::string> {
            return "<u>";
        },
        [](const TextEmphasis& k) -> std::optional<std::string> {
            const auto style = std::string{text_emphasis_style(k.mark)};
            const auto position = std::string{text_emphasis_position(k.position)};
            return "<span style='-webkit-text-emphasis-style: " + style +
                   "; text-emphasis-style: " + style +
                   "; -webkit-text-emphasis-position: " + position +
                   "; text-emphasis-position: " + position + ";'>";
        },
    }, kind);
}

auto closing_tag(const SpanKind& kind) -> std::optional<std::string> {
    return std::visit(overload{
        [](const Typeface& k) -> std::optional<std::string> {
            if (!k.family) return std::nullopt;
            return std::string{span_close};
        },
        [](const StyleSpan& k) -> std::optional<std::string> {
            switch (k.style) {
                case TextStyle::bold:        return "</b>";
                case TextStyle::italic:      return "</i>";
                case TextStyle::bold_italic: return "</i></b>";
                case TextStyle::normal:      break;
            }
            return std::nullopt;
        },
        [](const Ruby& k) -> std::optional<std::string> {
            return "<rt>" + escape_text(k.text) + "</rt></ruby>";
        },
        [](const Underline&) -> std::optional<std::string> {
            return "</u>";
        },
        [](const Strikethrough&) -> std::optional<std::string> { return std::string{span_close}; },
        [](const ForegroundColor&) -> std::optional<std::string> { return std::string{span_close}; },
        [](const BackgroundColor&) -> std::optional<std::string> { return std::string{span_close}; },
        [](const HorizontalTextInVertical&) -> std::optional<std::string> { return std::string{span_close}; },
        [](const AbsoluteSize&) -> std::optional<std::string> { return std::string{span_close}; },
        [](const RelativeSize&) -> std::optional<std::string> { return std::string{span_close}; },
        [](const TextEmphasis&) -> std::optional<std::string> { return std::string{span_close}; },
    }, kind);
}

auto text_emphasis_style(EmphasisMark mark) -> std::string_view {
    switch (mark) {
        case EmphasisMark::filled_circle: return "filled circle";
        case EmphasisMark::filled_dot:    return "filled dot";
        case EmphasisMark::filled_sesame: return "filled sesame";
        case EmphasisMark::open_circle:   return "open circle";
        case EmphasisMark::open_dot:      return "open dot";
        case EmphasisMark::open_sesame:   return "open sesame";
        // TODO: auto should be filled sesame in vertical writing modes and
        // filled circle otherwise, once the writing mode reaches the converter.
        case EmphasisMark::auto_mark:
        case EmphasisMark::unknown:
            break;
    }
    return "unset";
}

auto text_emphasis_position(EmphasisPosition position) -> std::string_view {
    switch (position) {
        case EmphasisPosition::after:
            return "under left";
        // Unrecognized annotation positions must be treated as "before"
        // (TTML2 #style-value-annotation-position). "outside" is not
        // supported by CSS.
        case EmphasisPosition::unknown:
        case EmphasisPosition::before:
        case EmphasisPosition::outside:
            break;
    }
    return "over right";
}

auto escape_text(std::string_view text) -> std::string {
    static constexpr std::string_view cr = "&#13;";
    static constexpr std::string_view lf = "&#10;";

    const auto escaped = escape_html(text);
    auto result = std::string{};
    result.reserve(escaped.size());
    auto view = std::string_view{escaped};
    std::size_t pos = 0;
    while (pos < view.size()) {
        if (view.compare(pos, cr.size() + lf.size(), "&#13;&#10;") == 0) {
            result += "<br>";
            pos += cr.size() + lf.size();
        } else if (view.compare(pos, lf.size(), lf) == 0) {
            result += "<br>";
            pos += lf.size();
        } else {
            result.push_back(view[pos]);
            ++pos;
        }
    }
    return result;
}

}  // namespace spanned_html_cpp::detail
