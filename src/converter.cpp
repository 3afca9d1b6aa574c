#include <spanned-html-cpp/converter.hpp>
#include <spanned-html-cpp/html_utils.hpp>

#include "span_tags.hpp"
#include "transitions.hpp"

#include <cassert>
#include <cstddef>
#include <map>
#include <set>
#include <string>

namespace spanned_html_cpp {

namespace {

// A background color is carried by one wrapping element but must also tint
// every element nested inside it, so it is applied through a class rule
// that matches the element and all its descendants.
auto background_color_rule_sets(const SpannedText& text)
    -> std::map<std::string, std::string> {
    auto colors = std::set<PackedColor>{};
    for (const auto& bg : text.spans_of<BackgroundColor>()) {
        colors.insert(bg.color);
    }

    auto rule_sets = std::map<std::string, std::string>{};
    for (auto color : colors) {
        rule_sets.emplace(
            css_all_class_descendants_selector("bg_" + std::to_string(color)),
            "background-color:" + to_css_rgba(color) + ";");
    }
    return rule_sets;
}

}  // anonymous namespace

auto convert(const SpannedText& text, float display_density) -> HtmlAndCss {
    assert(display_density > 0.0f);

    auto result = HtmlAndCss{};
    result.css_rule_sets = background_color_rule_sets(text);

    const auto span_transitions = detail::SpanTransitions{text, display_density};
    auto& html = result.html;
    html.reserve(text.length());

    auto previous = std::size_t{0};
    for (const auto& [index, transition] : span_transitions.transitions()) {
        html += detail::escape_text(text.sub_text(previous, index));
        for (const auto* info : transition.spans_removed) {
            html += info->closing_tag;
        }
        for (const auto* info : transition.spans_added) {
            html += info->opening_tag;
        }
        previous = index;
    }
    html += detail::escape_text(text.sub_text(previous, text.length()));

    return result;
}

auto convert(const std::optional<SpannedText>& text, float display_density) -> HtmlAndCss {
    if (!text) return HtmlAndCss{};
    return convert(*text, display_density);
}

auto convert(std::string_view text, float /*display_density*/) -> HtmlAndCss {
    return HtmlAndCss{detail::escape_text(text), {}};
}

}  // namespace spanned_html_cpp
