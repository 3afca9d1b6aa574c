#include <spanned-html-cpp/spanned_html.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

using namespace spanned_html_cpp;

namespace {

// Reverse escape_html() and drop markup (<br> becomes a line feed), leaving
// only the text content. Enough for ASCII text without ruby annotations.
auto text_content(std::string_view html) -> std::string {
    auto out = std::string{};
    std::size_t i = 0;
    while (i < html.size()) {
        if (html[i] == '<') {
            const auto close = html.find('>', i);
            if (html.substr(i, close - i + 1) == "<br>") out.push_back('\n');
            i = close + 1;
        } else if (html[i] == '&') {
            const auto semi = html.find(';', i);
            const auto entity = html.substr(i + 1, semi - i - 1);
            if (entity == "lt") out.push_back('<');
            else if (entity == "gt") out.push_back('>');
            else if (entity == "amp") out.push_back('&');
            else if (entity == "nbsp") out.push_back(' ');
            else if (entity.starts_with('#')) {
                out.push_back(static_cast<char>(std::stoi(std::string{entity.substr(1)})));
            }
            i = semi + 1;
        } else {
            out.push_back(html[i++]);
        }
    }
    return out;
}

const auto green_color = rgb(0, 255, 0);  // packs to -16711936

}  // anonymous namespace

// -- Input without spans ------------------------------------------------------

TEST(Convert, absent_text_is_empty) {
    const auto result = convert(std::optional<SpannedText>{}, 1.0f);
    EXPECT_EQ(result.html, "");
    EXPECT_TRUE(result.css_rule_sets.empty());
}

TEST(Convert, present_optional_text_is_converted) {
    auto text = SpannedText{"Hi"};
    text.set_span(Underline{}, 0, 2);
    EXPECT_EQ(convert(std::optional{text}, 1.0f).html, "<u>Hi</u>");
}

TEST(Convert, plain_text_is_only_escaped) {
    const auto result = convert(std::string_view{"a<b & c"}, 1.0f);
    EXPECT_EQ(result.html, "a&lt;b &amp; c");
    EXPECT_TRUE(result.css_rule_sets.empty());
}

TEST(Convert, spanned_text_without_spans_matches_plain_text) {
    const auto raw = std::string{"Line one\r\nLine  two <3"};
    EXPECT_EQ(convert(SpannedText{raw}, 1.0f), convert(std::string_view{raw}, 1.0f));
    EXPECT_EQ(convert(SpannedText{raw}, 1.0f).html, "Line one<br>Line&nbsp; two &lt;3");
}

TEST(Convert, empty_text) {
    EXPECT_EQ(convert(SpannedText{""}, 1.0f), HtmlAndCss{});
}

// -- Single spans -------------------------------------------------------------

TEST(Convert, bold_prefix) {
    auto text = SpannedText{"Hello world"};
    text.set_span(StyleSpan{TextStyle::bold}, 0, 5);
    EXPECT_EQ(convert(text, 1.0f).html, "<b>Hello</b> world");
}

TEST(Convert, bold_italic_covers_whole_text) {
    auto text = SpannedText{"x"};
    text.set_span(StyleSpan{TextStyle::bold_italic}, 0, 1);
    EXPECT_EQ(convert(text, 1.0f).html, "<b><i>x</i></b>");
}

TEST(Convert, text_inside_spans_is_escaped) {
    auto text = SpannedText{"<&>"};
    text.set_span(StyleSpan{TextStyle::bold}, 0, 3);
    EXPECT_EQ(convert(text, 1.0f).html, "<b>&lt;&amp;&gt;</b>");
}

TEST(Convert, absolute_size_uses_display_density) {
    auto px = SpannedText{"ab"};
    px.set_span(AbsoluteSize{20.0f, false}, 0, 2);
    EXPECT_EQ(convert(px, 2.0f).html, "<span style='font-size:10.00px;'>ab</span>");

    auto dip = SpannedText{"ab"};
    dip.set_span(AbsoluteSize{20.0f, true}, 0, 2);
    EXPECT_EQ(convert(dip, 2.0f).html, "<span style='font-size:20.00px;'>ab</span>");
    EXPECT_EQ(convert(dip, 4.0f).html, "<span style='font-size:20.00px;'>ab</span>");
}

TEST(Convert, ruby_over) {
    auto text = SpannedText{"base"};
    text.set_span(Ruby{"T", RubyPosition::over}, 0, 4);
    EXPECT_EQ(convert(text, 1.0f).html,
              "<ruby style='ruby-position:over;'>base<rt>T</rt></ruby>");
}

TEST(Convert, ruby_text_is_escaped_once) {
    auto text = SpannedText{"a"};
    text.set_span(Ruby{"x&y", RubyPosition::under}, 0, 1);
    EXPECT_EQ(convert(text, 1.0f).html,
              "<ruby style='ruby-position:under;'>a<rt>x&amp;y</rt></ruby>");
}

TEST(Convert, text_emphasis) {
    auto text = SpannedText{"ab"};
    text.set_span(TextEmphasis{EmphasisMark::open_sesame, EmphasisPosition::before}, 0, 2);
    EXPECT_EQ(convert(text, 1.0f).html,
              "<span style='-webkit-text-emphasis-style: open sesame; "
              "text-emphasis-style: open sesame; "
              "-webkit-text-emphasis-position: over right; "
              "text-emphasis-position: over right;'>ab</span>");
}

TEST(Convert, unsupported_values_degrade_to_plain_text) {
    auto text = SpannedText{"Hi <you>"};
    text.set_span(StyleSpan{TextStyle::normal}, 0, 2);
    text.set_span(Typeface{}, 3, 8);
    const auto result = convert(text, 1.0f);
    EXPECT_EQ(result.html, "Hi &lt;you&gt;");
    EXPECT_TRUE(result.css_rule_sets.empty());
}

// -- Nesting order ------------------------------------------------------------

TEST(Convert, contained_span_nests_inside_container) {
    auto text = SpannedText{"Hello world"};
    text.set_span(StyleSpan{TextStyle::bold}, 2, 5);
    text.set_span(Underline{}, 0, 11);
    EXPECT_EQ(convert(text, 1.0f).html, "<u>He<b>llo</b> world</u>");
}

TEST(Convert, shared_start_opens_longer_span_first) {
    auto text = SpannedText{"Hello world"};
    text.set_span(StyleSpan{TextStyle::bold}, 0, 5);
    text.set_span(Underline{}, 0, 11);
    EXPECT_EQ(convert(text, 1.0f).html, "<u><b>Hello</b> world</u>");
}

TEST(Convert, shared_end_closes_later_started_span_first) {
    auto text = SpannedText{"Hello world"};
    text.set_span(Underline{}, 6, 11);
    text.set_span(StyleSpan{TextStyle::bold}, 0, 11);
    EXPECT_EQ(convert(text, 1.0f).html, "<b>Hello <u>world</u></b>");
}

TEST(Convert, identical_ranges_nest_by_tag_and_ignore_attach_order) {
    auto a = SpannedText{"Hello"};
    a.set_span(StyleSpan{TextStyle::bold}, 0, 5);
    a.set_span(StyleSpan{TextStyle::italic}, 0, 5);

    auto b = SpannedText{"Hello"};
    b.set_span(StyleSpan{TextStyle::italic}, 0, 5);
    b.set_span(StyleSpan{TextStyle::bold}, 0, 5);

    EXPECT_EQ(convert(a, 1.0f).html, "<b><i>Hello</i></b>");
    EXPECT_EQ(convert(b, 1.0f).html, "<b><i>Hello</i></b>");
}

TEST(Convert, adjacent_spans_close_before_opening) {
    auto text = SpannedText{"Hello world"};
    text.set_span(StyleSpan{TextStyle::bold}, 0, 6);
    text.set_span(StyleSpan{TextStyle::italic}, 6, 11);
    EXPECT_EQ(convert(text, 1.0f).html, "<b>Hello </b><i>world</i>");
}

TEST(Convert, crossing_spans_produce_overlapping_tags) {
    auto text = SpannedText{"Hello world"};
    text.set_span(StyleSpan{TextStyle::bold}, 0, 7);
    text.set_span(StyleSpan{TextStyle::italic}, 3, 11);
    EXPECT_EQ(convert(text, 1.0f).html, "<b>Hel<i>lo w</b>orld</i>");
}

TEST(Convert, empty_span_closes_before_it_opens) {
    auto text = SpannedText{"ab"};
    text.set_span(Underline{}, 1, 1);
    EXPECT_EQ(convert(text, 1.0f).html, "a</u><u>b");
}

// -- Background colors --------------------------------------------------------

TEST(Convert, background_color_uses_class_and_descendant_rule) {
    auto text = SpannedText{"Hello world"};
    text.set_span(BackgroundColor{green_color}, 0, 11);
    text.set_span(StyleSpan{TextStyle::bold}, 6, 11);

    const auto result = convert(text, 1.0f);
    EXPECT_EQ(result.html, "<span class='bg_-16711936'>Hello <b>world</b></span>");
    EXPECT_EQ(result.css_rule_sets, (std::map<std::string, std::string>{
        {".bg_-16711936,.bg_-16711936 *", "background-color:rgba(0,255,0,1.000);"},
    }));
}

TEST(Convert, duplicate_background_colors_share_one_rule) {
    auto text = SpannedText{"one two three"};
    text.set_span(BackgroundColor{green_color}, 0, 3);
    text.set_span(BackgroundColor{green_color}, 8, 13);
    text.set_span(BackgroundColor{argb(0x80, 0, 0, 255)}, 4, 7);

    const auto result = convert(text, 1.0f);
    ASSERT_EQ(result.css_rule_sets.size(), 2u);
    EXPECT_EQ(result.css_rule_sets.at(".bg_-16711936,.bg_-16711936 *"),
              "background-color:rgba(0,255,0,1.000);");
    EXPECT_EQ(result.css_rule_sets.at(".bg_-2147483393,.bg_-2147483393 *"),
              "background-color:rgba(0,0,255,0.502);");
}

TEST(Convert, foreground_color_needs_no_css_rule) {
    auto text = SpannedText{"red"};
    text.set_span(ForegroundColor{rgb(255, 0, 0)}, 0, 3);
    const auto result = convert(text, 1.0f);
    EXPECT_EQ(result.html, "<span style='color:rgba(255,0,0,1.000);'>red</span>");
    EXPECT_TRUE(result.css_rule_sets.empty());
}

// -- Line breaks --------------------------------------------------------------

TEST(Convert, crlf_becomes_a_single_line_break) {
    auto text = SpannedText{"one\r\ntwo"};
    text.set_span(StyleSpan{TextStyle::italic}, 0, 8);
    EXPECT_EQ(convert(text, 1.0f).html, "<i>one<br>two</i>");
}

TEST(Convert, line_break_split_by_a_boundary_is_escaped_per_slice) {
    auto text = SpannedText{"a\r\nb"};
    text.set_span(Underline{}, 0, 2);
    EXPECT_EQ(convert(text, 1.0f).html, "<u>a&#13;</u><br>b");
}

// -- Whole-output properties --------------------------------------------------

TEST(Convert, is_deterministic) {
    auto text = SpannedText{"The quick brown fox"};
    text.set_span(StyleSpan{TextStyle::bold}, 4, 9);
    text.set_span(StyleSpan{TextStyle::italic}, 4, 9);
    text.set_span(BackgroundColor{green_color}, 0, 19);
    text.set_span(BackgroundColor{rgb(1, 2, 3)}, 10, 15);
    text.set_span(Ruby{"kitsune", RubyPosition::over}, 16, 19);
    text.set_span(Underline{}, 7, 16);

    const auto first = convert(text, 2.0f);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(convert(text, 2.0f), first);
    }
}

TEST(Convert, preserves_text_content) {
    const auto raw = std::string{"if (a < b && c > d)\n  return  x;"};
    auto text = SpannedText{raw};
    text.set_span(StyleSpan{TextStyle::bold}, 0, 2);
    text.set_span(ForegroundColor{rgb(0, 0, 255)}, 3, 19);
    text.set_span(StyleSpan{TextStyle::italic}, 5, 25);
    text.set_span(Underline{}, 19, 20);
    text.set_span(BackgroundColor{green_color}, 0, raw.size());
    text.set_span(Strikethrough{}, 10, 10);

    EXPECT_EQ(text_content(convert(text, 1.0f).html), raw);
}
