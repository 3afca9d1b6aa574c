#include <spanned-html-cpp/json.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace spanned_html_cpp {

namespace {

// Reverse of to_string_view() for a contiguous enum starting at zero.
template <typename Enum, std::size_t N>
auto enum_from_string(const nlohmann::json& j, const std::array<Enum, N>& values,
                      std::string_view what) -> Enum {
    if (!j.is_string()) {
        throw std::runtime_error{std::string{what} + " must be a string"};
    }
    const auto name = j.get<std::string>();
    for (auto v : values) {
        if (to_string_view(v) == name) return v;
    }
    throw std::runtime_error{"unknown " + std::string{what} + ": " + name};
}

auto required(const nlohmann::json& j, const char* key) -> const nlohmann::json& {
    if (!j.is_object() || !j.contains(key)) {
        throw std::runtime_error{std::string{"missing field: "} + key};
    }
    return j.at(key);
}

// Typed read of one field. nlohmann type errors are rethrown as
// std::runtime_error so every malformed input surfaces as one type.
template <typename T>
auto field(const nlohmann::json& j, const char* key) -> T {
    const auto& value = required(j, key);
    try {
        return value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error{std::string{"invalid field "} + key + ": " + e.what()};
    }
}

// Like field(), but absent or null fields yield `fallback`.
template <typename T>
auto optional_field(const nlohmann::json& j, const char* key, T fallback) -> T {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) return fallback;
    return field<T>(j, key);
}

constexpr auto text_styles = std::array{
    TextStyle::normal, TextStyle::bold, TextStyle::italic, TextStyle::bold_italic,
};

constexpr auto ruby_positions = std::array{
    RubyPosition::unknown, RubyPosition::over, RubyPosition::under,
};

constexpr auto emphasis_marks = std::array{
    EmphasisMark::unknown, EmphasisMark::auto_mark,
    EmphasisMark::filled_circle, EmphasisMark::filled_dot, EmphasisMark::filled_sesame,
    EmphasisMark::open_circle, EmphasisMark::open_dot, EmphasisMark::open_sesame,
};

constexpr auto emphasis_positions = std::array{
    EmphasisPosition::unknown, EmphasisPosition::before,
    EmphasisPosition::after, EmphasisPosition::outside,
};

}  // anonymous namespace

// -- Enumerations -------------------------------------------------------------

void to_json(nlohmann::json& j, TextStyle style) {
    j = std::string{to_string_view(style)};
}

void from_json(const nlohmann::json& j, TextStyle& style) {
    style = enum_from_string(j, text_styles, "text style");
}

void to_json(nlohmann::json& j, RubyPosition position) {
    j = std::string{to_string_view(position)};
}

void from_json(const nlohmann::json& j, RubyPosition& position) {
    position = enum_from_string(j, ruby_positions, "ruby position");
}

void to_json(nlohmann::json& j, EmphasisMark mark) {
    j = std::string{to_string_view(mark)};
}

void from_json(const nlohmann::json& j, EmphasisMark& mark) {
    mark = enum_from_string(j, emphasis_marks, "emphasis mark");
}

void to_json(nlohmann::json& j, EmphasisPosition position) {
    j = std::string{to_string_view(position)};
}

void from_json(const nlohmann::json& j, EmphasisPosition& position) {
    position = enum_from_string(j, emphasis_positions, "emphasis position");
}

// -- Span kinds ---------------------------------------------------------------

void to_json(nlohmann::json& j, const SpanKind& kind) {
    std::visit(overload{
        [&](const Strikethrough&) {
            j = nlohmann::json{{"type", "strikethrough"}};
        },
        [&](const ForegroundColor& k) {
            j = nlohmann::json{{"type", "foreground_color"}, {"color", k.color}};
        },
        [&](const BackgroundColor& k) {
            j = nlohmann::json{{"type", "background_color"}, {"color", k.color}};
        },
        [&](const HorizontalTextInVertical&) {
            j = nlohmann::json{{"type", "horizontal_text_in_vertical"}};
        },
        [&](const AbsoluteSize& k) {
            j = nlohmann::json{{"type", "absolute_size"}, {"size", k.size}, {"dip", k.dip}};
        },
        [&](const RelativeSize& k) {
            j = nlohmann::json{{"type", "relative_size"}, {"size_change", k.size_change}};
        },
        [&](const Typeface& k) {
            j = nlohmann::json{{"type", "typeface"}};
            j["family"] = k.family ? nlohmann::json(*k.family) : nlohmann::json(nullptr);
        },
        [&](const StyleSpan& k) {
            j = nlohmann::json{{"type", "style"}, {"style", k.style}};
        },
        [&](const Ruby& k) {
            j = nlohmann::json{{"type", "ruby"}, {"text", k.text}, {"position", k.position}};
        },
        [&](const Underline&) {
            j = nlohmann::json{{"type", "underline"}};
        },
        [&](const TextEmphasis& k) {
            j = nlohmann::json{{"type", "text_emphasis"},
                               {"mark", k.mark}, {"position", k.position}};
        },
    }, kind);
}

void from_json(const nlohmann::json& j, SpanKind& kind) {
    const auto type = field<std::string>(j, "type");
    if (type == "strikethrough") {
        kind = Strikethrough{};
    } else if (type == "foreground_color") {
        kind = ForegroundColor{field<PackedColor>(j, "color")};
    } else if (type == "background_color") {
        kind = BackgroundColor{field<PackedColor>(j, "color")};
    } else if (type == "horizontal_text_in_vertical") {
        kind = HorizontalTextInVertical{};
    } else if (type == "absolute_size") {
        kind = AbsoluteSize{field<float>(j, "size"),
                            optional_field(j, "dip", false)};
    } else if (type == "relative_size") {
        kind = RelativeSize{field<float>(j, "size_change")};
    } else if (type == "typeface") {
        auto family = std::optional<std::string>{};
        if (j.contains("family") && !j["family"].is_null()) {
            family = field<std::string>(j, "family");
        }
        kind = Typeface{std::move(family)};
    } else if (type == "style") {
        kind = StyleSpan{field<TextStyle>(j, "style")};
    } else if (type == "ruby") {
        kind = Ruby{field<std::string>(j, "text"),
                    optional_field(j, "position", RubyPosition::unknown)};
    } else if (type == "underline") {
        kind = Underline{};
    } else if (type == "text_emphasis") {
        kind = TextEmphasis{
            optional_field(j, "mark", EmphasisMark::unknown),
            optional_field(j, "position", EmphasisPosition::unknown)};
    } else {
        throw std::runtime_error{"unknown span type: " + type};
    }
}

// -- Compound types -----------------------------------------------------------

void to_json(nlohmann::json& j, const Span& span) {
    j = nlohmann::json{
        {"start", span.start},
        {"end", span.end},
        {"kind", span.kind},
    };
}

void from_json(const nlohmann::json& j, Span& span) {
    span.start = field<std::size_t>(j, "start");
    span.end = field<std::size_t>(j, "end");
    span.kind = field<SpanKind>(j, "kind");
}

void to_json(nlohmann::json& j, const SpannedText& text) {
    j = nlohmann::json{
        {"text", std::string{text.text()}},
        {"spans", text.spans()},
    };
}

void from_json(const nlohmann::json& j, SpannedText& text) {
    auto result = SpannedText{field<std::string>(j, "text")};
    if (j.contains("spans")) {
        if (!j["spans"].is_array()) {
            throw std::runtime_error{"spans must be an array"};
        }
        for (const auto& span_j : j["spans"]) {
            result.set_span(span_j.get<Span>());
        }
    }
    text = std::move(result);
}

void to_json(nlohmann::json& j, const HtmlAndCss& result) {
    j = nlohmann::json{
        {"html", result.html},
        {"css", result.css_rule_sets},
    };
}

void from_json(const nlohmann::json& j, HtmlAndCss& result) {
    result.html = field<std::string>(j, "html");
    result.css_rule_sets = optional_field(j, "css", std::map<std::string, std::string>{});
}

}  // namespace spanned_html_cpp
