#include <spanned-html-cpp/html_utils.hpp>

#include "format.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace spanned_html_cpp {

namespace {

constexpr char32_t replacement_character = 0xFFFD;

struct DecodedCodePoint {
    char32_t code_point;
    std::size_t length;  // bytes consumed
};

auto is_continuation(unsigned char b) -> bool { return (b & 0xC0) == 0x80; }

// Decode one UTF-8 sequence at the start of `text`. Malformed, overlong,
// surrogate and out-of-range sequences decode to U+FFFD consuming one byte.
auto decode_utf8(std::string_view text) -> DecodedCodePoint {
    const auto lead = static_cast<unsigned char>(text[0]);
    if (lead < 0x80) return {lead, 1};

    auto length = std::size_t{0};
    auto cp = char32_t{0};
    auto min = char32_t{0};
    if ((lead & 0xE0) == 0xC0) {
        length = 2; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; cp = lead & 0x07; min = 0x10000;
    } else {
        return {replacement_character, 1};
    }

    if (text.size() < length) return {replacement_character, 1};
    for (std::size_t i = 1; i < length; ++i) {
        const auto b = static_cast<unsigned char>(text[i]);
        if (!is_continuation(b)) return {replacement_character, 1};
        cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return {replacement_character, 1};
    }
    return {cp, length};
}

void append_char_ref(std::string& out, char32_t code_point) {
    out += "&#";
    out += std::to_string(static_cast<std::uint32_t>(code_point));
    out.push_back(';');
}

}  // anonymous namespace

auto escape_html(std::string_view text) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = text[i];
        if (c == '<') {
            out += "&lt;";
            ++i;
        } else if (c == '>') {
            out += "&gt;";
            ++i;
        } else if (c == '&') {
            out += "&amp;";
            ++i;
        } else if (c == ' ') {
            while (i + 1 < text.size() && text[i + 1] == ' ') {
                out += "&nbsp;";
                ++i;
            }
            out.push_back(' ');
            ++i;
        } else if (c > ' ' && c <= '~') {
            out.push_back(c);
            ++i;
        } else {
            const auto decoded = decode_utf8(text.substr(i));
            append_char_ref(out, decoded.code_point);
            i += decoded.length;
        }
    }
    return out;
}

auto to_css_rgba(PackedColor color) -> std::string {
    return "rgba(" + std::to_string(red(color)) + "," +
           std::to_string(green(color)) + "," +
           std::to_string(blue(color)) + "," +
           detail::format_fixed(alpha(color) / 255.0, 3) + ")";
}

auto css_all_class_descendants_selector(std::string_view class_name) -> std::string {
    auto selector = std::string{"."};
    selector += class_name;
    selector += ",.";
    selector += class_name;
    selector += " *";
    return selector;
}

}  // namespace spanned_html_cpp
