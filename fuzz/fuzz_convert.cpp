// Fuzz target for convert() — builds a SpannedText from the input bytes
// (arbitrary text, possibly invalid UTF-8, with arbitrary overlapping
// spans) and checks that conversion is deterministic.

#include <spanned-html-cpp/spanned_html.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace sh = spanned_html_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;

    // First byte: number of 4-byte span records at the end of the input.
    const auto span_count = static_cast<std::size_t>(data[0] % 16);
    const auto records = span_count * 4;
    if (size < 1 + records) return 0;

    const auto text_size = size - 1 - records;
    auto cue = sh::SpannedText{std::string{reinterpret_cast<const char*>(data + 1), text_size}};
    const auto* rec = data + 1 + text_size;
    const auto limit = text_size + 1;

    for (std::size_t i = 0; i < span_count; ++i, rec += 4) {
        auto a = static_cast<std::size_t>(rec[1]) % limit;
        auto b = static_cast<std::size_t>(rec[2]) % limit;
        if (a > b) std::swap(a, b);
        const auto arg = rec[3];

        switch (rec[0] % 11) {
            case 0:  cue.set_span(sh::Strikethrough{}, a, b); break;
            case 1:  cue.set_span(sh::ForegroundColor{sh::argb(arg, arg, 0, 255)}, a, b); break;
            case 2:  cue.set_span(sh::BackgroundColor{sh::argb(255, 0, arg, 0)}, a, b); break;
            case 3:  cue.set_span(sh::HorizontalTextInVertical{}, a, b); break;
            case 4:  cue.set_span(sh::AbsoluteSize{static_cast<float>(arg), (arg & 1) != 0}, a, b); break;
            case 5:  cue.set_span(sh::RelativeSize{static_cast<float>(arg) / 64.0f}, a, b); break;
            case 6:  cue.set_span(sh::Typeface{(arg & 1) ? std::optional<std::string>{"serif"} : std::nullopt}, a, b); break;
            case 7:  cue.set_span(sh::StyleSpan{static_cast<sh::TextStyle>(arg % 4)}, a, b); break;
            case 8:  cue.set_span(sh::Ruby{std::string(arg % 4, '<'), static_cast<sh::RubyPosition>(arg % 3)}, a, b); break;
            case 9:  cue.set_span(sh::Underline{}, a, b); break;
            default: cue.set_span(sh::TextEmphasis{static_cast<sh::EmphasisMark>(arg % 8),
                                                   static_cast<sh::EmphasisPosition>((arg >> 3) % 4)}, a, b); break;
        }
    }

    const auto first = sh::convert(cue, 1.5f);
    const auto second = sh::convert(cue, 1.5f);
    if (first != second) std::abort();

    return 0;
}
