// subtitle_cue — converts a styled subtitle cue into HTML and CSS
//
// Builds a two-line cue with nested styling, a background color, ruby
// text and an absolute font size, then prints a standalone HTML page
// that renders it.
//
// Build: cmake --build build
// Run:   ./build/examples/subtitle_cue [display_density]

#include <spanned-html-cpp/spanned_html.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

namespace sh = spanned_html_cpp;

int main(int argc, char** argv) {
    auto density = 2.0f;
    if (argc > 1) {
        density = std::strtof(argv[1], nullptr);
        if (density <= 0.0f) {
            std::fprintf(stderr, "display density must be positive: %s\n", argv[1]);
            return EXIT_FAILURE;
        }
    }

    // "Tokyo" in kanji (6 bytes) followed by an English line.
    const auto line1 = std::string{"\xE6\x9D\xB1\xE4\xBA\xAC"};
    const auto line2 = std::string{"Meet me at <the station> & wait"};
    auto cue = sh::SpannedText{line1 + "\n" + line2};
    const auto line2_start = line1.size() + 1;

    cue.set_span(sh::Ruby{"Tokyo", sh::RubyPosition::over}, 0, line1.size());
    cue.set_span(sh::TextEmphasis{sh::EmphasisMark::filled_sesame,
                                  sh::EmphasisPosition::before}, 0, line1.size());
    cue.set_span(sh::BackgroundColor{sh::argb(0xC0, 0, 0, 0)}, 0, cue.length());
    cue.set_span(sh::ForegroundColor{sh::rgb(255, 255, 0)}, line2_start, line2_start + 7);
    cue.set_span(sh::StyleSpan{sh::TextStyle::bold}, line2_start + 5, line2_start + 7);
    cue.set_span(sh::AbsoluteSize{48.0f, false}, line2_start, cue.length());
    cue.set_span(sh::Typeface{}, 0, cue.length());  // no family: ignored

    const auto result = sh::convert(cue, density);

    std::printf("<!DOCTYPE html>\n<html>\n<head>\n<style>\n");
    for (const auto& [selector, declarations] : result.css_rule_sets) {
        std::printf("%s { %s }\n", selector.c_str(), declarations.c_str());
    }
    std::printf("</style>\n</head>\n<body>\n");
    std::printf("%s\n", result.html.c_str());
    std::printf("</body>\n</html>\n");

    return EXIT_SUCCESS;
}
