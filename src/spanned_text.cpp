#include <spanned-html-cpp/spanned_text.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace spanned_html_cpp {

SpannedText::SpannedText(std::string text)
    : text_{std::move(text)} {}

void SpannedText::set_span(SpanKind kind, std::size_t start, std::size_t end) {
    set_span(Span{start, end, std::move(kind)});
}

void SpannedText::set_span(Span span) {
    if (span.start > span.end) {
        throw std::out_of_range{"span start " + std::to_string(span.start) +
                                " is after span end " + std::to_string(span.end)};
    }
    if (span.end > text_.size()) {
        throw std::out_of_range{"span end " + std::to_string(span.end) +
                                " is past text length " + std::to_string(text_.size())};
    }
    spans_.push_back(std::move(span));
}

auto SpannedText::sub_text(std::size_t start, std::size_t end) const -> std::string_view {
    if (start > end || end > text_.size()) {
        throw std::out_of_range{"sub_text range is outside the text"};
    }
    return std::string_view{text_}.substr(start, end - start);
}

}  // namespace spanned_html_cpp
