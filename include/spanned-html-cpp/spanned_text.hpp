/// @file spanned_text.hpp
/// @brief SpannedText: UTF-8 text decorated with positional style spans.

#pragma once

#include <spanned-html-cpp/span.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace spanned_html_cpp {

/// Text plus an ordered collection of style spans.
///
/// SpannedText is the producer-side container: subtitle decoders build one
/// per cue and hand it to convert(). Range validity is enforced here, when
/// spans are attached, so the converter can rely on
/// `start <= end <= length()` for every span it sees.
///
/// @code
/// auto cue = SpannedText{"Hello world"};
/// cue.set_span(StyleSpan{TextStyle::bold}, 0, 5);
/// cue.set_span(ForegroundColor{rgb(255, 0, 0)}, 6, 11);
/// @endcode
class SpannedText {
public:
    SpannedText() = default;

    /// Construct with the given text and no spans.
    explicit SpannedText(std::string text);

    /// Attach a span covering [start, end).
    /// @throws std::out_of_range if start > end or end > length().
    void set_span(SpanKind kind, std::size_t start, std::size_t end);

    /// Attach an already-built span.
    /// @throws std::out_of_range if the span's range is invalid.
    void set_span(Span span);

    /// Remove all spans, keeping the text.
    void clear_spans() noexcept { spans_.clear(); }

    auto text() const noexcept -> std::string_view { return text_; }
    auto length() const noexcept -> std::size_t { return text_.size(); }
    auto empty() const noexcept -> bool { return text_.empty(); }

    /// All spans, in the order they were attached.
    auto spans() const noexcept -> const std::vector<Span>& { return spans_; }
    auto has_spans() const noexcept -> bool { return !spans_.empty(); }

    /// The text covered by [start, end).
    auto sub_text(std::size_t start, std::size_t end) const -> std::string_view;

    /// Collect the payloads of all spans of one kind, in attach order.
    /// @code
    /// for (const auto& bg : cue.spans_of<BackgroundColor>()) { ... }
    /// @endcode
    template <typename Kind>
    auto spans_of() const -> std::vector<Kind> {
        auto result = std::vector<Kind>{};
        for (const auto& span : spans_) {
            if (const auto* k = std::get_if<Kind>(&span.kind)) {
                result.push_back(*k);
            }
        }
        return result;
    }

    auto operator==(const SpannedText&) const -> bool = default;

private:
    std::string text_;
    std::vector<Span> spans_;
};

}  // namespace spanned_html_cpp
