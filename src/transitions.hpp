#pragma once

// Span transitions: for every text offset where spans start or end, the
// spans added and removed there, already sorted into emission order.
//
// Emission order at one offset is closing tags (spans_removed) followed by
// opening tags (spans_added). Both lists are sorted with a fixed total
// order so that identical input always produces byte-identical HTML:
//
//   opening: end descending, then opening tag ascending, then closing
//            tag ascending. Spans that stay open longer are opened first
//            and therefore enclose the shorter ones.
//   closing: start descending, then opening tag descending, then closing
//            tag descending. The mirror of the opening order, so properly
//            nested spans close in the reverse order they were opened.
//
// Internal header — not installed.

#include "span_tags.hpp"

#include <spanned-html-cpp/spanned_text.hpp>

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace spanned_html_cpp::detail {

// A span resolved to markup.
struct SpanInfo {
    std::size_t start;
    std::size_t end;
    std::string opening_tag;
    std::string closing_tag;

    auto operator==(const SpanInfo&) const -> bool = default;
};

// Strict weak ordering for opening tags at a shared offset.
inline auto opens_before(const SpanInfo& a, const SpanInfo& b) -> bool {
    return std::tie(b.end, a.opening_tag, a.closing_tag) <
           std::tie(a.end, b.opening_tag, b.closing_tag);
}

// Strict weak ordering for closing tags at a shared offset.
inline auto closes_before(const SpanInfo& a, const SpanInfo& b) -> bool {
    return std::tie(b.start, b.opening_tag, b.closing_tag) <
           std::tie(a.start, a.opening_tag, a.closing_tag);
}

// Spans that start and end at one offset. Pointers refer into the owning
// SpanTransitions.
struct Transition {
    std::vector<const SpanInfo*> spans_added;
    std::vector<const SpanInfo*> spans_removed;
};

// Resolves every span of a SpannedText and groups the results by the
// offsets at which they start and end. Immutable once constructed.
class SpanTransitions {
public:
    SpanTransitions(const SpannedText& text, float display_density) {
        spans_.reserve(text.spans().size());
        for (const auto& span : text.spans()) {
            auto opening = opening_tag(span.kind, display_density);
            auto closing = closing_tag(span.kind);
            if (!opening) continue;
            // Every kind with an opening tag must also close.
            assert(closing);
            spans_.push_back(SpanInfo{span.start, span.end,
                                      std::move(*opening), std::move(*closing)});
        }

        // spans_ is complete; pointers into it stay valid from here on.
        for (const auto& info : spans_) {
            transitions_[info.start].spans_added.push_back(&info);
            transitions_[info.end].spans_removed.push_back(&info);
        }

        for (auto& [index, transition] : transitions_) {
            std::ranges::sort(transition.spans_added,
                [](const SpanInfo* a, const SpanInfo* b) { return opens_before(*a, *b); });
            std::ranges::sort(transition.spans_removed,
                [](const SpanInfo* a, const SpanInfo* b) { return closes_before(*a, *b); });
        }
    }

    SpanTransitions(const SpanTransitions&) = delete;
    auto operator=(const SpanTransitions&) -> SpanTransitions& = delete;
    SpanTransitions(SpanTransitions&&) = default;
    auto operator=(SpanTransitions&&) -> SpanTransitions& = default;

    // Resolved spans, in the order they were attached to the text.
    auto spans() const -> const std::vector<SpanInfo>& { return spans_; }

    // Transitions keyed by text offset, iterated in ascending order.
    auto transitions() const -> const std::map<std::size_t, Transition>& { return transitions_; }

private:
    std::vector<SpanInfo> spans_;
    std::map<std::size_t, Transition> transitions_;
};

}  // namespace spanned_html_cpp::detail
