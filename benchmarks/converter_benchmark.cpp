// spanned-html-cpp benchmarks — measures conversion throughput.

#include <spanned-html-cpp/spanned_html.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

using namespace spanned_html_cpp;

namespace {

auto make_text(std::size_t length) -> std::string {
    static constexpr char words[] = "the quick brown fox jumps over <the> lazy dog & ";
    auto text = std::string{};
    text.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        text.push_back(words[i % (sizeof(words) - 1)]);
    }
    return text;
}

// One span of a rotating kind every `stride` bytes, each covering a few
// boundaries so that transitions carry several spans.
auto make_cue(std::size_t length, std::size_t stride) -> SpannedText {
    auto cue = SpannedText{make_text(length)};
    auto n = std::size_t{0};
    for (std::size_t start = 0; start + stride < length; start += stride, ++n) {
        const auto end = std::min(length, start + stride * 3);
        switch (n % 5) {
            case 0: cue.set_span(StyleSpan{TextStyle::bold}, start, end); break;
            case 1: cue.set_span(ForegroundColor{rgb(255, 0, 0)}, start, end); break;
            case 2: cue.set_span(BackgroundColor{rgb(0, 0, static_cast<std::uint8_t>(n))}, start, end); break;
            case 3: cue.set_span(Underline{}, start, end); break;
            case 4: cue.set_span(AbsoluteSize{32.0f, false}, start, end); break;
        }
    }
    return cue;
}

}  // anonymous namespace

// =============================================================================
// Escaping
// =============================================================================

static void bm_escape_html(benchmark::State& state) {
    const auto text = make_text(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(escape_html(text));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_escape_html)->Range(64, 64 << 10);

// =============================================================================
// Conversion
// =============================================================================

static void bm_convert_plain(benchmark::State& state) {
    const auto cue = SpannedText{make_text(static_cast<std::size_t>(state.range(0)))};
    for (auto _ : state) {
        benchmark::DoNotOptimize(convert(cue, 2.0f));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * cue.length()));
}
BENCHMARK(bm_convert_plain)->Range(64, 64 << 10);

static void bm_convert_spanned(benchmark::State& state) {
    const auto cue = make_cue(static_cast<std::size_t>(state.range(0)), 8);
    for (auto _ : state) {
        benchmark::DoNotOptimize(convert(cue, 2.0f));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * cue.spans().size()));
}
BENCHMARK(bm_convert_spanned)->Range(64, 64 << 10);

static void bm_convert_subtitle_cue(benchmark::State& state) {
    auto cue = SpannedText{"Meet me at the station\nand wait"};
    cue.set_span(BackgroundColor{argb(0xC0, 0, 0, 0)}, 0, cue.length());
    cue.set_span(ForegroundColor{rgb(255, 255, 0)}, 0, 7);
    cue.set_span(StyleSpan{TextStyle::bold}, 5, 7);
    cue.set_span(Ruby{"eki", RubyPosition::over}, 15, 22);
    for (auto _ : state) {
        benchmark::DoNotOptimize(convert(cue, 2.0f));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_convert_subtitle_cue);
