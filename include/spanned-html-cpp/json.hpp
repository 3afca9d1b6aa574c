/// @file json.hpp
/// @brief nlohmann/json interoperability for spanned-html-cpp.
///
/// Provides ADL serialization (to_json/from_json) for span kinds, spans,
/// SpannedText and HtmlAndCss, so cues can be stored, diffed, or shipped
/// to a renderer process as JSON.
///
/// Span kinds are tagged with a `"type"` field; enums are written as their
/// to_string_view() names. Malformed input throws std::runtime_error.

#pragma once

#include <spanned-html-cpp/converter.hpp>
#include <spanned-html-cpp/span.hpp>
#include <spanned-html-cpp/spanned_text.hpp>

#include <nlohmann/json.hpp>

namespace spanned_html_cpp {

// -- Enumerations -------------------------------------------------------------

void to_json(nlohmann::json& j, TextStyle style);
void from_json(const nlohmann::json& j, TextStyle& style);

void to_json(nlohmann::json& j, RubyPosition position);
void from_json(const nlohmann::json& j, RubyPosition& position);

void to_json(nlohmann::json& j, EmphasisMark mark);
void from_json(const nlohmann::json& j, EmphasisMark& mark);

void to_json(nlohmann::json& j, EmphasisPosition position);
void from_json(const nlohmann::json& j, EmphasisPosition& position);

// -- Span kinds ---------------------------------------------------------------

void to_json(nlohmann::json& j, const SpanKind& kind);
void from_json(const nlohmann::json& j, SpanKind& kind);

// -- Compound types -----------------------------------------------------------

void to_json(nlohmann::json& j, const Span& span);
void from_json(const nlohmann::json& j, Span& span);

void to_json(nlohmann::json& j, const SpannedText& text);

/// @throws std::out_of_range if a span range does not fit the text.
void from_json(const nlohmann::json& j, SpannedText& text);

void to_json(nlohmann::json& j, const HtmlAndCss& result);
void from_json(const nlohmann::json& j, HtmlAndCss& result);

}  // namespace spanned_html_cpp
