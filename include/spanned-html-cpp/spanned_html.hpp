/// @file spanned_html.hpp
/// @brief Umbrella header for the spanned-html-cpp library.
///
/// Include this single header for access to all public types:
/// SpannedText, Span, the span kinds, PackedColor, HtmlAndCss, convert()
/// and the HTML/CSS helpers.

#pragma once

#include <spanned-html-cpp/color.hpp>
#include <spanned-html-cpp/converter.hpp>
#include <spanned-html-cpp/html_utils.hpp>
#include <spanned-html-cpp/span.hpp>
#include <spanned-html-cpp/spanned_text.hpp>
