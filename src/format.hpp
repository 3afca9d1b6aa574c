#pragma once

// Locale-independent fixed-point number formatting.
// Internal header — not installed.

#include <array>
#include <cassert>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <string>
#include <system_error>

namespace spanned_html_cpp::detail {

// Format `value` with exactly `precision` digits after the decimal point,
// like String.format("%.Nf") on the JVM: the shortest decimal that
// round-trips the double is rounded half-up (away from zero) at the last
// kept digit. printf would instead round the exact binary value, so
// 10.125 gives 10.13 here and 10.12 there.
template <std::floating_point T>
auto format_fixed(T value, int precision) -> std::string {
    const auto as_double = static_cast<double>(value);

    // Large enough for any double in shortest fixed notation.
    auto buf = std::array<char, 512>{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), as_double,
                                   std::chars_format::fixed);
    assert(ec == std::errc{});
    auto digits = std::string{buf.data(), ptr};
    if (!std::isfinite(as_double)) return digits;

    const auto negative = digits.front() == '-';
    if (negative) digits.erase(0, 1);

    const auto point = digits.find('.');
    auto integer = digits.substr(0, point);
    auto fraction = point == std::string::npos ? std::string{} : digits.substr(point + 1);

    const auto keep = static_cast<std::size_t>(precision < 0 ? 0 : precision);
    const auto round_up = fraction.size() > keep && fraction[keep] >= '5';
    fraction.resize(keep, '0');

    if (round_up) {
        auto number = integer + fraction;
        auto carry = true;
        for (auto i = number.size(); carry && i > 0; --i) {
            if (number[i - 1] == '9') {
                number[i - 1] = '0';
            } else {
                ++number[i - 1];
                carry = false;
            }
        }
        if (carry) number.insert(number.begin(), '1');
        integer = number.substr(0, number.size() - keep);
        fraction = number.substr(number.size() - keep);
    }

    auto out = std::string{negative ? "-" : ""};
    out += integer;
    if (keep > 0) {
        out += '.';
        out += fraction;
    }
    return out;
}

}  // namespace spanned_html_cpp::detail
