#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "mathpad/config.hpp"
#include "mathpad/token.hpp"

namespace mathpad {

// Places used by the full-precision markers (:: and ->>).
inline constexpr int kFullPrecisionPlaces = 15;

/// Render a number. Non-finite values print as NaN / Infinity / -Infinity;
/// an integral value with base != 10 prints as DIGITS#base.
std::string format_number(double value, int places, bool strip_zeros = true,
                          Notation notation = Notation::Float, int base = 10, bool group_digits = false);

/// Render a declaration value honouring its $ / % format, base and precision marker.
std::string format_value(double value, Format format, bool full_precision, int base, const Config& cfg);

/// Parse a plain literal as written in a declaration value:
/// 12.5, -3e4, $1,234.56, 7.5%, 0xFF, 0b101, 0o17, FF#16, NaN, Infinity.
/// Returns nullopt when the text is an expression rather than a literal.
/// With Format::Percent a bare number is read as a percentage.
std::optional<double> parse_numeric_literal(std::string_view text, Format format = Format::None);

} // namespace mathpad
