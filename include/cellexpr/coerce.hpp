#pragma once

#include <string>
#include <string_view>

#include "cellexpr/value.hpp"

namespace cellexpr {

/// Serial day number of 1899-12-30, the spreadsheet epoch.
constexpr long kSerialEpochDays = -25569;

/// Days since 1970-01-01 for a proleptic Gregorian date.
long days_from_civil(int y, int m, int d) noexcept;

/// Inverse of days_from_civil.
void civil_from_days(long z, int& y, int& m, int& d) noexcept;

bool is_valid_date(int y, int m, int d) noexcept;
bool is_valid_time(int h, int m, int s) noexcept;

/// Current local date and time.
DateTime local_now();

/// Null -> 0, Boolean -> 1/0, numbers pass through, dates -> serial days
/// since 1899-12-30, text -> parsed number (blank -> 0).
/// Throws FormulaError for anything else.
double to_number(const Value& v);

/// A value prepared for comparison: numeric when to_number succeeds,
/// otherwise a date/time, a boolean or text.
Value to_comparable(const Value& v);

/// Compare two values prepared by to_comparable. Returns <0, 0 or >0.
/// Throws FormulaError when the representations cannot be ordered.
int compare_values(const Value& a, const Value& b);

/// Equality between two values prepared by to_comparable. Values of
/// different representations are never equal.
bool comparable_equal(const Value& a, const Value& b);

bool truthy(const Value& v);
bool is_blank(const Value& v);

/// Collapse an integral double into an Integer value.
Value normalize_number(double d);

/// Text representation used by concatenation and text functions.
std::string to_text(const Value& v);

/// Interpret a date/time value or ISO-8601 text as a moment. Time-only
/// values are anchored on the current local date.
DateTime to_datetime(const Value& v);

/// Whole-number argument (truncating). Throws FormulaError when the value
/// does not fit a long.
long to_integer(const Value& v);

/// As to_integer, narrowed to int.
int to_int(const Value& v);

std::string trim(std::string_view s);

} // namespace cellexpr
