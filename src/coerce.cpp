#include "cellexpr/coerce.hpp"
#include "cellexpr/error.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <limits>

#include <fmt/core.h>

namespace cellexpr {

long days_from_civil(int y, int m, int d) noexcept {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153u * static_cast<unsigned>(m > 2 ? m - 3 : m + 9) + 2u) / 5u + static_cast<unsigned>(d) - 1u;
    const unsigned doe = yoe * 365u + yoe / 4u - yoe / 100u + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

void civil_from_days(long z, int& y, int& m, int& d) noexcept {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460u + doe / 36524u - doe / 146096u) / 365u;
    const unsigned doy = doe - (365u * yoe + yoe / 4u - yoe / 100u);
    const unsigned mp = (5u * doy + 2u) / 153u;
    d = static_cast<int>(doy - (153u * mp + 2u) / 5u + 1u);
    m = static_cast<int>(mp < 10u ? mp + 3u : mp - 9u);
    y = static_cast<int>(static_cast<long>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

static int days_in_month(int y, int m) noexcept {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return (m == 2 && leap) ? 29 : kDays[m - 1];
}

bool is_valid_date(int y, int m, int d) noexcept {
    return y >= 1 && y <= 9999 && m >= 1 && m <= 12 && d >= 1 && d <= days_in_month(y, m);
}

bool is_valid_time(int h, int m, int s) noexcept {
    return h >= 0 && h < 24 && m >= 0 && m < 60 && s >= 0 && s < 60;
}

DateTime local_now() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    return DateTime::make_datetime(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                                   tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

// Parses the whole of `text` as a decimal number.
// Only signs, digits, '.' and exponents are accepted, so "nan", "inf" and
// hex forms never reach strtod.
static bool parse_number(const std::string& text, double& out) {
    if (text.find_first_not_of("+-.eE0123456789") != std::string::npos) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    if (text.find_first_of(".eE") == std::string::npos) {
        const long long v = std::strtoll(begin, &end, 10);
        if (end != begin && *end == '\0' && errno != ERANGE) {
            out = static_cast<double>(v);
            return true;
        }
        errno = 0;
    }
    const double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return false;
    out = v;
    return true;
}

static double serial_days(const DateTime& dt) {
    const long days = days_from_civil(dt.year, dt.month, dt.day) - kSerialEpochDays;
    const long secs = dt.hour * 3600L + dt.minute * 60L + dt.second;
    return static_cast<double>(days) + static_cast<double>(secs) / 86400.0;
}

static bool try_number(const Value& v, double& out) {
    switch (v.type()) {
        case Value::Type::Null:
            out = 0.0;
            return true;
        case Value::Type::Boolean:
            out = v.as_bool() ? 1.0 : 0.0;
            return true;
        case Value::Type::Integer:
        case Value::Type::Float:
            out = v.number();
            return true;
        case Value::Type::DateTime:
            if (!v.as_datetime().has_date()) return false;
            out = serial_days(v.as_datetime());
            return true;
        case Value::Type::Text: {
            const std::string t = trim(v.as_text());
            if (t.empty()) {
                out = 0.0;
                return true;
            }
            return parse_number(t, out);
        }
        default:
            return false;
    }
}

double to_number(const Value& raw) {
    const Value v = raw.force();
    double out = 0.0;
    if (try_number(v, out)) return out;
    if (v.is_text()) {
        throw FormulaError(fmt::format("cannot convert '{}' to a number", v.as_text()));
    }
    const char* name = v.is_datetime() ? "time" : type_name(v.type());
    throw FormulaError(fmt::format("unsupported value type '{}' for numeric coercion", name));
}

Value to_comparable(const Value& raw) {
    const Value v = raw.force();
    double out = 0.0;
    if (try_number(v, out)) return Value(out);
    if (v.is_datetime() || v.is_bool()) return v;
    if (v.is_null()) return Value(std::string());
    return Value(to_text(v));
}

template <class T>
static int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

int compare_values(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) return three_way(a.number(), b.number());
    if (a.type() == b.type()) {
        switch (a.type()) {
            case Value::Type::Text: {
                const int c = a.as_text().compare(b.as_text());
                return c < 0 ? -1 : (c > 0 ? 1 : 0);
            }
            case Value::Type::DateTime: return three_way(a.as_datetime(), b.as_datetime());
            case Value::Type::Boolean:  return three_way(a.as_bool(), b.as_bool());
            default: break;
        }
    }
    throw FormulaError(fmt::format("cannot order {} against {}", type_name(a.type()), type_name(b.type())));
}

bool comparable_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) return a.number() == b.number();
    if (a.type() != b.type()) return false;
    return compare_values(a, b) == 0;
}

bool truthy(const Value& raw) {
    const Value v = raw.force();
    switch (v.type()) {
        case Value::Type::Null:     return false;
        case Value::Type::Boolean:  return v.as_bool();
        case Value::Type::Integer:  return v.as_integer() != 0;
        case Value::Type::Float:    return v.as_float() != 0.0;
        case Value::Type::Text:     return !trim(v.as_text()).empty();
        case Value::Type::Sequence: return !v.as_sequence().empty();
        default:                    return true;
    }
}

bool is_blank(const Value& raw) {
    const Value v = raw.force();
    if (v.is_null()) return true;
    if (v.is_text()) return trim(v.as_text()).empty();
    if (v.is_sequence()) return v.as_sequence().empty();
    return false;
}

Value normalize_number(double d) {
    if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 9.2e18) {
        return Value(static_cast<long long>(d));
    }
    return Value(d);
}

std::string to_text(const Value& raw) {
    const Value v = raw.force();
    switch (v.type()) {
        case Value::Type::Null:    return std::string();
        case Value::Type::Boolean: return v.as_bool() ? "TRUE" : "FALSE";
        case Value::Type::Integer: return fmt::format("{}", v.as_integer());
        case Value::Type::Float:   return fmt::format("{}", v.as_float());
        case Value::Type::Text:    return v.as_text();
        case Value::Type::DateTime: {
            const DateTime& dt = v.as_datetime();
            const std::string date = fmt::format("{:04}-{:02}-{:02}", dt.year, dt.month, dt.day);
            const std::string time = fmt::format("{:02}:{:02}:{:02}", dt.hour, dt.minute, dt.second);
            if (dt.kind == DateTime::Kind::Date) return date;
            if (dt.kind == DateTime::Kind::Time) return time;
            return date + " " + time;
        }
        case Value::Type::Sequence: {
            std::string out = "[";
            bool first = true;
            for (const auto& item : v.as_sequence()) {
                if (!first) out += ", ";
                out += to_text(item);
                first = false;
            }
            return out + "]";
        }
        case Value::Type::Lazy:
            break;
    }
    return std::string();
}

namespace {

// Reads exactly `n` digits at `i`.
bool read_digits(const std::string& s, std::size_t& i, std::size_t n, int& out) {
    if (i + n > s.size()) return false;
    int v = 0;
    for (std::size_t k = 0; k < n; ++k) {
        const char c = s[i + k];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    i += n;
    out = v;
    return true;
}

bool read_date(const std::string& s, std::size_t& i, DateTime& dt) {
    if (!read_digits(s, i, 4, dt.year)) return false;
    if (i >= s.size() || s[i++] != '-') return false;
    if (!read_digits(s, i, 2, dt.month)) return false;
    if (i >= s.size() || s[i++] != '-') return false;
    if (!read_digits(s, i, 2, dt.day)) return false;
    return is_valid_date(dt.year, dt.month, dt.day);
}

// HH:MM[:SS[.fraction]]
bool read_time(const std::string& s, std::size_t& i, DateTime& dt) {
    if (!read_digits(s, i, 2, dt.hour)) return false;
    if (i >= s.size() || s[i++] != ':') return false;
    if (!read_digits(s, i, 2, dt.minute)) return false;
    if (i < s.size() && s[i] == ':') {
        ++i;
        if (!read_digits(s, i, 2, dt.second)) return false;
        if (i < s.size() && s[i] == '.') {
            ++i;
            const std::size_t start = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == start) return false;
        }
    }
    return is_valid_time(dt.hour, dt.minute, dt.second);
}

bool parse_iso(const std::string& s, DateTime& out) {
    DateTime dt;
    std::size_t i = 0;
    if (read_date(s, i, dt)) {
        if (i == s.size()) {
            out = DateTime::make_date(dt.year, dt.month, dt.day);
            return true;
        }
        if (s[i] != 'T' && s[i] != ' ') return false;
        ++i;
        if (!read_time(s, i, dt) || i != s.size()) return false;
        dt.kind = DateTime::Kind::DateTime;
        out = dt;
        return true;
    }
    i = 0;
    dt = DateTime{};
    if (read_time(s, i, dt) && i == s.size()) {
        out = DateTime::make_time(dt.hour, dt.minute, dt.second);
        return true;
    }
    return false;
}

DateTime anchor(const DateTime& dt) {
    if (dt.kind == DateTime::Kind::Time) {
        const DateTime today = local_now();
        return DateTime::make_datetime(today.year, today.month, today.day, dt.hour, dt.minute, dt.second);
    }
    DateTime out = dt;
    out.kind = DateTime::Kind::DateTime;
    return out;
}

} // namespace

DateTime to_datetime(const Value& raw) {
    const Value v = raw.force();
    if (v.is_datetime()) return anchor(v.as_datetime());
    if (v.is_text()) {
        DateTime dt;
        if (parse_iso(trim(v.as_text()), dt)) return anchor(dt);
    }
    throw FormulaError(fmt::format("cannot interpret '{}' as a date/time value", to_text(v)));
}

long to_integer(const Value& v) {
    const double d = std::trunc(to_number(v));
    if (!std::isfinite(d)) throw FormulaError("expected a finite whole number");
    // [LONG_MIN, LONG_MAX] in doubles is [-2^63, 2^63)
    if (d < static_cast<double>(std::numeric_limits<long>::min()) ||
        d >= -static_cast<double>(std::numeric_limits<long>::min())) {
        throw FormulaError(fmt::format("integer argument {} out of range", to_text(v)));
    }
    return static_cast<long>(d);
}

int to_int(const Value& v) {
    const long n = to_integer(v);
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw FormulaError(fmt::format("integer argument {} out of range", n));
    }
    return static_cast<int>(n);
}

} // namespace cellexpr
