#include "builtins.hpp"
#include "cellexpr/coerce.hpp"
#include "cellexpr/error.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace cellexpr::builtins {

double round_half_up(double x, int digits) {
    if (!std::isfinite(x)) throw FormulaError("cannot round a non-finite number");

    // Shortest round-trip text, e.g. "2.345" or "1.5e-07".
    const std::string text = fmt::format("{}", std::fabs(x));
    std::string mantissa;
    int exponent = 0;
    bool after_point = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '.') {
            after_point = true;
        } else if (c == 'e' || c == 'E') {
            exponent += std::atoi(text.c_str() + i + 1);
            break;
        } else {
            mantissa.push_back(c);
            if (after_point) --exponent;
        }
    }
    // |x| == mantissa * 10^exponent
    const long long drop = -static_cast<long long>(digits) - exponent;
    if (drop <= 0) return x;

    const long long n = static_cast<long long>(mantissa.size());
    if (drop > n) return 0.0;

    std::int64_t kept = 0;
    for (long long i = 0; i < n - drop; ++i) kept = kept * 10 + (mantissa[static_cast<std::size_t>(i)] - '0');
    if (mantissa[static_cast<std::size_t>(n - drop)] >= '5') ++kept;
    if (kept == 0) return 0.0;

    double result = static_cast<double>(kept);
    if (digits >= 0) result /= std::pow(10.0, digits);
    else result *= std::pow(10.0, -static_cast<double>(digits));
    if (!std::isfinite(result)) throw FormulaError("numeric result out of range");
    return x < 0 ? -result : result;
}

namespace {

std::vector<double> numbers(const Args& a) {
    std::vector<double> out;
    for (const auto& v : flatten(a)) out.push_back(to_number(v));
    return out;
}

Value fn_sum(const Args& a, const CallEnv&) {
    double total = 0.0;
    for (double d : numbers(a)) total += d;
    return normalize_number(total);
}

Value fn_average(const Args& a, const CallEnv&) {
    const auto xs = numbers(a);
    if (xs.empty()) throw FormulaError("AVERAGE requires at least one numeric value");
    double total = 0.0;
    for (double d : xs) total += d;
    return normalize_number(total / static_cast<double>(xs.size()));
}

Value fn_min(const Args& a, const CallEnv&) {
    const auto xs = numbers(a);
    if (xs.empty()) throw FormulaError("MIN requires at least one numeric value");
    return normalize_number(*std::min_element(xs.begin(), xs.end()));
}

Value fn_max(const Args& a, const CallEnv&) {
    const auto xs = numbers(a);
    if (xs.empty()) throw FormulaError("MAX requires at least one numeric value");
    return normalize_number(*std::max_element(xs.begin(), xs.end()));
}

Value fn_round(const Args& a, const CallEnv&) {
    require_args(a, 1, 2, "ROUND");
    const int digits = to_int(arg_or(a, 1, Value(0)));
    return normalize_number(round_half_up(to_number(a[0]), digits));
}

// ROUNDUP moves away from zero, ROUNDDOWN toward zero.
Value round_directed(const Args& a, bool away, const char* name) {
    require_args(a, 1, 2, name);
    const double x = to_number(a[0]);
    const int digits = to_int(arg_or(a, 1, Value(0)));
    const double scale = std::pow(10.0, std::fabs(static_cast<double>(digits)));
    if (!std::isfinite(scale)) throw FormulaError(fmt::format("{} digits {} out of range", name, digits));
    double scaled = digits >= 0 ? x * scale : x / scale;
    if (away) scaled = scaled >= 0 ? std::ceil(scaled) : std::floor(scaled);
    else scaled = std::trunc(scaled);
    const double result = digits >= 0 ? scaled / scale : scaled * scale;
    if (!std::isfinite(result)) throw FormulaError("numeric result out of range");
    return normalize_number(result);
}

Value fn_roundup(const Args& a, const CallEnv&)   { return round_directed(a, true, "ROUNDUP"); }
Value fn_rounddown(const Args& a, const CallEnv&) { return round_directed(a, false, "ROUNDDOWN"); }

Value fn_value(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "VALUE");
    return normalize_number(to_number(a[0]));
}

} // namespace

void add_math(FunctionTable& t) {
    t["SUM"]       = Function{fn_sum};
    t["AVERAGE"]   = Function{fn_average};
    t["MIN"]       = Function{fn_min};
    t["MAX"]       = Function{fn_max};
    t["ROUND"]     = Function{fn_round};
    t["ROUNDUP"]   = Function{fn_roundup};
    t["ROUNDDOWN"] = Function{fn_rounddown};
    t["VALUE"]     = Function{fn_value};
}

} // namespace cellexpr::builtins
