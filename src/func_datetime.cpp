#include "builtins.hpp"
#include "cellexpr/coerce.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace cellexpr::builtins {

namespace {

Value fn_now(const Args& a, const CallEnv&) {
    require_args(a, 0, 0, "NOW");
    return Value(local_now());
}

Value fn_today(const Args& a, const CallEnv&) {
    require_args(a, 0, 0, "TODAY");
    const DateTime now = local_now();
    return Value(DateTime::make_date(now.year, now.month, now.day));
}

Value fn_date(const Args& a, const CallEnv&) {
    require_args(a, 3, 3, "DATE");
    const int y = to_int(a[0]);
    const int m = to_int(a[1]);
    const int d = to_int(a[2]);
    if (!is_valid_date(y, m, d)) throw std::out_of_range(fmt::format("invalid date {}-{}-{}", y, m, d));
    return Value(DateTime::make_date(y, m, d));
}

Value fn_time(const Args& a, const CallEnv&) {
    require_args(a, 2, 3, "TIME");
    const int h = to_int(a[0]);
    const int m = to_int(a[1]);
    const int s = to_int(arg_or(a, 2, Value(0)));
    if (!is_valid_time(h, m, s)) throw std::out_of_range(fmt::format("invalid time {}:{}:{}", h, m, s));
    return Value(DateTime::make_time(h, m, s));
}

template <int DateTime::*Field>
Value part(const Args& a, const char* name) {
    require_args(a, 1, 1, name);
    return Value(to_datetime(a[0]).*Field);
}

} // namespace

void add_datetime(FunctionTable& t) {
    t["NOW"]    = Function{fn_now};
    t["TODAY"]  = Function{fn_today};
    t["DATE"]   = Function{fn_date};
    t["TIME"]   = Function{fn_time};
    t["YEAR"]   = Function{[](const Args& a, const CallEnv&) { return part<&DateTime::year>(a, "YEAR"); }};
    t["MONTH"]  = Function{[](const Args& a, const CallEnv&) { return part<&DateTime::month>(a, "MONTH"); }};
    t["DAY"]    = Function{[](const Args& a, const CallEnv&) { return part<&DateTime::day>(a, "DAY"); }};
    t["HOUR"]   = Function{[](const Args& a, const CallEnv&) { return part<&DateTime::hour>(a, "HOUR"); }};
    t["MINUTE"] = Function{[](const Args& a, const CallEnv&) { return part<&DateTime::minute>(a, "MINUTE"); }};
    t["SECOND"] = Function{[](const Args& a, const CallEnv&) { return part<&DateTime::second>(a, "SECOND"); }};
}

} // namespace cellexpr::builtins
