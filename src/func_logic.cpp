#include "builtins.hpp"
#include "cellexpr/coerce.hpp"
#include "cellexpr/error.hpp"

namespace cellexpr::builtins {

namespace {

Value fn_if(const Args& a, const CallEnv&) {
    require_args(a, 2, 3, "IF");
    return truthy(a[0]) ? a[1] : arg_or(a, 2, Value());
}

Value fn_ifs(const Args& a, const CallEnv&) {
    if (a.size() < 2 || a.size() % 2 != 0) throw FormulaError("IFS requires condition/value pairs");
    for (std::size_t i = 0; i < a.size(); i += 2) {
        if (truthy(a[i])) return a[i + 1];
    }
    throw FormulaError("IFS did not match any condition");
}

// SWITCH(expr, case1, value1, ..., [default])
Value fn_switch(const Args& a, const CallEnv&) {
    if (a.size() < 2) throw FormulaError("SWITCH requires at least one case");
    std::size_t n = a.size() - 1;
    const bool has_default = n % 2 == 1;
    if (has_default) --n;
    for (std::size_t i = 1; i + 1 <= n; i += 2) {
        if (a[0] == a[i]) return a[i + 1];
    }
    if (has_default) return a.back();
    throw FormulaError("SWITCH did not match any case");
}

Value fn_and(const Args& a, const CallEnv&) {
    for (const auto& v : a) {
        if (!truthy(v)) return Value(false);
    }
    return Value(true);
}

Value fn_or(const Args& a, const CallEnv&) {
    for (const auto& v : a) {
        if (truthy(v)) return Value(true);
    }
    return Value(false);
}

Value fn_not(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "NOT");
    return Value(!truthy(a[0]));
}

Value fn_isnumber(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "ISNUMBER");
    try {
        to_number(a[0]);
    } catch (const FormulaError&) {
        return Value(false);
    }
    return Value(true);
}

Value fn_istext(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "ISTEXT");
    return Value(a[0].force().is_text());
}

Value fn_isblank(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "ISBLANK");
    return Value(is_blank(a[0]));
}

} // namespace

void add_logic(FunctionTable& t) {
    t["IF"]       = Function{fn_if};
    t["IFS"]      = Function{fn_ifs};
    t["SWITCH"]   = Function{fn_switch};
    t["AND"]      = Function{fn_and};
    t["OR"]       = Function{fn_or};
    t["NOT"]      = Function{fn_not};
    t["ISNUMBER"] = Function{fn_isnumber};
    t["ISTEXT"]   = Function{fn_istext};
    t["ISBLANK"]  = Function{fn_isblank};
}

} // namespace cellexpr::builtins
