#pragma once

#include <cstddef>
#include <string>

#include "cellexpr/functions.hpp"

namespace cellexpr::builtins {

void add_logic(FunctionTable& t);
void add_math(FunctionTable& t);
void add_text(FunctionTable& t);
void add_datetime(FunctionTable& t);

// Throws FormulaError unless min <= args.size() <= max.
void require_args(const Args& args, std::size_t min, std::size_t max, const char* name);

// Argument i, or fallback when it was not supplied.
inline const Value& arg_or(const Args& args, std::size_t i, const Value& fallback) {
    return i < args.size() ? args[i] : fallback;
}

// Round half away from zero on the shortest decimal form of x.
double round_half_up(double x, int digits);

} // namespace cellexpr::builtins
