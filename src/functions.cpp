#include "cellexpr/functions.hpp"
#include "cellexpr/error.hpp"
#include "builtins.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace cellexpr {

namespace {

std::string upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

FunctionTable build_builtins() {
    FunctionTable t;
    builtins::add_logic(t);
    builtins::add_math(t);
    builtins::add_text(t);
    builtins::add_datetime(t);
    return t;
}

} // namespace

namespace builtins {

void require_args(const Args& args, std::size_t min, std::size_t max, const char* name) {
    if (args.size() >= min && args.size() <= max) return;
    if (min == max) {
        throw FormulaError(fmt::format("{} expects {} argument{}, got {}", name, min, min == 1 ? "" : "s", args.size()));
    }
    if (args.size() < min) {
        throw FormulaError(fmt::format("{} expects at least {} argument{}, got {}", name, min, min == 1 ? "" : "s", args.size()));
    }
    throw FormulaError(fmt::format("{} expects at most {} arguments, got {}", name, max, args.size()));
}

} // namespace builtins

const FunctionTable& builtin_functions() {
    static const FunctionTable table = build_builtins();
    return table;
}

FunctionRegistry::FunctionRegistry() : table_(builtin_functions()) {}

FunctionRegistry& FunctionRegistry::shared() {
    static FunctionRegistry registry;
    return registry;
}

void FunctionRegistry::restore_defaults() {
    for (const auto& [name, fn] : builtin_functions()) {
        if (table_.count(name) != 0) continue;
        spdlog::warn("cellexpr: restoring missing built-in function '{}'", name);
        table_.emplace(name, fn);
    }
}

void FunctionRegistry::register_function(std::string_view name, Callable fn, unsigned needs) {
    if (!fn) throw std::invalid_argument("registered function must be callable");
    std::string key = upper(name);
    std::lock_guard<std::mutex> lock(mu_);
    restore_defaults();
    spdlog::debug("cellexpr: registering function '{}'", key);
    table_[std::move(key)] = Function{std::move(fn), needs};
}

bool FunctionRegistry::remove(std::string_view name) {
    std::lock_guard<std::mutex> lock(mu_);
    const bool erased = table_.erase(upper(name)) != 0;
    if (erased) spdlog::debug("cellexpr: removed function '{}'", upper(name));
    return erased;
}

std::optional<Function> FunctionRegistry::lookup(std::string_view name) {
    std::lock_guard<std::mutex> lock(mu_);
    restore_defaults();
    auto it = table_.find(upper(name));
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

bool FunctionRegistry::contains(std::string_view name) {
    return lookup(name).has_value();
}

std::vector<std::string> FunctionRegistry::names() {
    std::lock_guard<std::mutex> lock(mu_);
    restore_defaults();
    std::vector<std::string> out;
    out.reserve(table_.size());
    for (const auto& entry : table_) out.push_back(entry.first);
    return out;
}

void flatten(const Value& raw, Args& out) {
    const Value v = raw.force();
    if (!v.is_sequence()) {
        out.push_back(v);
        return;
    }
    for (const auto& item : v.as_sequence()) flatten(item, out);
}

Args flatten(const Args& args) {
    Args out;
    for (const auto& a : args) flatten(a, out);
    return out;
}

Value vectorize_unary(const Value& raw, const std::function<Value(const Value&)>& fn) {
    const Value v = raw.force();
    if (!v.is_sequence()) return fn(v);
    Sequence out;
    out.reserve(v.as_sequence().size());
    for (const auto& item : v.as_sequence()) out.push_back(vectorize_unary(item, fn));
    return Value(std::move(out));
}

Value vectorize_binary(const Value& raw_a, const Value& raw_b,
                       const std::function<Value(const Value&, const Value&)>& fn) {
    const Value a = raw_a.force();
    const Value b = raw_b.force();
    Sequence out;
    if (a.is_sequence()) {
        const Sequence& xs = a.as_sequence();
        if (b.is_sequence()) {
            const Sequence& ys = b.as_sequence();
            const std::size_t n = std::min(xs.size(), ys.size());
            for (std::size_t i = 0; i < n; ++i) out.push_back(vectorize_binary(xs[i], ys[i], fn));
        } else {
            for (const auto& x : xs) out.push_back(vectorize_binary(x, b, fn));
        }
        return Value(std::move(out));
    }
    if (b.is_sequence()) {
        for (const auto& y : b.as_sequence()) out.push_back(vectorize_binary(a, y, fn));
        return Value(std::move(out));
    }
    return fn(a, b);
}

} // namespace cellexpr
