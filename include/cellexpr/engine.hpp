#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

#include "cellexpr/ast.hpp"
#include "cellexpr/error.hpp"
#include "cellexpr/functions.hpp"
#include "cellexpr/parser.hpp"
#include "cellexpr/value.hpp"

namespace cellexpr {

struct EngineOptions {
    std::size_t max_depth{kDefaultMaxDepth}; // parser nesting limit
};

/// Static summary of a formula: its tree and every name it references.
struct Description {
    NodePtr ast;
    std::set<std::string> variables;
    std::set<std::string> functions;
};

/// Parses and evaluates formulas against a function registry.
///
/// A formula may carry a leading '='; it is optional here. A blank formula
/// (or '=' alone) evaluates to empty text. The first error aborts the whole
/// evaluation with a FormulaError.
class Engine {
public:
    explicit Engine(FunctionRegistry& registry = FunctionRegistry::shared(), EngineOptions options = {});

    Value evaluate(std::string_view formula, const Context& ctx = {}) const;
    Value evaluate(const Node& ast, const Context& ctx) const;

    /// Throws FormulaError when the formula is blank or malformed.
    NodePtr parse(std::string_view formula) const;
    Description describe(std::string_view formula) const;

    FunctionRegistry& registry() const { return *registry_; }

private:
    FunctionRegistry* registry_;
    EngineOptions options_;
};

/// Evaluate with the shared registry and default options.
Value evaluate(std::string_view formula, const Context& ctx = {});
Description describe(std::string_view formula);

/// True when the text starts with '=' after leading whitespace.
bool looks_like_formula(std::string_view text);

} // namespace cellexpr
