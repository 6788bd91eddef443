#include "cellexpr/engine.hpp"
#include "cellexpr/coerce.hpp"

#include <cctype>
#include <cmath>
#include <exception>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace cellexpr {

namespace {

// Strips surrounding whitespace and one leading '='. Empty means blank.
std::string prepare(std::string_view formula) {
    std::string text = trim(formula);
    if (!text.empty() && text[0] == '=') text = trim(std::string_view(text).substr(1));
    return text;
}

class Evaluator {
public:
    Evaluator(const Context& ctx, FunctionRegistry& registry) : ctx_(ctx), registry_(registry) {}

    Value eval(const Node& n) { return std::visit(*this, n.data); }

    Value operator()(const Literal& n) { return n.value; }

    Value operator()(const Variable& n) {
        auto it = ctx_.find(n.name);
        if (it == ctx_.end()) throw FormulaError(fmt::format("unknown variable '{}'", n.name));
        return it->second.force();
    }

    Value operator()(const Unary& n) {
        const double x = to_number(eval(*n.operand));
        return normalize_number(n.op == '-' ? -x : x);
    }

    Value operator()(const BinaryOp& n) {
        const Value lhs = eval(*n.left);
        const Value rhs = eval(*n.right);
        if (n.op == '&') {
            std::string out;
            for (const auto& v : flatten(Args{lhs, rhs})) {
                if (!v.is_null()) out += to_text(v);
            }
            return Value(std::move(out));
        }

        const double x = to_number(lhs);
        const double y = to_number(rhs);
        switch (n.op) {
            case '+': return normalize_number(x + y);
            case '-': return normalize_number(x - y);
            case '*': return normalize_number(x * y);
            case '/':
                if (y == 0.0) throw FormulaError("division by zero");
                return normalize_number(x / y);
            case '^': {
                const double r = std::pow(x, y);
                if (std::isnan(r) && !std::isnan(x) && !std::isnan(y)) throw FormulaError("math domain error");
                if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) throw FormulaError("numeric result out of range");
                return normalize_number(r);
            }
            default:
                break;
        }
        throw FormulaError(fmt::format("unsupported operator '{}'", n.op));
    }

    Value operator()(const Comparison& n) {
        const Value lhs = to_comparable(eval(*n.left));
        const Value rhs = to_comparable(eval(*n.right));
        switch (n.op) {
            case CmpOp::Eq: return Value(comparable_equal(lhs, rhs));
            case CmpOp::Ne: return Value(!comparable_equal(lhs, rhs));
            case CmpOp::Lt: return Value(compare_values(lhs, rhs) < 0);
            case CmpOp::Le: return Value(compare_values(lhs, rhs) <= 0);
            case CmpOp::Gt: return Value(compare_values(lhs, rhs) > 0);
            case CmpOp::Ge: return Value(compare_values(lhs, rhs) >= 0);
        }
        throw FormulaError("unsupported comparison operator");
    }

    Value operator()(const Call& n) {
        const std::optional<Function> fn = registry_.lookup(n.name);
        if (!fn) throw FormulaError(fmt::format("unknown function '{}'", n.name));

        Args args;
        args.reserve(n.args.size());
        for (const auto& a : n.args) args.push_back(eval(*a));

        CallEnv env;
        if (fn->needs & kNeedsContext) env.context = &ctx_;
        if (fn->needs & kNeedsRegistry) env.registry = &registry_;

        try {
            return fn->fn(args, env);
        } catch (const FormulaError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::debug("cellexpr: function '{}' failed: {}", n.name, e.what());
            throw FormulaError(fmt::format("error executing function '{}': {}", n.name, e.what()));
        } catch (...) {
            spdlog::debug("cellexpr: function '{}' threw a non-standard exception", n.name);
            throw FormulaError(fmt::format("error executing function '{}': unknown error", n.name));
        }
    }

private:
    const Context& ctx_;
    FunctionRegistry& registry_;
};

void collect(const Node& n, Description& d) {
    if (const auto* v = std::get_if<Variable>(&n.data)) {
        d.variables.insert(v->name);
    } else if (const auto* c = std::get_if<Call>(&n.data)) {
        d.functions.insert(c->name);
        for (const auto& a : c->args) collect(*a, d);
    } else if (const auto* u = std::get_if<Unary>(&n.data)) {
        collect(*u->operand, d);
    } else if (const auto* b = std::get_if<BinaryOp>(&n.data)) {
        collect(*b->left, d);
        collect(*b->right, d);
    } else if (const auto* cmp = std::get_if<Comparison>(&n.data)) {
        collect(*cmp->left, d);
        collect(*cmp->right, d);
    }
}

} // namespace

Engine::Engine(FunctionRegistry& registry, EngineOptions options)
    : registry_(&registry), options_(options) {}

NodePtr Engine::parse(std::string_view formula) const {
    const std::string text = prepare(formula);
    if (text.empty()) throw FormulaError("formula is empty", FormulaError::Kind::Syntax);
    return cellexpr::parse(text, options_.max_depth);
}

Description Engine::describe(std::string_view formula) const {
    Description d;
    d.ast = parse(formula);
    collect(*d.ast, d);
    return d;
}

Value Engine::evaluate(std::string_view formula, const Context& ctx) const {
    const std::string text = prepare(formula);
    if (text.empty()) return Value(std::string());
    spdlog::trace("cellexpr: evaluating '{}'", text);
    const NodePtr ast = cellexpr::parse(text, options_.max_depth);
    return evaluate(*ast, ctx);
}

Value Engine::evaluate(const Node& ast, const Context& ctx) const {
    Evaluator ev(ctx, *registry_);
    return ev.eval(ast);
}

Value evaluate(std::string_view formula, const Context& ctx) {
    return Engine().evaluate(formula, ctx);
}

Description describe(std::string_view formula) {
    return Engine().describe(formula);
}

bool looks_like_formula(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    return i < text.size() && text[i] == '=';
}

} // namespace cellexpr
