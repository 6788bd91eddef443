#include "cellexpr/ast.hpp"
#include "cellexpr/coerce.hpp"

#include <fmt/core.h>

namespace cellexpr {

const char* symbol(CmpOp op) {
    switch (op) {
        case CmpOp::Eq: return "=";
        case CmpOp::Ne: return "<>";
        case CmpOp::Lt: return "<";
        case CmpOp::Le: return "<=";
        case CmpOp::Gt: return ">";
        case CmpOp::Ge: return ">=";
    }
    return "?";
}

namespace {

struct Printer {
    std::string operator()(const Literal& n) const {
        if (n.value.is_text()) return fmt::format("\"{}\"", n.value.as_text());
        if (n.value.is_null()) return "NULL";
        return to_text(n.value);
    }
    std::string operator()(const Variable& n) const {
        return fmt::format("{{{{{}}}}}", n.name);
    }
    std::string operator()(const Unary& n) const {
        return fmt::format("({} {})", n.op, to_string(*n.operand));
    }
    std::string operator()(const BinaryOp& n) const {
        return fmt::format("({} {} {})", n.op, to_string(*n.left), to_string(*n.right));
    }
    std::string operator()(const Comparison& n) const {
        return fmt::format("({} {} {})", symbol(n.op), to_string(*n.left), to_string(*n.right));
    }
    std::string operator()(const Call& n) const {
        std::string out = "(" + n.name;
        for (const auto& a : n.args) out += " " + to_string(*a);
        return out + ")";
    }
};

} // namespace

std::string to_string(const Node& n) {
    return std::visit(Printer{}, n.data);
}

} // namespace cellexpr
