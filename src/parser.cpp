#include "cellexpr/parser.hpp"
#include "cellexpr/coerce.hpp"
#include "cellexpr/error.hpp"
#include "cellexpr/lexer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/core.h>

namespace cellexpr {

namespace {

constexpr int kComparePrec = 1;
constexpr int kPowerPrec = 4;

int precedence(const std::string& op) {
    switch (op[0]) {
        case '^': return kPowerPrec;
        case '*':
        case '/': return 3;
        case '+':
        case '-':
        case '&': return 2;
        default:  return 0;
    }
}

CmpOp comparator(const std::string& s) {
    if (s == "=")  return CmpOp::Eq;
    if (s == "<>") return CmpOp::Ne;
    if (s == "<")  return CmpOp::Lt;
    if (s == "<=") return CmpOp::Le;
    if (s == ">")  return CmpOp::Gt;
    return CmpOp::Ge;
}

template <class T>
NodePtr make_node(std::size_t position, T&& payload) {
    return std::make_unique<Node>(Node{std::forward<T>(payload), position});
}

std::string upper(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

[[noreturn]] void syntax_error(const std::string& msg) {
    throw FormulaError(msg, FormulaError::Kind::Syntax);
}

struct DepthGuard {
    DepthGuard(std::size_t& depth, std::size_t limit) : depth_(depth) {
        if (++depth_ > limit) {
            --depth_;
            syntax_error(fmt::format("expression nesting exceeds {} levels", limit));
        }
    }
    ~DepthGuard() { --depth_; }
    std::size_t& depth_;
};

} // namespace

// Height of a node over children of heights a and b. Operator folding
// deepens the tree without recursing, so the tree height is bounded too.
std::size_t Parser::grow(std::size_t a, std::size_t b) const {
    const std::size_t h = 1 + std::max(a, b);
    if (h > max_depth_) syntax_error(fmt::format("expression nesting exceeds {} levels", max_depth_));
    return h;
}

Parser::Parser(std::vector<Token> tokens, std::size_t max_depth)
    : tokens_(std::move(tokens)), max_depth_(max_depth) {
    if (tokens_.empty() || tokens_.back().kind != TokKind::End) {
        std::size_t at = tokens_.empty() ? 0 : tokens_.back().position;
        tokens_.push_back(Token{TokKind::End, "", {}, at});
    }
}

const Token& Parser::advance() {
    const Token& t = tokens_[pos_];
    if (t.kind != TokKind::End) ++pos_;
    return t;
}

const Token& Parser::expect(TokKind kind) {
    const Token& t = advance();
    if (t.kind != kind) {
        syntax_error(fmt::format("expected token {}, found {}", kind_name(kind), kind_name(t.kind)));
    }
    return t;
}

NodePtr Parser::parse() {
    NodePtr root = expression(0);
    expect(TokKind::End);
    return root;
}

NodePtr Parser::expression(int min_prec) {
    DepthGuard guard(depth_, max_depth_);

    NodePtr node = prefix();
    std::size_t height = height_;
    for (;;) {
        const Token& t = peek();
        if (t.kind == TokKind::Operator) {
            const int prec = precedence(t.text);
            if (prec < min_prec) break;
            const char op = t.text[0];
            const std::size_t at = t.position;
            advance();
            // '^' recurses at its own level and so groups to the right
            NodePtr rhs = expression(op == '^' ? prec : prec + 1);
            height = grow(height, height_);
            node = make_node(at, BinaryOp{op, std::move(node), std::move(rhs)});
            continue;
        }
        if (t.kind == TokKind::Comparator) {
            if (kComparePrec < min_prec) break;
            const CmpOp op = comparator(t.text);
            const std::size_t at = t.position;
            advance();
            NodePtr rhs = expression(kComparePrec + 1);
            height = grow(height, height_);
            node = make_node(at, Comparison{op, std::move(node), std::move(rhs)});
            continue;
        }
        break;
    }
    height_ = height;
    return node;
}

NodePtr Parser::prefix() {
    const Token& t = advance();
    switch (t.kind) {
        case TokKind::Number:
        case TokKind::String:
        case TokKind::Boolean:
        case TokKind::Null:
            height_ = 1;
            return make_node(t.position, Literal{t.value});

        case TokKind::Variable:
            height_ = 1;
            return make_node(t.position, Variable{t.text});

        case TokKind::Operator:
            if (t.text == "+" || t.text == "-") {
                const char op = t.text[0];
                const std::size_t at = t.position;
                NodePtr operand = expression(kPowerPrec);
                height_ = grow(height_, 0);
                return make_node(at, Unary{op, std::move(operand)});
            }
            break;

        case TokKind::LParen: {
            NodePtr inner = expression(0);
            expect(TokKind::RParen);
            return inner;
        }

        case TokKind::Identifier:
            if (peek().kind == TokKind::LParen) return call(t);
            syntax_error(fmt::format("unexpected identifier '{}'; variables must use {{{{name}}}} notation", t.text));

        default:
            break;
    }
    syntax_error(fmt::format("unexpected token {} in expression", kind_name(t.kind)));
}

NodePtr Parser::call(const Token& name) {
    Call c{upper(name.text), {}};
    const std::size_t at = name.position;
    advance(); // '('

    if (peek().kind == TokKind::RParen) {
        advance();
        height_ = 1;
        return make_node(at, std::move(c));
    }
    std::size_t height = 0;
    for (;;) {
        c.args.push_back(expression(0));
        height = std::max(height, height_);
        const TokKind k = advance().kind;
        if (k == TokKind::ArgSeparator) continue;
        if (k == TokKind::RParen) break;
        syntax_error("expected ';' or ')' in function arguments");
    }
    height_ = grow(height, 0);
    return make_node(at, std::move(c));
}

NodePtr parse(std::string_view input, std::size_t max_depth) {
    Parser p(tokenize(input), max_depth);
    return p.parse();
}

} // namespace cellexpr
