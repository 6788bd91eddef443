#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "cellexpr/value.hpp"

namespace cellexpr {

struct Node;
using NodePtr = std::unique_ptr<const Node>;

enum class CmpOp { Eq, Ne, Lt, Le, Gt, Ge };

struct Literal    { Value value; };
struct Variable   { std::string name; };
struct Unary      { char op; NodePtr operand; };             // + -
struct BinaryOp   { char op; NodePtr left; NodePtr right; }; // + - * / ^ &
struct Comparison { CmpOp op; NodePtr left; NodePtr right; };
struct Call       { std::string name; std::vector<NodePtr> args; }; // name is upper-case

struct Node {
    std::variant<Literal, Variable, Unary, BinaryOp, Comparison, Call> data;
    std::size_t position{0}; // offset of the first token in the formula
};

const char* symbol(CmpOp op);

/// S-expression rendering, e.g. (+ 1 (* 2 3)) or (SUM {{a}} 2).
std::string to_string(const Node& n);

} // namespace cellexpr
