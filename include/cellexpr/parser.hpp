#pragma once
#include <cstddef>
#include <string_view>
#include <vector>
#include "cellexpr/ast.hpp"
#include "cellexpr/token.hpp"

namespace cellexpr {

constexpr std::size_t kDefaultMaxDepth = 256;

class Parser {
public:
    explicit Parser(std::vector<Token> tokens, std::size_t max_depth = kDefaultMaxDepth);

    // Parse the whole token stream through End.
    NodePtr parse();

private:
    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance();
    const Token& expect(TokKind kind);

    NodePtr expression(int min_prec);
    NodePtr prefix();
    NodePtr call(const Token& name);
    std::size_t grow(std::size_t a, std::size_t b) const;

    std::vector<Token> tokens_;
    std::size_t pos_{0};
    std::size_t depth_{0};
    std::size_t height_{0}; // tree height of the node last returned
    std::size_t max_depth_;
};

// Tokenize and parse a bare expression (no leading '=' handling).
// Throws FormulaError on malformed input.
NodePtr parse(std::string_view input, std::size_t max_depth = kDefaultMaxDepth);

} // namespace cellexpr
