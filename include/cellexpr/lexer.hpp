#pragma once
#include <string_view>
#include <vector>
#include "cellexpr/token.hpp"

namespace cellexpr {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    Token next();

private:
    Token scan();
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    bool peek_is(std::size_t offset, char c) const {
        return i_ + offset < s_.size() && s_[i_ + offset] == c;
    }

    Token variable();
    Token string_literal();
    Token number();
    Token identifier();

    std::string_view s_;
    std::size_t i_{0};
    TokKind last_{TokKind::End};
};

/// Split a formula into tokens, terminated by an End token.
/// Throws FormulaError (Kind::Lexical) on malformed input.
std::vector<Token> tokenize(std::string_view input);

} // namespace cellexpr
