#pragma once

#include <cstddef>
#include <string>

#include "cellexpr/value.hpp"

namespace cellexpr {

enum class TokKind {
    Number,
    String,
    Boolean,
    Null,
    Variable,   // {{name}}
    Identifier, // function name
    Operator,   // + - * / ^ &
    Comparator, // = <> < <= > >=
    LParen,
    RParen,
    ArgSeparator, // ; or ,
    End,
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};     // operator/comparator symbol, identifier or variable name
    Value value{};          // literal payload for Number/String/Boolean
    std::size_t position{0};
};

const char* kind_name(TokKind k);

} // namespace cellexpr
