#include "cellexpr/lexer.hpp"
#include "cellexpr/coerce.hpp"
#include "cellexpr/error.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

#include <fmt/core.h>

namespace cellexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

// A sign only belongs to a number literal where an operand is expected;
// after an operand it is the binary operator.
static bool ends_operand(TokKind k) {
    switch (k) {
        case TokKind::Number:
        case TokKind::String:
        case TokKind::Boolean:
        case TokKind::Null:
        case TokKind::Variable:
        case TokKind::RParen:
            return true;
        default:
            return false;
    }
}

static std::string upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

const char* kind_name(TokKind k) {
    switch (k) {
        case TokKind::Number:       return "NUMBER";
        case TokKind::String:       return "STRING";
        case TokKind::Boolean:      return "BOOLEAN";
        case TokKind::Null:         return "NULL";
        case TokKind::Variable:     return "VARIABLE";
        case TokKind::Identifier:   return "IDENTIFIER";
        case TokKind::Operator:     return "OPERATOR";
        case TokKind::Comparator:   return "COMPARATOR";
        case TokKind::LParen:       return "LPAREN";
        case TokKind::RParen:       return "RPAREN";
        case TokKind::ArgSeparator: return "ARG_SEPARATOR";
        case TokKind::End:          return "END";
    }
    return "?";
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::next() {
    Token t = scan();
    last_ = t.kind;
    return t;
}

Token Lexer::scan() {
    skip_ws();
    if (is_end()) return {TokKind::End, "", {}, i_};

    const std::size_t at = i_;
    const char c = s_[i_];

    if (c == '{' && peek_is(1, '{')) return variable();
    if (c == '"') return string_literal();
    if (is_digit(c)) return number();
    if ((c == '+' || c == '-') && i_ + 1 < s_.size() && is_digit(s_[i_ + 1]) && !ends_operand(last_)) {
        return number();
    }
    if (is_ident_start(c)) return identifier();

    switch (c) {
        case '(': ++i_; return {TokKind::LParen, "(", {}, at};
        case ')': ++i_; return {TokKind::RParen, ")", {}, at};
        case ';':
        case ',': ++i_; return {TokKind::ArgSeparator, std::string(1, c), {}, at};
        case '&': ++i_; return {TokKind::Operator, "&", {}, at};
        default: break;
    }

    // two-character comparators before the single-character ones
    if (c == '>' && peek_is(1, '=')) { i_ += 2; return {TokKind::Comparator, ">=", {}, at}; }
    if (c == '<' && peek_is(1, '=')) { i_ += 2; return {TokKind::Comparator, "<=", {}, at}; }
    if (c == '<' && peek_is(1, '>')) { i_ += 2; return {TokKind::Comparator, "<>", {}, at}; }

    switch (c) {
        case '=':
        case '<':
        case '>':
            ++i_;
            return {TokKind::Comparator, std::string(1, c), {}, at};
        case '+':
        case '-':
        case '*':
        case '/':
        case '^':
            ++i_;
            return {TokKind::Operator, std::string(1, c), {}, at};
        default:
            break;
    }

    throw FormulaError(fmt::format("unexpected character '{}' at position {}", c, at),
                       FormulaError::Kind::Lexical);
}

Token Lexer::variable() {
    const std::size_t at = i_;
    const std::size_t close = s_.find("}}", i_ + 2);
    if (close == std::string_view::npos) {
        throw FormulaError("unterminated variable placeholder", FormulaError::Kind::Lexical);
    }
    Token t{TokKind::Variable, {}, {}, at};
    t.text = trim(s_.substr(i_ + 2, close - i_ - 2));
    if (t.text.empty()) {
        throw FormulaError("empty variable placeholder", FormulaError::Kind::Lexical);
    }
    i_ = close + 2;
    return t;
}

Token Lexer::string_literal() {
    const std::size_t at = i_;
    ++i_; // opening quote
    std::string buf;
    while (!is_end()) {
        const char c = s_[i_];
        if (c == '"') {
            if (peek_is(1, '"')) {
                buf.push_back('"');
                i_ += 2;
                continue;
            }
            ++i_;
            return {TokKind::String, {}, Value(std::move(buf)), at};
        }
        if (c == '\\') {
            ++i_;
            if (is_end()) {
                throw FormulaError("invalid escape sequence in string literal", FormulaError::Kind::Lexical);
            }
            switch (s_[i_]) {
                case 'n': buf.push_back('\n'); break;
                case 't': buf.push_back('\t'); break;
                case 'r': buf.push_back('\r'); break;
                default:  buf.push_back(s_[i_]); break; // \" \\ and unknown escapes pass through
            }
            ++i_;
            continue;
        }
        buf.push_back(c);
        ++i_;
    }
    throw FormulaError("unterminated string literal", FormulaError::Kind::Lexical);
}

// [+-]?(digits[.digits*] | digits)([eE][+-]?digits)?
Token Lexer::number() {
    const std::size_t start = i_;
    if (s_[i_] == '+' || s_[i_] == '-') ++i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;

    bool is_float = false;
    if (!is_end() && s_[i_] == '.') {
        is_float = true;
        ++i_;
        while (!is_end() && is_digit(s_[i_])) ++i_;
    }
    if (!is_end() && (s_[i_] == 'e' || s_[i_] == 'E')) {
        std::size_t j = i_ + 1;
        if (j < s_.size() && (s_[j] == '+' || s_[j] == '-')) ++j;
        if (j < s_.size() && is_digit(s_[j])) {
            is_float = true;
            i_ = j;
            while (!is_end() && is_digit(s_[i_])) ++i_;
        }
    }

    const std::string literal(s_.substr(start, i_ - start));
    Token t{TokKind::Number, literal, {}, start};
    if (!is_float) {
        errno = 0;
        const long long v = std::strtoll(literal.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            t.value = Value(v);
            return t;
        }
    }
    t.value = Value(std::strtod(literal.c_str(), nullptr));
    return t;
}

Token Lexer::identifier() {
    const std::size_t start = i_++;
    while (!is_end() && is_ident_char(s_[i_])) ++i_;
    std::string ident(s_.substr(start, i_ - start));
    const std::string up = upper(ident);
    if (up == "TRUE")  return {TokKind::Boolean, ident, Value(true), start};
    if (up == "FALSE") return {TokKind::Boolean, ident, Value(false), start};
    if (up == "NULL" || up == "NONE") return {TokKind::Null, ident, {}, start};
    return {TokKind::Identifier, std::move(ident), {}, start};
}

std::vector<Token> tokenize(std::string_view input) {
    Lexer lex(input);
    std::vector<Token> out;
    for (;;) {
        Token t = lex.next();
        const bool done = t.kind == TokKind::End;
        out.push_back(std::move(t));
        if (done) break;
    }
    return out;
}

} // namespace cellexpr
