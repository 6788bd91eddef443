#pragma once

#include <stdexcept>
#include <string>

namespace cellexpr {

/// Raised when a formula cannot be tokenized, parsed or evaluated.
class FormulaError : public std::runtime_error {
public:
    enum class Kind {
        Lexical,    // unexpected character, unterminated string/placeholder
        Syntax,     // unexpected or missing token
        Evaluation, // unknown names, bad coercions, function failures
    };

    explicit FormulaError(const std::string& message, Kind kind = Kind::Evaluation)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace cellexpr
