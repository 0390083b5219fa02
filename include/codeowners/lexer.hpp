#pragma once

#include "codeowners/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace codeowners {

struct InvalidExpression {
    std::string expression;
    std::string reason;
};

struct LexResult {
    std::vector<Token>               tokens;
    std::optional<InvalidExpression> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * Splits a boolean rule expression into tokens.
 *
 * Tokens are extracted by pattern: "(", ")", "AND", "OR", "@name" and
 * "@org/team". Anything else in the text is skipped, so "@a & @b" yields
 * two operands. The result is an error when parentheses are unbalanced or two
 * operators are adjacent. An empty expression yields an empty token list.
 */
LexResult tokenize(const std::string& expression);

} // namespace codeowners
