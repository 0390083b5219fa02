#pragma once

#include "codeowners/types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace codeowners {

class MismatchedParentheses : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Associativity { Left, Right };

/// OR = 1, AND = 2, anything else -1.
int precedence(const std::string& op);

/// Left for every operator, including unknown ones.
Associativity associativity(const std::string& op);

/**
 * Converts infix tokens to postfix (reverse Polish) order with the
 * shunting-yard algorithm. The output never contains parentheses.
 *
 * Expects tokens already validated by tokenize(); throws
 * MismatchedParentheses if the parentheses do not pair up.
 */
std::vector<Token> to_postfix(const std::vector<Token>& infix);

} // namespace codeowners
