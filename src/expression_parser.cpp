#include "codeowners/expression_parser.hpp"

#include <map>
#include <sstream>

namespace codeowners {

namespace {

const std::map<std::string, int> kPrecedences = {
    { "OR",  1 },
    { "AND", 2 },
};

const std::map<std::string, Associativity> kAssociativities = {
    { "OR",  Associativity::Left },
    { "AND", Associativity::Left },
};

bool balanced(const std::vector<Token>& tokens) {
    int depth = 0;
    for (const auto& t : tokens) {
        if (t.kind == TokenKind::LParen) ++depth;
        if (t.kind == TokenKind::RParen && --depth < 0) return false;
    }
    return depth == 0;
}

} // namespace

int precedence(const std::string& op) {
    auto it = kPrecedences.find(op);
    return it == kPrecedences.end() ? -1 : it->second;
}

Associativity associativity(const std::string& op) {
    auto it = kAssociativities.find(op);
    return it == kAssociativities.end() ? Associativity::Left : it->second;
}

std::vector<Token> to_postfix(const std::vector<Token>& infix) {
    if (!balanced(infix)) {
        std::ostringstream msg;
        msg << "Mismatched parentheses in " << infix;
        throw MismatchedParentheses(msg.str());
    }

    std::vector<Token> output;
    std::vector<Token> stack;
    output.reserve(infix.size());

    for (const auto& token : infix) {
        switch (token.kind) {
            case TokenKind::Operand:
                output.push_back(token);
                break;

            case TokenKind::LParen:
                stack.push_back(token);
                break;

            case TokenKind::RParen:
                while (!stack.empty() && stack.back().kind != TokenKind::LParen) {
                    output.push_back(stack.back());
                    stack.pop_back();
                }
                if (stack.empty()) throw MismatchedParentheses("Unmatched ')'");
                stack.pop_back();
                break;

            case TokenKind::And:
            case TokenKind::Or: {
                const int prec = precedence(token.text);
                while (!stack.empty() && stack.back().kind != TokenKind::LParen) {
                    const int top = precedence(stack.back().text);
                    if (top > prec || (top == prec && associativity(token.text) == Associativity::Left)) {
                        output.push_back(stack.back());
                        stack.pop_back();
                    } else {
                        break;
                    }
                }
                stack.push_back(token);
                break;
            }
        }
    }

    while (!stack.empty()) {
        if (stack.back().kind == TokenKind::LParen) throw MismatchedParentheses("Unmatched '('");
        output.push_back(stack.back());
        stack.pop_back();
    }
    return output;
}

} // namespace codeowners
