#include "codeowners/expression_evaluator.hpp"

#include <algorithm>

namespace codeowners {

namespace {

class OperandStack {
public:
    void push(bool value) { values_.push_back(value); }

    bool pop() {
        if (values_.empty()) throw MalformedExpression("operator applied to an empty stack");
        bool v = values_.back();
        values_.pop_back();
        return v;
    }

    std::size_t size() const { return values_.size(); }

private:
    std::vector<bool> values_;
};

bool team_approved(const Token& token, const ApproverSet& approvers,
                   const TeamResolver& teams, std::vector<Diagnostic>* diagnostics) {
    const auto slug = token.team_slug();
    auto members = teams.resolve(slug);
    if (!members) {
        if (diagnostics) {
            diagnostics->push_back({ Severity::Warning, slug,
                "Team '" + slug + "' not found. Treating as empty group." });
        }
        return false;
    }
    return std::any_of(members->begin(), members->end(),
                       [&](const std::string& m) { return approvers.contains(m); });
}

} // namespace

bool evaluate_postfix(const std::vector<Token>& postfix,
                      const ApproverSet& approvers,
                      const TeamResolver& teams,
                      std::vector<Diagnostic>* diagnostics) {
    OperandStack stack;

    for (const auto& token : postfix) {
        switch (token.kind) {
            case TokenKind::And: {
                bool right = stack.pop();
                bool left  = stack.pop();
                stack.push(left && right);
                break;
            }
            case TokenKind::Or: {
                bool right = stack.pop();
                bool left  = stack.pop();
                stack.push(left || right);
                break;
            }
            case TokenKind::Operand:
                stack.push(token.is_team() ? team_approved(token, approvers, teams, diagnostics)
                                           : approvers.contains(token.text));
                break;
            case TokenKind::LParen:
            case TokenKind::RParen:
                throw MalformedExpression("parenthesis in postfix expression");
        }
    }

    if (stack.size() != 1) {
        throw MalformedExpression("postfix expression left " + std::to_string(stack.size()) +
                                  " values on the stack");
    }
    return stack.pop();
}

} // namespace codeowners
