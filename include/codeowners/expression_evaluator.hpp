#pragma once

#include "codeowners/team_resolver.hpp"
#include "codeowners/types.hpp"
#include <stdexcept>
#include <vector>

namespace codeowners {

/// Postfix sequence that does not reduce to exactly one value.
class MalformedExpression : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Evaluates a postfix expression against the approvers.
 *
 * "@name" is true when name approved. "@org/team" is true when any member
 * of the team approved; an unknown team counts as false and a warning is
 * appended to `diagnostics` (if non-null). Every operand is resolved, there
 * is no short-circuiting, and team lookups are not cached here.
 *
 * Throws MalformedExpression on stack underflow or leftover values.
 */
bool evaluate_postfix(const std::vector<Token>& postfix,
                      const ApproverSet& approvers,
                      const TeamResolver& teams,
                      std::vector<Diagnostic>* diagnostics = nullptr);

} // namespace codeowners
