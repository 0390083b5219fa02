#pragma once

#include "codeowners/team_resolver.hpp"
#include "codeowners/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace codeowners {

/// Everything a check may look at: the rule and the full rule list it came from.
struct LintContext {
    const Rule&              rule;
    const std::vector<Rule>& all_rules;
    const TeamResolver&      teams;
};

struct LintCheck {
    std::string name;
    std::string description;
    // Returns the problem found, or an empty string when the rule passes.
    std::function<std::string(const LintContext&)> check;
};

struct LintViolation {
    std::string check_name;
    std::string path_pattern;
    std::string message;
};

struct LintReport {
    std::size_t                rule_count = 0;
    std::vector<LintViolation> violations;

    bool clean() const { return violations.empty(); }
};

/**
 * RuleLinter
 *
 * Runs named static checks over every rule of a CODEOWNERS file. Meant for
 * catching rules the engine would otherwise accept silently, such as a
 * malformed expression that always passes.
 */
class RuleLinter {
public:
    void add_check(LintCheck check);

    LintReport lint(const std::vector<Rule>& rules, const TeamResolver& teams) const;

    std::size_t check_count() const { return checks_.size(); }

private:
    std::vector<LintCheck> checks_;
};

// ── Built-in checks ───────────────────────────────────────────────────────────

/// Expression tokenizes, converts to postfix and names at least one operand.
LintCheck well_formed_expression();

/// Every "@org/team" operand resolves to a team.
LintCheck known_teams();

/// Rule patterns are not repeated in the rule list.
LintCheck unique_pattern();

/// Pattern has at least one non-slash character.
LintCheck non_empty_pattern();

/// Returns a RuleLinter loaded with all built-in checks.
RuleLinter default_rule_linter();

} // namespace codeowners
