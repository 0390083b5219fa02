#include "codeowners/rule_linter.hpp"

#include "codeowners/expression_parser.hpp"
#include "codeowners/lexer.hpp"

#include <algorithm>
#include <set>

namespace codeowners {

// ── RuleLinter ────────────────────────────────────────────────────────────────

void RuleLinter::add_check(LintCheck check) {
    checks_.push_back(std::move(check));
}

LintReport RuleLinter::lint(const std::vector<Rule>& rules, const TeamResolver& teams) const {
    LintReport report;
    report.rule_count = rules.size();

    for (const auto& rule : rules) {
        LintContext ctx{ rule, rules, teams };
        for (const auto& check : checks_) {
            auto problem = check.check(ctx);
            if (!problem.empty()) {
                report.violations.push_back({ check.name, rule.path_pattern, std::move(problem) });
            }
        }
    }
    return report;
}

// ── Built-in checks ───────────────────────────────────────────────────────────

LintCheck well_formed_expression() {
    return {
        "WellFormedExpression",
        "Rule expression must parse; malformed rules either pass automatically or abort the check.",
        [](const LintContext& ctx) -> std::string {
            auto lexed = tokenize(ctx.rule.expression);
            if (!lexed.ok()) return "malformed expression (" + lexed.error->reason + ")";
            auto has_operand = std::any_of(lexed.tokens.begin(), lexed.tokens.end(),
                [](const Token& t) { return t.kind == TokenKind::Operand; });
            if (!has_operand) return "expression names no reviewer or team";
            std::vector<Token> postfix;
            try {
                postfix = to_postfix(lexed.tokens);
            } catch (const MismatchedParentheses& e) {
                return e.what();
            }
            // Each operand adds a value, each operator folds two into one.
            int depth = 0;
            for (const auto& t : postfix) {
                if (t.is_operator() && depth < 2) return "operator '" + t.text + "' is missing an operand";
                depth += t.is_operator() ? -1 : 1;
            }
            if (depth != 1) return "operands are not joined by AND/OR";
            return "";
        }
    };
}

LintCheck known_teams() {
    return {
        "KnownTeams",
        "Every team referenced by a rule must exist.",
        [](const LintContext& ctx) -> std::string {
            auto lexed = tokenize(ctx.rule.expression);
            std::string missing;
            std::set<std::string> checked;
            for (const auto& t : lexed.tokens) {
                if (!t.is_team() || !checked.insert(t.team_slug()).second) continue;
                if (!ctx.teams.resolve(t.team_slug())) {
                    missing += missing.empty() ? t.text : ", " + t.text;
                }
            }
            return missing.empty() ? "" : "unknown team(s): " + missing;
        }
    };
}

LintCheck unique_pattern() {
    return {
        "UniquePattern",
        "Each path pattern should be declared by one rule.",
        [](const LintContext& ctx) -> std::string {
            auto n = std::count_if(ctx.all_rules.begin(), ctx.all_rules.end(),
                [&](const Rule& r) { return r.path_pattern == ctx.rule.path_pattern; });
            return n > 1 ? "pattern declared " + std::to_string(n) + " times" : "";
        }
    };
}

LintCheck non_empty_pattern() {
    return {
        "NonEmptyPattern",
        "Path pattern must name something other than the root.",
        [](const LintContext& ctx) -> std::string {
            const auto& p = ctx.rule.path_pattern;
            bool only_slashes = p.find_first_not_of('/') == std::string::npos;
            return only_slashes ? "pattern matches no file" : "";
        }
    };
}

RuleLinter default_rule_linter() {
    RuleLinter linter;
    linter.add_check(non_empty_pattern());
    linter.add_check(unique_pattern());
    linter.add_check(well_formed_expression());
    linter.add_check(known_teams());
    return linter;
}

} // namespace codeowners
