#pragma once

#include "codeowners/team_resolver.hpp"
#include "codeowners/types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace codeowners {

/// Marker that opens a boolean rule line in a CODEOWNERS file.
inline constexpr const char* kRuleMarker = "#@BOOL";

/**
 * Extracts "#@BOOL <pattern> <expression>" declarations from CODEOWNERS
 * text, in file order. Other lines, including plain CODEOWNERS entries, are
 * ignored. A pattern declared twice keeps its first position and takes the
 * later expression.
 */
std::vector<Rule> parse_rules(const std::string& content);

/// Every "#@BOOL" declaration as written, duplicates included.
std::vector<Rule> parse_rule_declarations(const std::string& content);

// ── Report types ──────────────────────────────────────────────────────────────

struct FileResults {
    std::string              file;
    std::vector<MatchResult> results;     // rule declaration order, never empty

    /// At least one matching rule is satisfied.
    bool satisfied() const;
};

struct UnsatisfiedRule {
    std::string file;
    MatchResult result;
};

struct EvaluationReport {
    std::vector<FileResults> files;       // changed-file order; files with no rule are absent
    std::vector<Diagnostic>  diagnostics;

    /// Results for `file`, or nullptr when no rule matched it.
    const std::vector<MatchResult>* find(const std::string& file) const;

    /// Every file present has at least one satisfied rule.
    bool overall_satisfied() const;

    /// Failing (file, rule) pairs, in report order.
    std::vector<UnsatisfiedRule> unsatisfied() const;

    std::size_t matched_file_count() const { return files.size(); }
};

/**
 * RuleEngine
 *
 * Checks the changed files of a pull request against boolean CODEOWNERS
 * rules.
 *
 * The resolver is held by reference and must outlive the engine.
 *
 * For each file, every rule whose pattern matches contributes one
 * MatchResult, in declaration order. A rule with a malformed expression is
 * recorded as satisfied (fail-open) with a warning diagnostic. An expression
 * that lexes but does not reduce to one value ("@a AND", "@a @b", "( )")
 * throws MalformedExpression out of evaluate(). A file is
 * satisfied when any of its matching rules is; a file no rule matches has
 * no requirement.
 *
 * Team lookups go straight to the resolver on every occurrence; wrap it in
 * a MemoizingTeamResolver to share answers across rules.
 */
class RuleEngine {
public:
    explicit RuleEngine(const TeamResolver& teams) : teams_(teams) {}
    explicit RuleEngine(const TeamResolver&&) = delete;

    EvaluationReport evaluate(const std::vector<std::string>& changed_files,
                              const std::vector<Rule>& rules,
                              const ApproverSet& approvers) const;

    /// Evaluates one rule's expression, appending diagnostics to `diagnostics`.
    MatchResult evaluate_rule(const Rule& rule,
                              const ApproverSet& approvers,
                              std::vector<Diagnostic>& diagnostics) const;

private:
    const TeamResolver& teams_;
};

} // namespace codeowners
