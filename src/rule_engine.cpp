#include "codeowners/rule_engine.hpp"

#include "codeowners/expression_evaluator.hpp"
#include "codeowners/expression_parser.hpp"
#include "codeowners/lexer.hpp"
#include "codeowners/pattern_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace codeowners {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

MatchResult malformed(const Rule& rule, const std::string& reason,
                      std::vector<Diagnostic>& diagnostics) {
    diagnostics.push_back({ Severity::Warning, rule.expression,
        "Malformed boolean expression (" + reason + "): rule for '" +
        rule.path_pattern + "' treated as satisfied." });
    return { rule.path_pattern, rule.expression, true, MatchOutcome::MalformedAutoSatisfied };
}

} // namespace

// ── Rule file ─────────────────────────────────────────────────────────────────

std::vector<Rule> parse_rule_declarations(const std::string& content) {
    const std::string marker = kRuleMarker;
    std::vector<Rule> rules;
    std::istringstream lines(content);
    std::string line;

    while (std::getline(lines, line)) {
        if (line.compare(0, marker.size(), marker) != 0) continue;
        if (line.size() == marker.size() ||
            !std::isspace(static_cast<unsigned char>(line[marker.size()]))) continue;

        std::istringstream fields(line.substr(marker.size()));
        std::string pattern;
        if (!(fields >> pattern)) continue;

        std::string rest;
        std::getline(fields, rest);
        auto expression = trim(rest);
        if (expression.empty()) continue;

        rules.push_back({ std::move(pattern), std::move(expression) });
    }
    return rules;
}

std::vector<Rule> parse_rules(const std::string& content) {
    std::vector<Rule> rules;
    for (auto& decl : parse_rule_declarations(content)) {
        auto existing = std::find_if(rules.begin(), rules.end(),
            [&](const Rule& r) { return r.path_pattern == decl.path_pattern; });
        if (existing != rules.end()) {
            existing->expression = std::move(decl.expression);
        } else {
            rules.push_back(std::move(decl));
        }
    }
    return rules;
}

// ── EvaluationReport ──────────────────────────────────────────────────────────

bool FileResults::satisfied() const {
    return std::any_of(results.begin(), results.end(),
                       [](const MatchResult& r) { return r.satisfied; });
}

const std::vector<MatchResult>* EvaluationReport::find(const std::string& file) const {
    for (const auto& f : files)
        if (f.file == file) return &f.results;
    return nullptr;
}

bool EvaluationReport::overall_satisfied() const {
    return std::all_of(files.begin(), files.end(),
                       [](const FileResults& f) { return f.satisfied(); });
}

std::vector<UnsatisfiedRule> EvaluationReport::unsatisfied() const {
    std::vector<UnsatisfiedRule> out;
    for (const auto& f : files)
        for (const auto& r : f.results)
            if (!r.satisfied) out.push_back({ f.file, r });
    return out;
}

// ── RuleEngine ────────────────────────────────────────────────────────────────

MatchResult RuleEngine::evaluate_rule(const Rule& rule,
                                      const ApproverSet& approvers,
                                      std::vector<Diagnostic>& diagnostics) const {
    auto lexed = tokenize(rule.expression);
    if (!lexed.ok()) return malformed(rule, lexed.error->reason, diagnostics);

    std::vector<Token> postfix;
    try {
        postfix = to_postfix(lexed.tokens);
    } catch (const MismatchedParentheses& e) {
        return malformed(rule, e.what(), diagnostics);
    }

    bool ok = false;
    try {
        ok = evaluate_postfix(postfix, approvers, teams_, &diagnostics);
    } catch (const MalformedExpression& e) {
        throw MalformedExpression("rule for '" + rule.path_pattern + "' (" + rule.expression +
                                  "): " + e.what());
    }
    return { rule.path_pattern, rule.expression, ok,
             ok ? MatchOutcome::Satisfied : MatchOutcome::Unsatisfied };
}

EvaluationReport RuleEngine::evaluate(const std::vector<std::string>& changed_files,
                                      const std::vector<Rule>& rules,
                                      const ApproverSet& approvers) const {
    std::vector<PathPattern> patterns;
    patterns.reserve(rules.size());
    for (const auto& rule : rules) patterns.emplace_back(rule.path_pattern);

    EvaluationReport report;
    std::set<std::string> seen;

    for (const auto& file : changed_files) {
        if (!seen.insert(file).second) continue;

        FileResults entry{ file, {} };
        for (std::size_t i = 0; i < rules.size(); ++i) {
            if (!patterns[i].matches(file)) continue;
            entry.results.push_back(evaluate_rule(rules[i], approvers, report.diagnostics));
        }
        if (!entry.results.empty()) report.files.push_back(std::move(entry));
    }
    return report;
}

} // namespace codeowners
