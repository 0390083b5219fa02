#include "codeowners/approval_source.hpp"
#include "codeowners/config.hpp"
#include "codeowners/expression_evaluator.hpp"
#include "codeowners/json.hpp"
#include "codeowners/rule_engine.hpp"
#include "codeowners/rule_linter.hpp"
#include "codeowners/team_resolver.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace codeowners;

namespace {

enum ExitCode { kSatisfied = 0, kUnsatisfied = 1, kConfigError = 2, kInternalError = 3 };

std::string outcome_str(MatchOutcome o) {
    switch (o) {
        case MatchOutcome::Satisfied:              return "[PASS]     ";
        case MatchOutcome::Unsatisfied:            return "[FAIL]     ";
        case MatchOutcome::MalformedAutoSatisfied: return "[MALFORMED]";
        default:                                   return "[?]        ";
    }
}

void separator(const std::string& title) {
    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  " << title << "\n"
              << std::string(55, '-') << "\n";
}

void print_report(const EvaluationReport& report) {
    separator("APPROVAL RULES");
    if (report.files.empty()) {
        std::cout << "\n  No changed file is covered by a boolean rule.\n";
    }
    for (const auto& f : report.files) {
        std::cout << "\n  File : " << f.file
                  << (f.satisfied() ? "  (satisfied)" : "  (NOT satisfied)") << "\n";
        for (const auto& r : f.results) {
            std::cout << "    " << outcome_str(r.outcome) << " "
                      << r.path_pattern << " -- " << r.expression << "\n";
        }
    }
    for (const auto& d : report.diagnostics) {
        std::cerr << d.severity << ": " << d.message << "\n";
    }
}

// GitHub Actions workflow commands, so failures show up on the PR diff.
void print_annotations(const EvaluationReport& report) {
    std::cout << "::group::CodeOwners Validation Failed\n"
              << "::error::Pull request does not have required approvals\n";
    for (const auto& u : report.unsatisfied()) {
        std::cout << "::error file=" << u.file << "::" << u.result.expression << "\n";
    }
    std::cout << "::endgroup::\n";
}

void print_lint(const LintReport& report) {
    separator("RULE LINT");
    std::cout << "\n  Rules  : " << report.rule_count << "\n";
    if (report.clean()) {
        std::cout << "  Status : Clean\n";
        return;
    }
    std::cout << "  Status : " << report.violations.size() << " violation(s)\n";
    for (const auto& v : report.violations) {
        std::cout << "           -> [" << v.check_name << "] "
                  << v.path_pattern << ": " << v.message << "\n";
    }
}

InMemoryTeamResolver load_teams(const Config& cfg) {
    if (cfg.teams_path.empty()) return InMemoryTeamResolver{};
    try {
        return parse_teams(read_text_file(cfg.teams_path));
    } catch (const ConfigError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw ConfigError(cfg.teams_path + ": " + e.what());
    }
}

int run(const Config& cfg) {
    const auto content = read_text_file(cfg.rules_path);
    const auto teams = load_teams(cfg);

    if (cfg.lint) {
        auto report = default_rule_linter().lint(parse_rule_declarations(content), teams);
        if (cfg.json) std::cout << to_json(report) << "\n";
        else          print_lint(report);
        return report.clean() ? kSatisfied : kUnsatisfied;
    }

    auto logins = cfg.approvers;
    if (!cfg.approvers_path.empty()) {
        for (auto& login : split_lines(read_text_file(cfg.approvers_path))) logins.push_back(login);
    }
    StaticApprovalSource approvals(std::move(logins));

    const auto changed = split_lines(read_text_file(cfg.changed_files_path));
    const auto rules   = parse_rules(content);

    MemoizingTeamResolver cached(teams);
    RuleEngine engine(cached);
    auto report = engine.evaluate(changed, rules, approvals.approvers());

    if (cfg.json) {
        std::cout << to_json(report) << "\n";
    } else {
        print_report(report);
        std::cout << "\n  " << rules.size() << " rule(s), " << changed.size() << " changed file(s), "
                  << report.matched_file_count() << " covered\n";
    }

    if (!report.overall_satisfied()) {
        if (!cfg.json) print_annotations(report);
        return kUnsatisfied;
    }
    return kSatisfied;
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "codeowners-check";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    try {
        auto cfg = load_config(args, process_env());
        if (cfg.help) {
            std::cout << usage(program);
            return kSatisfied;
        }
        return run(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(program);
        return kConfigError;
    } catch (const MalformedExpression& e) {
        std::cerr << "error: malformed rule " << e.what() << "\n";
        return kInternalError;
    } catch (const std::exception& e) {
        std::cerr << "internal error: " << e.what() << "\n";
        return kInternalError;
    }
}
