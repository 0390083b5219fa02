#include "codeowners/expression_evaluator.hpp"
#include "codeowners/expression_parser.hpp"
#include "codeowners/lexer.hpp"

#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace codeowners;

static int passed = 0;
static int failed = 0;

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

// ── Helpers ──────────────────────────────────────────────────────────────────

static std::vector<Token> toks(std::initializer_list<std::string> texts) {
    std::vector<Token> out;
    for (const auto& t : texts) out.push_back(make_token(t));
    return out;
}

// Counts lookups so tests can see every operand being resolved.
class CountingTeams : public TeamResolver {
public:
    CountingTeams() {
        teams_.add_team("team1", { "user1", "user2" });
        teams_.add_team("team2", { "user3", "user4" });
        teams_.add_team("team3", { "user5", "user6" });
    }

    std::optional<Members> resolve(const std::string& slug) const override {
        ++calls[slug];
        return teams_.resolve(slug);
    }

    mutable std::map<std::string, int> calls;

private:
    InMemoryTeamResolver teams_;
};

static bool eval_text(const std::string& expr, const ApproverSet& approvers,
                      const TeamResolver& teams) {
    return evaluate_postfix(to_postfix(tokenize(expr).tokens), approvers, teams);
}

// Recursive-descent reference: or := and ("OR" and)*, and := atom ("AND" atom)*.
class ReferenceEvaluator {
public:
    ReferenceEvaluator(const std::vector<Token>& tokens, const ApproverSet& approvers)
        : tokens_(tokens), approvers_(approvers) {}

    bool run() { return parse_or(); }

private:
    bool parse_or() {
        bool v = parse_and();
        while (pos_ < tokens_.size() && tokens_[pos_].kind == TokenKind::Or) {
            ++pos_;
            bool rhs = parse_and();
            v = v || rhs;
        }
        return v;
    }
    bool parse_and() {
        bool v = parse_atom();
        while (pos_ < tokens_.size() && tokens_[pos_].kind == TokenKind::And) {
            ++pos_;
            bool rhs = parse_atom();
            v = v && rhs;
        }
        return v;
    }
    bool parse_atom() {
        const auto& t = tokens_[pos_++];
        if (t.kind == TokenKind::LParen) {
            bool v = parse_or();
            ++pos_; // ')'
            return v;
        }
        return approvers_.contains(t.text);
    }

    const std::vector<Token>& tokens_;
    const ApproverSet&        approvers_;
    std::size_t               pos_ = 0;
};

// ── Parser suites ─────────────────────────────────────────────────────────────

void test_operator_table() {
    std::cout << "\n[OperatorTable]\n";
    ASSERT_EQ("OR precedence",  1, precedence("OR"));
    ASSERT_EQ("AND precedence", 2, precedence("AND"));
    ASSERT_EQ("unknown precedence", -1, precedence("XOR"));
    ASSERT_TRUE("AND left-associative", associativity("AND") == Associativity::Left);
    ASSERT_TRUE("OR left-associative",  associativity("OR") == Associativity::Left);
    ASSERT_TRUE("unknown defaults to left", associativity("XOR") == Associativity::Left);
}

void test_to_postfix() {
    std::cout << "\n[ToPostfix]\n";
    ASSERT_EQ("grouped OR under AND",
              toks({ "user@team", "admin@team", "mod@team", "OR", "AND" }),
              to_postfix(toks({ "user@team", "AND", "(", "admin@team", "OR", "mod@team", ")" })));
    ASSERT_EQ("simple AND",
              toks({ "user@example.com", "admin@example.com", "AND" }),
              to_postfix(toks({ "user@example.com", "AND", "admin@example.com" })));
    ASSERT_EQ("AND binds tighter than OR",
              toks({ "a@b.com", "c@d.com", "e@f.com", "AND", "OR" }),
              to_postfix(toks({ "a@b.com", "OR", "c@d.com", "AND", "e@f.com" })));
    ASSERT_EQ("parenthesised AND then OR",
              toks({ "x@y.com", "p@q.com", "AND", "m@n.com", "OR" }),
              to_postfix(toks({ "(", "x@y.com", "AND", "p@q.com", ")", "OR", "m@n.com" })));
    ASSERT_EQ("left associativity",
              toks({ "@a", "@b", "OR", "@c", "OR" }),
              to_postfix(toks({ "@a", "OR", "@b", "OR", "@c" })));
    ASSERT_EQ("AND before lower OR on stack",
              toks({ "@a", "@b", "AND", "@c", "OR" }),
              to_postfix(toks({ "@a", "AND", "@b", "OR", "@c" })));
    ASSERT_EQ("empty input", static_cast<std::size_t>(0), to_postfix({}).size());

    auto out = to_postfix(toks({ "(", "(", "@a", ")", ")" }));
    ASSERT_EQ("parentheses removed", toks({ "@a" }), out);
}

void test_mismatched_parentheses() {
    std::cout << "\n[MismatchedParentheses]\n";
    bool threw = false;
    try {
        to_postfix(toks({ "(", "@a", "AND", "@b" }));
    } catch (const MismatchedParentheses&) {
        threw = true;
    }
    ASSERT_TRUE("unclosed '(' throws", threw);

    threw = false;
    try {
        to_postfix(toks({ ")", "@a", "(" }));
    } catch (const MismatchedParentheses&) {
        threw = true;
    }
    ASSERT_TRUE("')' before '(' throws", threw);
}

// ── Evaluator suites ──────────────────────────────────────────────────────────

void test_individuals() {
    std::cout << "\n[Individuals]\n";
    InMemoryTeamResolver none;
    ApproverSet approvers{ "alice", "bob" };

    ASSERT_TRUE("approved individual",        eval_text("@alice", approvers, none));
    ASSERT_TRUE("missing individual",         !eval_text("@carol", approvers, none));
    ASSERT_TRUE("both approved",              eval_text("@alice AND @bob", approvers, none));
    ASSERT_TRUE("one of two for AND",         !eval_text("@alice AND @carol", approvers, none));
    ASSERT_TRUE("one of two for OR",          eval_text("@carol OR @bob", approvers, none));
    ASSERT_TRUE("case-sensitive logins",      !eval_text("@Alice", approvers, none));

    ApproverSet handles{ "@alice" };
    ASSERT_TRUE("approver given as handle",   eval_text("@alice", handles, none));
}

void test_teams() {
    std::cout << "\n[Teams]\n";
    CountingTeams teams;
    ApproverSet approvers{ "user1", "user3", "user5" };

    ASSERT_TRUE("single team", evaluate_postfix(toks({ "@org/team1" }), approvers, teams));
    ASSERT_TRUE("team AND team",
                evaluate_postfix(toks({ "@org/team1", "@org/team2", "AND" }), approvers, teams));
    ASSERT_TRUE("team OR team",
                evaluate_postfix(toks({ "@org/team1", "@org/team3", "OR" }), approvers, teams));
    ASSERT_TRUE("(team1 OR team2) AND team3",
                evaluate_postfix(toks({ "@org/team1", "@org/team2", "OR", "@org/team3", "AND" }),
                                 approvers, teams));

    ApproverSet no_match{ "user7", "user8" };
    ASSERT_TRUE("team without approving member",
                !evaluate_postfix(toks({ "@org/team1" }), no_match, teams));

    ApproverSet partial{ "user1", "user7" };
    ASSERT_TRUE("only one team represented",
                !evaluate_postfix(toks({ "@org/team1", "@org/team2", "AND" }), partial, teams));

    ASSERT_TRUE("lookup uses slug after '/'", teams.calls["team1"] > 0);
    ASSERT_EQ("org prefix not passed to resolver", static_cast<std::size_t>(0),
              teams.calls.count("org/team1"));
}

void test_unknown_team() {
    std::cout << "\n[UnknownTeam]\n";
    CountingTeams teams;
    ApproverSet approvers{ "user1" };
    std::vector<Diagnostic> diags;

    bool v = evaluate_postfix(toks({ "@org/ghosts" }), approvers, teams, &diags);
    ASSERT_TRUE("unknown team is false", !v);
    ASSERT_EQ("one diagnostic", static_cast<std::size_t>(1), diags.size());
    ASSERT_TRUE("diagnostic is a warning", diags[0].severity == Severity::Warning);
    ASSERT_EQ("diagnostic subject", std::string("ghosts"), diags[0].subject);
    ASSERT_TRUE("message mentions empty group",
                diags[0].message.find("empty group") != std::string::npos);

    ASSERT_TRUE("unknown team OR known team",
                evaluate_postfix(toks({ "@org/ghosts", "@org/team1", "OR" }), approvers, teams));
    ASSERT_TRUE("null diagnostics sink accepted",
                !evaluate_postfix(toks({ "@org/ghosts" }), approvers, teams, nullptr));
}

void test_no_short_circuit() {
    std::cout << "\n[NoShortCircuit]\n";
    CountingTeams teams;
    ApproverSet approvers{ "user1" };

    bool v = evaluate_postfix(toks({ "@org/team1", "@org/team2", "OR" }), approvers, teams);
    ASSERT_TRUE("OR result true", v);
    ASSERT_EQ("right operand of OR still resolved", 1, teams.calls["team2"]);

    evaluate_postfix(toks({ "@org/team3", "@org/team1", "AND" }), approvers, teams);
    ASSERT_EQ("right operand of false AND still resolved", 2, teams.calls["team1"]);

    evaluate_postfix(toks({ "@org/team1", "@org/team1", "AND" }), approvers, teams);
    ASSERT_EQ("repeated team resolved each time", 4, teams.calls["team1"]);
}

void test_malformed_postfix() {
    std::cout << "\n[MalformedPostfix]\n";
    InMemoryTeamResolver none;
    ApproverSet approvers{ "a" };

    auto throws = [&](std::vector<Token> postfix) {
        try {
            evaluate_postfix(postfix, approvers, none);
        } catch (const MalformedExpression&) {
            return true;
        }
        return false;
    };

    ASSERT_TRUE("operator underflow throws",   throws(toks({ "@a", "AND" })));
    ASSERT_TRUE("leftover operands throw",     throws(toks({ "@a", "@b" })));
    ASSERT_TRUE("empty sequence throws",       throws({}));
    ASSERT_TRUE("parenthesis in postfix throws", throws(toks({ "(", "@a" })));
}

void test_precedence_matches_reference() {
    std::cout << "\n[PrecedenceMatchesReference]\n";
    InMemoryTeamResolver none;
    const std::vector<std::string> expressions = {
        "@a OR @b AND @c",
        "@a AND @b OR @c",
        "(@a OR @b) AND @c",
        "@a AND (@b OR @c)",
        "@a OR @b OR @c AND @d",
        "(@a AND @b) OR (@c AND @d)",
        "@a AND @b AND @c OR @d",
        "((@a OR @b) AND (@c OR @d)) OR @a AND @d",
    };
    const std::vector<std::string> names = { "a", "b", "c", "d" };

    int mismatches = 0;
    for (const auto& expr : expressions) {
        auto tokens = tokenize(expr).tokens;
        for (unsigned mask = 0; mask < 16; ++mask) {
            ApproverSet approvers;
            for (unsigned bit = 0; bit < 4; ++bit)
                if (mask & (1u << bit)) approvers.add(names[bit]);

            bool expected = ReferenceEvaluator(tokens, approvers).run();
            bool actual   = evaluate_postfix(to_postfix(tokens), approvers, none);
            if (expected != actual) {
                std::cout << "    mismatch: " << expr << " mask=" << mask << "\n";
                ++mismatches;
            }
        }
    }
    ASSERT_EQ("postfix evaluation agrees with recursive reference", 0, mismatches);

    ApproverSet approvers{ "a", "c" };
    bool first  = eval_text("(@a OR @b) AND @c", approvers, none);
    bool second = eval_text("(@a OR @b) AND @c", approvers, none);
    ASSERT_EQ("repeated evaluation is stable", first, second);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Expression Tests ===\n";

    test_operator_table();
    test_to_postfix();
    test_mismatched_parentheses();
    test_individuals();
    test_teams();
    test_unknown_team();
    test_no_short_circuit();
    test_malformed_postfix();
    test_precedence_matches_reference();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
