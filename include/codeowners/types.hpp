#pragma once

#include <initializer_list>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace codeowners {

enum class TokenKind { Operand, And, Or, LParen, RParen };

struct Token {
    TokenKind   kind;
    std::string text;           // "@user", "@org/team", "AND", "OR", "(", ")"

    bool is_operator() const { return kind == TokenKind::And || kind == TokenKind::Or; }
    bool is_team() const {
        return kind == TokenKind::Operand && text.find('/') != std::string::npos;
    }
    /// Slug after the last '/', e.g. "@org/platform" -> "platform".
    std::string team_slug() const { return text.substr(text.rfind('/') + 1); }

    bool operator==(const Token& other) const {
        return kind == other.kind && text == other.text;
    }
    bool operator!=(const Token& other) const { return !(*this == other); }
};

/// Builds a Token from its literal text.
Token make_token(const std::string& text);

/// One "#@BOOL <pattern> <expression>" declaration.
struct Rule {
    std::string path_pattern;
    std::string expression;
};

enum class MatchOutcome { Satisfied, Unsatisfied, MalformedAutoSatisfied };

struct MatchResult {
    std::string  path_pattern;
    std::string  expression;
    bool         satisfied;
    MatchOutcome outcome;
};

enum class Severity { Warning, Error };

struct Diagnostic {
    Severity    severity;
    std::string subject;        // rule text or team slug the message is about
    std::string message;
};

/**
 * ApproverSet
 *
 * Logins credited with approving the change. A leading '@' is stripped on
 * insertion and on lookup, so "@alice" and "alice" name the same approver.
 * Comparison is case-sensitive.
 */
class ApproverSet {
public:
    ApproverSet() = default;
    ApproverSet(std::initializer_list<std::string> logins);

    void add(const std::string& login);
    bool contains(const std::string& login) const;

    std::size_t size() const { return logins_.size(); }
    bool empty() const { return logins_.empty(); }

    std::set<std::string>::const_iterator begin() const { return logins_.begin(); }
    std::set<std::string>::const_iterator end() const { return logins_.end(); }

private:
    std::set<std::string> logins_;
};

inline std::ostream& operator<<(std::ostream& os, TokenKind k) {
    switch (k) {
        case TokenKind::Operand: return os << "Operand";
        case TokenKind::And:     return os << "AND";
        case TokenKind::Or:      return os << "OR";
        case TokenKind::LParen:  return os << "(";
        case TokenKind::RParen:  return os << ")";
        default:                 return os << "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, const Token& t) {
    return os << t.text;
}

inline std::ostream& operator<<(std::ostream& os, const std::vector<Token>& tokens) {
    os << "[";
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i) os << " ";
        os << tokens[i].text;
    }
    return os << "]";
}

inline std::ostream& operator<<(std::ostream& os, MatchOutcome o) {
    switch (o) {
        case MatchOutcome::Satisfied:              return os << "Satisfied";
        case MatchOutcome::Unsatisfied:            return os << "Unsatisfied";
        case MatchOutcome::MalformedAutoSatisfied: return os << "MalformedAutoSatisfied";
        default:                                   return os << "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Severity s) {
    return os << (s == Severity::Warning ? "warning" : "error");
}

} // namespace codeowners
