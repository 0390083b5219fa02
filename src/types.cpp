#include "codeowners/types.hpp"

namespace codeowners {

namespace {

std::string strip_handle(const std::string& login) {
    if (!login.empty() && login.front() == '@') return login.substr(1);
    return login;
}

} // namespace

Token make_token(const std::string& text) {
    if (text == "AND") return { TokenKind::And, text };
    if (text == "OR")  return { TokenKind::Or, text };
    if (text == "(")   return { TokenKind::LParen, text };
    if (text == ")")   return { TokenKind::RParen, text };
    return { TokenKind::Operand, text };
}

// ── ApproverSet ───────────────────────────────────────────────────────────────

ApproverSet::ApproverSet(std::initializer_list<std::string> logins) {
    for (const auto& login : logins) add(login);
}

void ApproverSet::add(const std::string& login) {
    auto name = strip_handle(login);
    if (!name.empty()) logins_.insert(std::move(name));
}

bool ApproverSet::contains(const std::string& login) const {
    return logins_.count(strip_handle(login)) > 0;
}

} // namespace codeowners
