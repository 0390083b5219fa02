#include "codeowners/lexer.hpp"

#include <algorithm>
#include <regex>

namespace codeowners {

namespace {

// ECMAScript \w is [A-Za-z0-9_]: handles stop at the first non-ASCII byte,
// which is fine for GitHub logins and team slugs.
const std::regex& token_pattern() {
    static const std::regex re(R"(\(|\)|AND|OR|@[\w-]+(?:/[\w-]+)?)");
    return re;
}

LexResult failure(const std::string& expression, std::string reason) {
    return { {}, InvalidExpression{ expression, std::move(reason) } };
}

} // namespace

LexResult tokenize(const std::string& expression) {
    auto opens  = std::count(expression.begin(), expression.end(), '(');
    auto closes = std::count(expression.begin(), expression.end(), ')');
    if (opens != closes) {
        return failure(expression, "unbalanced parentheses");
    }

    LexResult result;
    auto begin = std::sregex_iterator(expression.begin(), expression.end(), token_pattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        Token token = make_token(it->str());
        if (token.is_operator() && !result.tokens.empty() && result.tokens.back().is_operator()) {
            return failure(expression, "consecutive operators '" + result.tokens.back().text +
                                       " " + token.text + "'");
        }
        result.tokens.push_back(std::move(token));
    }
    return result;
}

} // namespace codeowners
