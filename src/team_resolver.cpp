#include "codeowners/team_resolver.hpp"

#include <sstream>
#include <stdexcept>

namespace codeowners {

// ── InMemoryTeamResolver ──────────────────────────────────────────────────────

void InMemoryTeamResolver::add_team(std::string slug, Members members) {
    teams_[std::move(slug)] = std::move(members);
}

std::optional<Members> InMemoryTeamResolver::resolve(const std::string& team_slug) const {
    auto it = teams_.find(team_slug);
    if (it == teams_.end()) return std::nullopt;
    return it->second;
}

// ── MemoizingTeamResolver ─────────────────────────────────────────────────────

std::optional<Members> MemoizingTeamResolver::resolve(const std::string& team_slug) const {
    auto it = cache_.find(team_slug);
    if (it != cache_.end()) return it->second;

    ++lookups_;
    auto members = inner_.resolve(team_slug);
    cache_.emplace(team_slug, members);
    return members;
}

// ── Teams file ────────────────────────────────────────────────────────────────

InMemoryTeamResolver parse_teams(const std::string& content) {
    InMemoryTeamResolver resolver;
    std::istringstream lines(content);
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(lines, line)) {
        ++line_no;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw std::runtime_error("teams file line " + std::to_string(line_no) +
                                     ": expected '<team>: <members>'");
        }

        std::istringstream slug_in(line.substr(0, colon));
        std::string slug;
        slug_in >> slug;
        if (!slug.empty() && slug.front() == '@') slug.erase(0, 1);
        if (slug.find('/') != std::string::npos) slug = slug.substr(slug.rfind('/') + 1);
        if (slug.empty()) {
            throw std::runtime_error("teams file line " + std::to_string(line_no) +
                                     ": missing team name");
        }

        std::string rest = line.substr(colon + 1);
        for (char& c : rest) if (c == ',') c = ' ';
        std::istringstream members_in(rest);
        Members members;
        for (std::string login; members_in >> login;) members.push_back(login);

        resolver.add_team(slug, std::move(members));
    }
    return resolver;
}

} // namespace codeowners
