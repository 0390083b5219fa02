#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codeowners {

using Members = std::vector<std::string>;

/**
 * TeamResolver
 *
 * Looks up the member logins of a team by slug ("platform" for
 * "@org/platform"). Returns std::nullopt when the team does not exist.
 * Implementations backed by a remote API translate transport failures into
 * std::nullopt or throw; the rule engine lets exceptions propagate.
 */
class TeamResolver {
public:
    virtual ~TeamResolver() = default;

    virtual std::optional<Members> resolve(const std::string& team_slug) const = 0;
};

/// Fixed slug -> members table.
class InMemoryTeamResolver : public TeamResolver {
public:
    void add_team(std::string slug, Members members);

    std::optional<Members> resolve(const std::string& team_slug) const override;

    std::size_t team_count() const { return teams_.size(); }

private:
    std::map<std::string, Members> teams_;
};

/**
 * MemoizingTeamResolver
 *
 * Caches every answer of the wrapped resolver, including "not found", so a
 * team referenced by several rules is fetched once per instance. Not
 * thread-safe. The wrapped resolver must outlive this object.
 */
class MemoizingTeamResolver : public TeamResolver {
public:
    explicit MemoizingTeamResolver(const TeamResolver& inner) : inner_(inner) {}
    explicit MemoizingTeamResolver(const TeamResolver&&) = delete;

    std::optional<Members> resolve(const std::string& team_slug) const override;

    /// Number of calls forwarded to the wrapped resolver.
    std::size_t lookups() const { return lookups_; }

private:
    const TeamResolver& inner_;
    mutable std::map<std::string, std::optional<Members>> cache_;
    mutable std::size_t lookups_ = 0;
};

/**
 * Parses a teams file: one "<slug>: login login ..." entry per line.
 * Blank lines and lines starting with '#' are skipped; members may be
 * separated by spaces or commas. Throws std::runtime_error on a line with
 * no ':' separator.
 */
InMemoryTeamResolver parse_teams(const std::string& content);

} // namespace codeowners
