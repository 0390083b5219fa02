#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codeowners {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Returns the value of an environment variable, or std::nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// EnvLookup over the process environment.
EnvLookup process_env();

struct Config {
    std::string              rules_path = ".github/CODEOWNERS";
    std::string              changed_files_path;
    std::vector<std::string> approvers;
    std::string              approvers_path;
    std::string              teams_path;
    bool                     json = false;
    bool                     lint = false;
    bool                     help = false;
};

/**
 * Builds the CLI configuration.
 *
 *   --rules PATH            CODEOWNERS_FILE           (default .github/CODEOWNERS)
 *   --changed PATH          CODEOWNERS_CHANGED_FILES  one path per line
 *   --approvers a,b         CODEOWNERS_APPROVERS      comma separated
 *   --approvers-file PATH                             one login per line
 *   --teams PATH            CODEOWNERS_TEAMS          "<team>: login login"
 *   --json, --lint, --help
 *
 * Options win over environment variables. Throws ConfigError on unknown
 * options, a missing option value, or a missing required input.
 */
Config load_config(const std::vector<std::string>& args, const EnvLookup& env);

/// Usage text for --help.
std::string usage(const std::string& program);

/// Whole file as a string; throws ConfigError if it cannot be read.
std::string read_text_file(const std::string& path);

/// Non-empty, trimmed lines of `content`.
std::vector<std::string> split_lines(const std::string& content);

/// Non-empty, trimmed items of a comma-separated list.
std::vector<std::string> split_list(const std::string& list);

} // namespace codeowners
