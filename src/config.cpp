#include "codeowners/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace codeowners {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

Config load_config(const std::vector<std::string>& args, const EnvLookup& env) {
    Config cfg;

    if (auto v = env("CODEOWNERS_FILE"))          cfg.rules_path = *v;
    if (auto v = env("CODEOWNERS_CHANGED_FILES")) cfg.changed_files_path = *v;
    if (auto v = env("CODEOWNERS_APPROVERS"))     cfg.approvers = split_list(*v);
    if (auto v = env("CODEOWNERS_TEAMS"))         cfg.teams_path = *v;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError("option " + arg + " requires a value");
            return args[++i];
        };

        if (arg == "--help" || arg == "-h")  cfg.help = true;
        else if (arg == "--json")            cfg.json = true;
        else if (arg == "--lint")            cfg.lint = true;
        else if (arg == "--rules")           cfg.rules_path = value();
        else if (arg == "--changed")         cfg.changed_files_path = value();
        else if (arg == "--approvers")       cfg.approvers = split_list(value());
        else if (arg == "--approvers-file")  cfg.approvers_path = value();
        else if (arg == "--teams")           cfg.teams_path = value();
        else throw ConfigError("unknown option: " + arg);
    }

    if (cfg.help) return cfg;
    if (cfg.rules_path.empty()) throw ConfigError("no rules file given (--rules or CODEOWNERS_FILE)");
    if (!cfg.lint && cfg.changed_files_path.empty()) {
        throw ConfigError("no changed files given (--changed or CODEOWNERS_CHANGED_FILES)");
    }
    return cfg;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "\n"
           "Checks pull request approvals against #@BOOL rules in a CODEOWNERS file.\n"
           "\n"
           "  --rules PATH           CODEOWNERS file (env CODEOWNERS_FILE, default .github/CODEOWNERS)\n"
           "  --changed PATH         changed files, one per line (env CODEOWNERS_CHANGED_FILES)\n"
           "  --approvers a,b        approving logins (env CODEOWNERS_APPROVERS)\n"
           "  --approvers-file PATH  approving logins, one per line\n"
           "  --teams PATH           team members, '<team>: login login' (env CODEOWNERS_TEAMS)\n"
           "  --json                 print the report as JSON\n"
           "  --lint                 check the rules file instead of evaluating approvals\n"
           "  --help                 show this help\n"
           "\n"
           "Exit status: 0 satisfied/clean, 1 unsatisfied/violations, 2 configuration error,\n"
           "3 internal error.\n";
}

std::string read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ConfigError("cannot open " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> out;
    std::istringstream in(content);
    for (std::string line; std::getline(in, line);) {
        auto t = trim(line);
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> out;
    std::istringstream in(list);
    for (std::string item; std::getline(in, item, ',');) {
        auto t = trim(item);
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

} // namespace codeowners
