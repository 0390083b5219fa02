#pragma once

#include "codeowners/rule_engine.hpp"
#include "codeowners/rule_linter.hpp"

#include <cstdio>
#include <sstream>
#include <string>

namespace codeowners {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline const char* boolean(bool b) {
    return b ? "true" : "false";
}

inline std::string outcome_str(MatchOutcome o) {
    switch (o) {
        case MatchOutcome::Satisfied:              return "satisfied";
        case MatchOutcome::Unsatisfied:            return "unsatisfied";
        case MatchOutcome::MalformedAutoSatisfied: return "malformed_auto_satisfied";
        default:                                   return "unknown";
    }
}

inline std::string severity_str(Severity s) {
    return s == Severity::Warning ? "warning" : "error";
}

} // namespace json_detail

inline std::string to_json(const MatchResult& r) {
    std::ostringstream os;
    os << "{ \"path\": "      << json_detail::quoted(r.path_pattern)
       << ", \"rule\": "      << json_detail::quoted(r.expression)
       << ", \"satisfied\": " << json_detail::boolean(r.satisfied)
       << ", \"outcome\": "   << json_detail::quoted(json_detail::outcome_str(r.outcome))
       << " }";
    return os.str();
}

inline std::string to_json(const Diagnostic& d) {
    std::ostringstream os;
    os << "{ \"severity\": " << json_detail::quoted(json_detail::severity_str(d.severity))
       << ", \"subject\": "  << json_detail::quoted(d.subject)
       << ", \"message\": "  << json_detail::quoted(d.message)
       << " }";
    return os.str();
}

inline std::string to_json(const EvaluationReport& report) {
    std::ostringstream os;
    os << "{\n"
       << "  \"overall_satisfied\": " << json_detail::boolean(report.overall_satisfied()) << ",\n"
       << "  \"files\": [";
    for (std::size_t i = 0; i < report.files.size(); ++i) {
        const auto& f = report.files[i];
        os << "\n    {\n"
           << "      \"file\": "      << json_detail::quoted(f.file) << ",\n"
           << "      \"satisfied\": " << json_detail::boolean(f.satisfied()) << ",\n"
           << "      \"results\": [";
        for (std::size_t j = 0; j < f.results.size(); ++j) {
            os << "\n        " << to_json(f.results[j]);
            if (j + 1 < f.results.size()) os << ",";
        }
        os << "\n      ]\n    }";
        if (i + 1 < report.files.size()) os << ",";
    }
    os << "\n  ],\n"
       << "  \"diagnostics\": [";
    for (std::size_t i = 0; i < report.diagnostics.size(); ++i) {
        os << "\n    " << to_json(report.diagnostics[i]);
        if (i + 1 < report.diagnostics.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

inline std::string to_json(const LintReport& report) {
    std::ostringstream os;
    os << "{\n"
       << "  \"rule_count\": " << report.rule_count << ",\n"
       << "  \"clean\": "      << json_detail::boolean(report.clean()) << ",\n"
       << "  \"violations\": [";
    for (std::size_t i = 0; i < report.violations.size(); ++i) {
        const auto& v = report.violations[i];
        os << "\n    { \"check\": " << json_detail::quoted(v.check_name)
           << ", \"path\": "        << json_detail::quoted(v.path_pattern)
           << ", \"message\": "     << json_detail::quoted(v.message)
           << " }";
        if (i + 1 < report.violations.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

} // namespace codeowners
