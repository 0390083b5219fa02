#pragma once

#include <string>
#include <vector>

namespace codeowners {

// PathPattern
//
// A CODEOWNERS path pattern with gitignore semantics, matched against
// repository-relative file paths ('/' separated, case-sensitive).
//
//   /docs        anchored at the repository root
//   docs/        directory only: every path below docs/, never a file "docs"
//   docs         no inner slash: a file or directory named docs at any depth
//   src/docs     inner slash: anchored at the root, like /src/docs
//   *  ?  [a-z]  wildcards within one path segment
//   **           zero or more whole segments ("a/**" needs at least one)
//
// A pattern that matches a directory also matches everything beneath it.
class PathPattern {
public:
    explicit PathPattern(const std::string& pattern);

    bool matches(const std::string& file_path) const;

    const std::string& text() const { return text_; }
    bool anchored() const { return anchored_; }
    bool directory_only() const { return directory_only_; }

private:
    bool match_from(std::size_t pi, const std::vector<std::string>& path, std::size_t si) const;

    std::string              text_;
    std::vector<std::string> segments_;
    bool                     anchored_       = false;
    bool                     directory_only_ = false;
};

/// One-shot form of PathPattern(pattern).matches(file_path).
bool matches(const std::string& file_path, const std::string& pattern);

/// Glob match of a single path segment: '*', '?', '[...]' and '\' escapes.
bool match_segment(const std::string& glob, const std::string& segment);

} // namespace codeowners
