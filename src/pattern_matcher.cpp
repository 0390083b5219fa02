#include "codeowners/pattern_matcher.hpp"

namespace codeowners {

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

// Matches "[...]" starting at glob[gi] against c. On return gi points past
// the closing ']'. A '[' without a closing ']' is matched literally.
bool match_class(const std::string& glob, std::size_t& gi, char c) {
    std::size_t i = gi + 1;
    bool negate = false;
    if (i < glob.size() && (glob[i] == '!' || glob[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < glob.size() && (glob[i] != ']' || first)) {
        char lo = glob[i];
        if (lo == '\\' && i + 1 < glob.size()) lo = glob[++i];
        char hi = lo;
        if (i + 2 < glob.size() && glob[i + 1] == '-' && glob[i + 2] != ']') {
            hi = glob[i + 2];
            i += 2;
        }
        if (lo <= c && c <= hi) matched = true;
        ++i;
        first = false;
    }

    if (i >= glob.size()) {
        // unterminated class: literal '['
        ++gi;
        return c == '[';
    }
    gi = i + 1;
    return matched != negate;
}

} // namespace

bool match_segment(const std::string& glob, const std::string& segment) {
    std::size_t gi = 0, si = 0;
    std::size_t star_gi = std::string::npos, star_si = 0;

    while (si < segment.size()) {
        if (gi < glob.size() && glob[gi] == '*') {
            while (gi < glob.size() && glob[gi] == '*') ++gi;
            star_gi = gi;
            star_si = si;
            continue;
        }

        bool step = false;
        if (gi < glob.size()) {
            std::size_t next = gi;
            switch (glob[gi]) {
                case '?':
                    step = true;
                    next = gi + 1;
                    break;
                case '[':
                    step = match_class(glob, next, segment[si]);
                    break;
                case '\\':
                    next = gi + 1 < glob.size() ? gi + 1 : gi;
                    step = glob[next] == segment[si];
                    ++next;
                    break;
                default:
                    step = glob[gi] == segment[si];
                    next = gi + 1;
                    break;
            }
            if (step) {
                gi = next;
                ++si;
                continue;
            }
        }

        if (star_gi == std::string::npos) return false;
        gi = star_gi;
        si = ++star_si;
    }

    while (gi < glob.size() && glob[gi] == '*') ++gi;
    return gi == glob.size();
}

// ── PathPattern ───────────────────────────────────────────────────────────────

PathPattern::PathPattern(const std::string& pattern) : text_(pattern) {
    std::string body = pattern;
    while (!body.empty() && body.back() == '/') {
        directory_only_ = true;
        body.pop_back();
    }
    if (!body.empty() && body.front() == '/') {
        anchored_ = true;
        body.erase(0, body.find_first_not_of('/'));
    }
    if (body.find('/') != std::string::npos) anchored_ = true;

    segments_ = split_path(body);
    if (!anchored_ && !segments_.empty()) segments_.insert(segments_.begin(), "**");
}

bool PathPattern::matches(const std::string& file_path) const {
    if (segments_.empty()) return false;
    const auto path = split_path(file_path);
    if (path.empty()) return false;
    return match_from(0, path, 0);
}

bool PathPattern::match_from(std::size_t pi, const std::vector<std::string>& path, std::size_t si) const {
    if (pi == segments_.size()) {
        // Whole path: the file itself. Shorter prefix: a directory it lives in.
        if (si == path.size()) return !directory_only_;
        return si > 0;
    }

    const auto& seg = segments_[pi];
    if (seg == "**") {
        const bool trailing = pi + 1 == segments_.size();
        for (std::size_t k = si + (trailing ? 1 : 0); k <= path.size(); ++k) {
            if (match_from(pi + 1, path, k)) return true;
        }
        return false;
    }

    if (si == path.size()) return false;
    return match_segment(seg, path[si]) && match_from(pi + 1, path, si + 1);
}

bool matches(const std::string& file_path, const std::string& pattern) {
    return PathPattern(pattern).matches(file_path);
}

} // namespace codeowners
