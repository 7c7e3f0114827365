#include <strata/glob.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace strata {

static std::vector<std::string> split_segments(const std::string& raw) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : raw) {
        if (c == '\\') c = '/';
        if (c == '/') {
            if (!cur.empty()) segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) segs.push_back(cur);
    // "./x" and "x" are the same path
    segs.erase(std::remove(segs.begin(), segs.end(), "."), segs.end());
    return segs;
}

// Parse a [...] class at pat[pi] (pointing at '['). On success advances pi
// past the closing bracket and reports whether c is a member.
static bool match_class(const std::string& pat, size_t& pi, char c, bool& member) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pat.size() && pat[i] == '!') {
        negate = true;
        ++i;
    }
    bool found = false;
    size_t first = i;
    while (i < pat.size() && (pat[i] != ']' || i == first)) {
        char lo = pat[i];
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            if (c >= lo && c <= pat[i + 2]) found = true;
            i += 3;
        } else {
            if (c == lo) found = true;
            ++i;
        }
    }
    if (i >= pat.size()) return false;  // unterminated, treat '[' literally
    pi = i + 1;
    member = negate ? !found : found;
    return true;
}

// Single segment match with backtracking on the last '*'
static bool match_segment(const std::string& pat, const std::string& str) {
    size_t pi = 0, si = 0;
    size_t star_p = std::string::npos, star_s = 0;

    while (si < str.size()) {
        if (pi < pat.size() && pat[pi] == '*') {
            star_p = ++pi;
            star_s = si;
            continue;
        }
        if (pi < pat.size()) {
            char pc = pat[pi];
            if (pc == '?') {
                ++pi; ++si;
                continue;
            }
            if (pc == '[') {
                size_t next = pi;
                bool member = false;
                if (match_class(pat, next, str[si], member)) {
                    if (member) {
                        pi = next; ++si;
                        continue;
                    }
                } else if (str[si] == '[') {
                    ++pi; ++si;
                    continue;
                }
            } else if (pc == str[si]) {
                ++pi; ++si;
                continue;
            }
        }
        if (star_p == std::string::npos) return false;
        pi = star_p;
        si = ++star_s;
    }
    while (pi < pat.size() && pat[pi] == '*') ++pi;
    return pi == pat.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size() || !match_segment(pat[pi], path[si])) return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_segments(pattern), 0, split_segments(path), 0);
}

bool glob_has_magic(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const fs::path& root_dir)
{
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return StrataError(StrataError::IO,
            "glob_expand: root directory does not exist: " + root_dir.string());
    }

    std::vector<std::string> results;
    if (!glob_has_magic(pattern)) {
        auto segs = split_segments(pattern);
        fs::path p = root_dir;
        std::string rel;
        for (const auto& s : segs) {
            p /= s;
            rel += (rel.empty() ? "" : "/") + s;
        }
        if (!rel.empty() && fs::exists(fs::symlink_status(p, ec))) {
            results.push_back(rel);
        }
        return Result<std::vector<std::string>>::ok(std::move(results));
    }

    auto it = fs::recursive_directory_iterator(root_dir, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        auto rel = it->path().lexically_relative(root_dir).generic_string();
        if (glob_match(pattern, rel)) {
            results.push_back(rel);
        }
    }
    if (ec) {
        return StrataError(StrataError::IO,
            "glob_expand: error iterating directory: " + ec.message());
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace strata
