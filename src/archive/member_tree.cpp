#include "archive/member_tree.hpp"

#include <unordered_set>

namespace kmp::archive {

namespace {

/// Remainder of `path` below `dir`, or nullopt if `path` is not under it.
std::optional<std::string_view> strip_dir(std::string_view path,
                                          std::string_view dir) {
    if (dir.empty()) return path;
    if (path.size() <= dir.size() || path.compare(0, dir.size(), dir) != 0 ||
        path[dir.size()] != '/') {
        return std::nullopt;
    }
    return path.substr(dir.size() + 1);
}

std::string join(std::string_view dir, std::string_view name) {
    if (dir.empty()) return std::string(name);
    std::string result(dir);
    result += '/';
    result += name;
    return result;
}

/// Match one '[...]' class starting at pattern[pi]. Sets `next` past the
/// closing ']'. Returns nullopt when the bracket is not closed.
std::optional<bool> match_class(std::string_view pattern, size_t pi, char c,
                                size_t& next) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        i++;
    }

    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' &&
            pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (lo <= c && c <= hi) matched = true;
            i += 3;
        } else {
            if (lo == c) matched = true;
            i++;
        }
    }
    if (i >= pattern.size()) return std::nullopt;

    next = i + 1;
    return matched != negate;
}

} // namespace

std::string normalize_member_path(std::string_view path) {
    std::vector<std::string_view> parts;

    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string_view::npos) slash = path.size();

        auto part = path.substr(start, slash - start);
        if (part.empty() || part == ".") {
            // skip
        } else if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else {
            parts.push_back(part);
        }
        start = slash + 1;
    }

    std::string result;
    for (auto part : parts) {
        if (!result.empty()) result += '/';
        result += part;
    }
    return result;
}

bool wildcard_match(std::string_view pattern, std::string_view name) {
    size_t pi = 0;
    size_t ni = 0;
    // Backtrack point for the most recent '*'
    size_t star_pi = std::string_view::npos;
    size_t star_ni = 0;

    while (ni < name.size()) {
        if (pi < pattern.size()) {
            char p = pattern[pi];
            if (p == '*') {
                star_pi = pi++;
                star_ni = ni;
                continue;
            }
            if (p == '?') {
                pi++;
                ni++;
                continue;
            }
            if (p == '[') {
                size_t next = 0;
                auto cls = match_class(pattern, pi, name[ni], next);
                if (cls && *cls) {
                    pi = next;
                    ni++;
                    continue;
                }
                if (!cls && name[ni] == '[') {
                    // Unclosed bracket matches itself
                    pi++;
                    ni++;
                    continue;
                }
            } else if (p == name[ni]) {
                pi++;
                ni++;
                continue;
            }
        }
        if (star_pi == std::string_view::npos) return false;
        pi = star_pi + 1;
        ni = ++star_ni;
    }

    while (pi < pattern.size() && pattern[pi] == '*') pi++;
    return pi == pattern.size();
}

MemberTree::MemberTree(std::vector<MemberInfo> members)
    : members_(std::move(members)) {}

MemberTree::Entry MemberTree::lookup(std::string_view path) const {
    if (path.empty()) return {EntryType::Directory, nullptr};

    // Later entries with the same name replace earlier ones, as when a tar
    // archive is appended to.
    const MemberInfo* found = nullptr;
    bool implied_dir = false;
    for (const auto& member : members_) {
        if (member.name == path) {
            found = &member;
        } else if (strip_dir(member.name, path)) {
            implied_dir = true;
        }
    }

    if (found) {
        switch (found->type) {
        case MemberType::File: return {EntryType::File, found};
        case MemberType::Directory: return {EntryType::Directory, found};
        case MemberType::Other: return {EntryType::Other, found};
        }
    }
    if (implied_dir) return {EntryType::Directory, nullptr};
    return {};
}

std::vector<std::string> MemberTree::children(std::string_view dir) const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;

    for (const auto& member : members_) {
        auto rest = strip_dir(member.name, dir);
        if (!rest || rest->empty()) continue;

        auto child = join(dir, rest->substr(0, rest->find('/')));
        if (seen.insert(child).second) {
            result.push_back(std::move(child));
        }
    }
    return result;
}

std::vector<std::string> MemberTree::descendants(std::string_view dir) const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;

    for (const auto& member : members_) {
        auto rest = strip_dir(member.name, dir);
        if (!rest || rest->empty()) continue;

        // Every intermediate directory, then the member itself
        size_t pos = 0;
        while (true) {
            auto slash = rest->find('/', pos);
            auto path = join(dir, rest->substr(0, slash));
            if (seen.insert(path).second) {
                result.push_back(std::move(path));
            }
            if (slash == std::string_view::npos) break;
            pos = slash + 1;
        }
    }
    return result;
}

const MemberInfo* MemberTree::sole_top_level_file() const {
    auto top = children("");
    if (top.size() != 1) return nullptr;

    auto entry = lookup(top.front());
    return entry.type == EntryType::File ? entry.member : nullptr;
}

} // namespace kmp::archive
