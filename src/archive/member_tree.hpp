#pragma once

#include "archive/archive_reader.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kmp::archive {

/// Normalize a member path: '/' separators, no leading "./" or '/', no
/// trailing '/', "//" and "/./" collapsed, ".." resolved. "." becomes "".
std::string normalize_member_path(std::string_view path);

/// Shell-style match of a single name against `*`, `?` and `[...]`.
bool wildcard_match(std::string_view pattern, std::string_view name);

/// Directory view over an archive's member table. Directories that only
/// appear as a prefix of deeper members ("a" for "a/b.txt") exist too.
/// Every listing keeps the stored member order.
class MemberTree {
public:
    enum class EntryType { Missing, File, Directory, Other };

    struct Entry {
        EntryType type = EntryType::Missing;
        const MemberInfo* member = nullptr; // null for implied dirs and root
    };

    explicit MemberTree(std::vector<MemberInfo> members);

    /// Look up a normalized path. "" is the archive root (a directory).
    Entry lookup(std::string_view path) const;

    /// Paths of the direct children of `dir`.
    std::vector<std::string> children(std::string_view dir) const;

    /// Paths of every file and directory below `dir`, implied ones included.
    std::vector<std::string> descendants(std::string_view dir) const;

    /// The single top-level member, if the archive holds exactly one entry
    /// at the top level and it is a regular file.
    const MemberInfo* sole_top_level_file() const;

    const std::vector<MemberInfo>& members() const { return members_; }

private:
    std::vector<MemberInfo> members_;
};

} // namespace kmp::archive
