#pragma once

#include "codec/codec_kind.hpp"
#include "io/byte_stream.hpp"
#include "io/text_stream.hpp"
#include "vfs/path_backend.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace kmp::vfs {

struct WalkEntry;
using WalkVisitor = std::function<void(WalkEntry&)>;

/// Path that reads through compression and archives transparently.
///
/// A CPath is either a filesystem path or a compound reference: an archive
/// plus a member path inside it. Construction only classifies the file name;
/// the filesystem is touched when an operation runs, and each operation
/// builds a fresh backend for the classified codec.
///
///     CPath log("events.jsonl.zst");
///     auto text = log.read_text();
///
///     CPath export_dir("export.tar.gz");
///     for (auto& child : export_dir.iterate_directory().value()) { ... }
///     auto index = (export_dir / "messages" / "index.csv").read_text();
class CPath {
public:
    CPath() = default;
    CPath(fs::path path);
    CPath(const char* path) : CPath(fs::path(path)) {}
    CPath(const std::string& path) : CPath(fs::path(path)) {}

    /// Compound reference to `member` inside `archive_path`.
    CPath(fs::path archive_path, std::string_view member);

    // ----- path syntax, no I/O -----

    /// The filesystem path: the archive itself for compound references.
    const fs::path& fs_path() const { return path_; }
    /// Member path inside the archive, "" for the archive root and for
    /// non-archive paths.
    const std::string& member_path() const { return member_; }
    bool is_member() const { return !member_.empty(); }
    codec::CodecKind codec() const { return kind_; }

    /// "archive.zip/dir/file.txt" for compound references.
    std::string string() const;
    std::string name() const;
    std::string stem() const;
    std::string suffix() const;
    CPath parent() const;

    /// Join onto an archive (member path) or a plain path (filesystem path).
    CPath operator/(std::string_view part) const;

    // ----- operations -----

    Result<io::ByteStreamPtr> open_binary() const;
    Result<io::TextStream> open_text(std::string_view encoding = "utf-8") const;
    Result<Bytes> read_bytes() const;
    Result<std::string> read_text(std::string_view encoding = "utf-8") const;

    Result<Stat> stat() const;
    Result<bool> exists() const;
    Result<bool> is_file() const;
    Result<bool> is_dir() const;

    /// Children of a directory or a multi-member archive, in archive order
    /// for archives.
    Result<std::vector<CPath>> iterate_directory() const;
    /// Children whose name matches `pattern` (`*`, `?`, `[...]`).
    Result<std::vector<CPath>> glob(std::string_view pattern) const;
    /// Like glob, over every descendant.
    Result<std::vector<CPath>> rglob(std::string_view pattern) const;

    /// Top-down walk of this directory and everything below it, one entry
    /// per directory with sorted child names. The visitor may remove names
    /// from `dirnames` to skip those subtrees.
    Result<void> walk(const WalkVisitor& visit) const;
    Result<std::vector<WalkEntry>> walk() const;

    /// This path relative to `other`, '/'-separated; "." when they are
    /// equal. Both must lie in the same archive (or both on the plain
    /// filesystem) with `other` an ancestor, otherwise InvalidArgument.
    Result<std::string> relative_to(const CPath& other) const;

    friend bool operator==(const CPath& a, const CPath& b) {
        return a.path_ == b.path_ && a.member_ == b.member_;
    }
    friend bool operator!=(const CPath& a, const CPath& b) { return !(a == b); }
    friend bool operator<(const CPath& a, const CPath& b);

private:
    std::unique_ptr<PathBackend> backend() const;
    CPath wrap(std::string child) const;
    std::vector<CPath> wrap_children(std::vector<std::string> children) const;

    fs::path path_;
    std::string member_;
    codec::CodecKind kind_ = codec::kPassthrough;
};

struct WalkEntry {
    CPath root;
    std::vector<std::string> dirnames;
    std::vector<std::string> filenames;
};

/// True when the path's name carries a known compressed or archive suffix.
bool is_compressed(const fs::path& path) noexcept;

} // namespace kmp::vfs

template <>
struct std::hash<kmp::vfs::CPath> {
    size_t operator()(const kmp::vfs::CPath& p) const noexcept {
        size_t h = std::filesystem::hash_value(p.fs_path());
        return h ^ (std::hash<std::string>{}(p.member_path()) + 0x9e3779b9 +
                    (h << 6) + (h >> 2));
    }
};
