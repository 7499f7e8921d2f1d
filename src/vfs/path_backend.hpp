#pragma once

#include "codec/codec_kind.hpp"
#include "io/byte_stream.hpp"
#include "io/text_stream.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kmp::archive {
class MemberTree;
}

namespace kmp::vfs {

struct Stat {
    bool exists = false;
    bool is_file = false;
    bool is_dir = false;
    std::optional<u64> size; // unknown for single-stream codecs
};

/// Called once per directory of a walk with its bare child names, sorted.
/// Removing names from `dirnames` skips those subtrees.
using DirectoryVisitor =
    std::function<void(const std::string& root, std::vector<std::string>& dirnames,
                       const std::vector<std::string>& filenames)>;

/// Capability set every codec exposes for one path. Built per operation and
/// dropped afterwards; nothing is cached between calls.
class PathBackend {
public:
    virtual ~PathBackend() = default;

    /// Open the decoded bytes.
    virtual Result<io::ByteStreamPtr> open_binary() const = 0;

    /// A missing target is a Stat with exists == false, not an error.
    virtual Result<Stat> stat() const = 0;

    /// Children of a directory: filesystem paths for plain directories,
    /// member paths for archive directories.
    virtual Result<std::vector<std::string>> list_directory() const = 0;

    /// Children (or, with `recursive`, all descendants) whose name matches a
    /// `*`/`?`/`[...]` pattern. Same path convention as list_directory.
    /// Files and missing paths have no matches.
    virtual Result<std::vector<std::string>> glob(std::string_view pattern,
                                                  bool recursive) const = 0;

    /// Top-down walk of a directory. `root` follows the list_directory
    /// convention; the first root is the target itself.
    virtual Result<void> walk(const DirectoryVisitor& visit) const = 0;

    /// Open the decoded bytes as text in `encoding`.
    Result<io::TextStream> open_text(std::string_view encoding) const;
};

/// Plain file or directory on disk.
class PassthroughBackend : public PathBackend {
public:
    explicit PassthroughBackend(fs::path path);

    Result<io::ByteStreamPtr> open_binary() const override;
    Result<Stat> stat() const override;
    Result<std::vector<std::string>> list_directory() const override;
    Result<std::vector<std::string>> glob(std::string_view pattern,
                                          bool recursive) const override;
    Result<void> walk(const DirectoryVisitor& visit) const override;

private:
    fs::path path_;
};

/// File holding one compressed stream (.gz, .xz, .zst, .lz4).
class StreamBackend : public PathBackend {
public:
    StreamBackend(fs::path path, codec::Engine engine);

    Result<io::ByteStreamPtr> open_binary() const override;
    Result<Stat> stat() const override;
    Result<std::vector<std::string>> list_directory() const override;
    Result<std::vector<std::string>> glob(std::string_view pattern,
                                          bool recursive) const override;
    Result<void> walk(const DirectoryVisitor& visit) const override;

private:
    fs::path path_;
    codec::Engine engine_;
};

/// Archive root or a member inside it (.zip, .tar.gz).
class ArchiveBackend : public PathBackend {
public:
    /// An empty `member` addresses the archive itself.
    ArchiveBackend(fs::path archive_path, codec::Engine engine, std::string member);

    Result<io::ByteStreamPtr> open_binary() const override;
    Result<Stat> stat() const override;
    Result<std::vector<std::string>> list_directory() const override;
    Result<std::vector<std::string>> glob(std::string_view pattern,
                                          bool recursive) const override;
    Result<void> walk(const DirectoryVisitor& visit) const override;

private:
    /// Directory whose children list_directory/glob work on, or nullopt
    /// when the target is a file.
    Result<std::optional<std::string>> target_directory(
        const archive::MemberTree& tree) const;

    fs::path archive_path_;
    codec::Engine engine_;
    std::string member_;
};

/// Build the backend for `kind`. `member` is only used by archive kinds.
std::unique_ptr<PathBackend> make_backend(const fs::path& path,
                                          const std::string& member,
                                          codec::CodecKind kind);

} // namespace kmp::vfs
