#include "vfs/path_backend.hpp"

#include "archive/archive_reader.hpp"
#include "archive/member_tree.hpp"
#include "codec/decoder_stream.hpp"
#include "io/file_stream.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace kmp::vfs {

Result<io::TextStream> PathBackend::open_text(std::string_view encoding) const {
    auto parsed = io::parse_encoding(encoding);
    if (!parsed) return parsed.error();

    auto stream = open_binary();
    if (!stream) return stream.error();
    return io::TextStream(std::move(stream.value()), parsed.value());
}

// ============================================================================
// Passthrough
// ============================================================================

PassthroughBackend::PassthroughBackend(fs::path path) : path_(std::move(path)) {}

Result<io::ByteStreamPtr> PassthroughBackend::open_binary() const {
    auto file = io::FileStream::open(path_);
    if (!file) return file.error();
    return io::ByteStreamPtr(std::move(file.value()));
}

Result<Stat> PassthroughBackend::stat() const {
    std::error_code ec;
    auto status = fs::status(path_, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        return Error(ErrorKind::IoError,
                     "Failed to stat " + path_.string() + ": " + ec.message());
    }

    Stat info;
    info.exists = fs::exists(status);
    info.is_file = fs::is_regular_file(status);
    info.is_dir = fs::is_directory(status);
    if (info.is_file) {
        auto size = fs::file_size(path_, ec);
        if (!ec) info.size = size;
    }
    return info;
}

Result<std::vector<std::string>> PassthroughBackend::list_directory() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Error(ErrorKind::NotFound, "No such directory: " + path_.string());
    }
    if (!fs::is_directory(path_, ec)) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Not a directory: " + path_.string());
    }

    std::vector<std::string> children;
    for (auto it = fs::directory_iterator(path_, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        children.push_back(it->path().string());
    }
    if (ec) {
        return Error(ErrorKind::IoError,
                     "Failed to list " + path_.string() + ": " + ec.message());
    }
    return children;
}

Result<std::vector<std::string>> PassthroughBackend::glob(std::string_view pattern,
                                                          bool recursive) const {
    std::vector<std::string> results;
    std::error_code ec;
    if (!fs::is_directory(path_, ec)) return results;

    auto add_if_match = [&](const fs::directory_entry& entry) {
        if (archive::wildcard_match(pattern, entry.path().filename().string())) {
            results.push_back(entry.path().string());
        }
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(path_, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            add_if_match(*it);
        }
    } else {
        for (auto it = fs::directory_iterator(path_, ec);
             !ec && it != fs::directory_iterator(); it.increment(ec)) {
            add_if_match(*it);
        }
    }
    if (ec) {
        return Error(ErrorKind::IoError,
                     "Failed to list " + path_.string() + ": " + ec.message());
    }
    return results;
}

namespace {

Result<void> walk_directory(const fs::path& dir, const DirectoryVisitor& visit) {
    std::vector<std::string> dirnames;
    std::vector<std::string> filenames;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        auto name = it->path().filename().string();
        if (it->is_directory(type_ec)) {
            dirnames.push_back(std::move(name));
        } else {
            filenames.push_back(std::move(name));
        }
    }
    if (ec) {
        return Error(ErrorKind::IoError,
                     "Failed to list " + dir.string() + ": " + ec.message());
    }
    std::sort(dirnames.begin(), dirnames.end());
    std::sort(filenames.begin(), filenames.end());

    visit(dir.string(), dirnames, filenames);

    for (const auto& name : dirnames) {
        // Linked directories are reported but not entered
        auto child = dir / name;
        if (fs::is_symlink(child, ec)) continue;
        auto walked = walk_directory(child, visit);
        if (!walked) return walked;
    }
    return {};
}

} // namespace

Result<void> PassthroughBackend::walk(const DirectoryVisitor& visit) const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Error(ErrorKind::NotFound, "No such directory: " + path_.string());
    }
    if (!fs::is_directory(path_, ec)) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Not a directory: " + path_.string());
    }
    return walk_directory(path_, visit);
}

// ============================================================================
// Single stream
// ============================================================================

StreamBackend::StreamBackend(fs::path path, codec::Engine engine)
    : path_(std::move(path)), engine_(engine) {}

Result<io::ByteStreamPtr> StreamBackend::open_binary() const {
    return codec::open_compressed_file(path_, engine_);
}

Result<Stat> StreamBackend::stat() const {
    std::error_code ec;
    auto status = fs::status(path_, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        return Error(ErrorKind::IoError,
                     "Failed to stat " + path_.string() + ": " + ec.message());
    }

    // The decompressed size is only known after decoding everything
    Stat info;
    info.exists = fs::exists(status);
    info.is_file = fs::is_regular_file(status);
    return info;
}

Result<std::vector<std::string>> StreamBackend::list_directory() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Error(ErrorKind::NotFound, "No such file: " + path_.string());
    }
    return Error(ErrorKind::UnsupportedOperation,
                 "Not a directory: " + path_.string());
}

Result<std::vector<std::string>> StreamBackend::glob(std::string_view,
                                                     bool) const {
    return std::vector<std::string>{};
}

Result<void> StreamBackend::walk(const DirectoryVisitor&) const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Error(ErrorKind::NotFound, "No such file: " + path_.string());
    }
    return Error(ErrorKind::UnsupportedOperation,
                 "Not a directory: " + path_.string());
}

// ============================================================================
// Archive
// ============================================================================

namespace {

struct LoadedArchive {
    std::unique_ptr<archive::ArchiveReader> reader;
    archive::MemberTree tree;
};

Result<LoadedArchive> load_archive(const fs::path& path, codec::Engine engine) {
    auto reader = archive::open_archive(path, engine);
    if (!reader) return reader.error();

    auto members = reader.value()->list_members();
    if (!members) return members.error();

    return LoadedArchive{std::move(reader.value()),
                         archive::MemberTree(std::move(members.value()))};
}

void walk_members(const archive::MemberTree& tree, const std::string& dir,
                  const DirectoryVisitor& visit) {
    std::vector<std::string> dirnames;
    std::vector<std::string> filenames;
    for (auto& child : tree.children(dir)) {
        auto name = dir.empty() ? child : child.substr(dir.size() + 1);
        if (tree.lookup(child).type == archive::MemberTree::EntryType::Directory) {
            dirnames.push_back(std::move(name));
        } else {
            filenames.push_back(std::move(name));
        }
    }
    std::sort(dirnames.begin(), dirnames.end());
    std::sort(filenames.begin(), filenames.end());

    visit(dir, dirnames, filenames);

    for (const auto& name : dirnames) {
        walk_members(tree, dir.empty() ? name : dir + "/" + name, visit);
    }
}

} // namespace

ArchiveBackend::ArchiveBackend(fs::path archive_path, codec::Engine engine,
                               std::string member)
    : archive_path_(std::move(archive_path)),
      engine_(engine),
      member_(std::move(member)) {}

Result<io::ByteStreamPtr> ArchiveBackend::open_binary() const {
    auto loaded = load_archive(archive_path_, engine_);
    if (!loaded) return loaded.error();
    auto& [reader, tree] = loaded.value();

    if (member_.empty()) {
        // A lone top-level file stands in for the archive itself
        const auto* sole = tree.sole_top_level_file();
        if (!sole) {
            return Error(ErrorKind::UnsupportedOperation,
                         archive_path_.string() +
                             " is a directory-like archive; name a member to open");
        }
        spdlog::debug("{}: opening sole member '{}'", archive_path_.string(),
                      sole->name);
        return reader->open_member(*sole);
    }

    auto label = archive_path_.string() + "/" + member_;
    auto entry = tree.lookup(member_);
    switch (entry.type) {
    case archive::MemberTree::EntryType::Missing:
        return Error(ErrorKind::NotFound, "No such member: " + label);
    case archive::MemberTree::EntryType::Directory:
        return Error(ErrorKind::UnsupportedOperation, "Is a directory: " + label);
    case archive::MemberTree::EntryType::Other:
        return Error(ErrorKind::UnsupportedOperation, "Not a regular file: " + label);
    case archive::MemberTree::EntryType::File:
        break;
    }
    return reader->open_member(*entry.member);
}

Result<Stat> ArchiveBackend::stat() const {
    std::error_code ec;
    if (member_.empty() && fs::is_directory(archive_path_, ec)) {
        // A real directory that happens to carry an archive suffix
        return Stat{true, false, true, std::nullopt};
    }

    auto loaded = load_archive(archive_path_, engine_);
    if (!loaded) {
        if (loaded.error().kind == ErrorKind::NotFound) return Stat{};
        return loaded.error();
    }
    const auto& tree = loaded.value().tree;

    Stat info;
    if (member_.empty()) {
        info.exists = true;
        if (const auto* sole = tree.sole_top_level_file()) {
            info.is_file = true;
            info.size = sole->size;
        } else {
            info.is_dir = true;
        }
        return info;
    }

    auto entry = tree.lookup(member_);
    switch (entry.type) {
    case archive::MemberTree::EntryType::Missing:
        break;
    case archive::MemberTree::EntryType::File:
        info.exists = true;
        info.is_file = true;
        info.size = entry.member->size;
        break;
    case archive::MemberTree::EntryType::Directory:
        info.exists = true;
        info.is_dir = true;
        break;
    case archive::MemberTree::EntryType::Other:
        info.exists = true;
        break;
    }
    return info;
}

Result<std::optional<std::string>> ArchiveBackend::target_directory(
    const archive::MemberTree& tree) const {
    if (member_.empty()) {
        if (tree.sole_top_level_file()) return std::optional<std::string>{};
        return std::optional<std::string>(std::string());
    }

    auto entry = tree.lookup(member_);
    if (entry.type == archive::MemberTree::EntryType::Missing) {
        return Error(ErrorKind::NotFound,
                     "No such member: " + archive_path_.string() + "/" + member_);
    }
    if (entry.type != archive::MemberTree::EntryType::Directory) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>(member_);
}

Result<std::vector<std::string>> ArchiveBackend::list_directory() const {
    // Listing is always re-read from the archive
    auto loaded = load_archive(archive_path_, engine_);
    if (!loaded) return loaded.error();
    const auto& tree = loaded.value().tree;

    auto dir = target_directory(tree);
    if (!dir) return dir.error();
    if (!dir.value()) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Not a directory: " + archive_path_.string() +
                         (member_.empty() ? "" : "/" + member_));
    }
    return tree.children(*dir.value());
}

Result<std::vector<std::string>> ArchiveBackend::glob(std::string_view pattern,
                                                      bool recursive) const {
    std::vector<std::string> results;

    auto loaded = load_archive(archive_path_, engine_);
    if (!loaded) {
        if (loaded.error().kind == ErrorKind::NotFound) return results;
        return loaded.error();
    }
    const auto& tree = loaded.value().tree;

    auto dir = target_directory(tree);
    if (!dir) {
        if (dir.error().kind == ErrorKind::NotFound) return results;
        return dir.error();
    }
    if (!dir.value()) return results;

    auto candidates = recursive ? tree.descendants(*dir.value())
                                : tree.children(*dir.value());
    for (auto& path : candidates) {
        auto slash = path.rfind('/');
        auto name = slash == std::string::npos ? std::string_view(path)
                                               : std::string_view(path).substr(slash + 1);
        if (archive::wildcard_match(pattern, name)) {
            results.push_back(std::move(path));
        }
    }
    return results;
}

Result<void> ArchiveBackend::walk(const DirectoryVisitor& visit) const {
    auto loaded = load_archive(archive_path_, engine_);
    if (!loaded) return loaded.error();
    const auto& tree = loaded.value().tree;

    auto dir = target_directory(tree);
    if (!dir) return dir.error();
    if (!dir.value()) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Not a directory: " + archive_path_.string() +
                         (member_.empty() ? "" : "/" + member_));
    }
    walk_members(tree, *dir.value(), visit);
    return {};
}

// ============================================================================
// Dispatch
// ============================================================================

std::unique_ptr<PathBackend> make_backend(const fs::path& path,
                                          const std::string& member,
                                          codec::CodecKind kind) {
    switch (kind.family) {
    case codec::Family::Passthrough:
        return std::make_unique<PassthroughBackend>(path);
    case codec::Family::SingleStream:
        return std::make_unique<StreamBackend>(path, kind.engine);
    case codec::Family::Archive:
        return std::make_unique<ArchiveBackend>(path, kind.engine, member);
    }
    return std::make_unique<PassthroughBackend>(path);
}

} // namespace kmp::vfs
