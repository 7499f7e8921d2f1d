#include "vfs/cpath.hpp"

#include "archive/member_tree.hpp"

#include <spdlog/spdlog.h>

namespace kmp::vfs {

CPath::CPath(fs::path path)
    : path_(std::move(path)), kind_(codec::resolve_codec(path_)) {}

CPath::CPath(fs::path archive_path, std::string_view member)
    : path_(std::move(archive_path)),
      member_(archive::normalize_member_path(member)),
      kind_(codec::resolve_codec(path_)) {
    if (kind_.family != codec::Family::Archive && !member_.empty()) {
        // Only archives have members: fall back to a plain joined path
        path_ /= member_;
        member_.clear();
        kind_ = codec::resolve_codec(path_);
    }
}

std::string CPath::string() const {
    if (member_.empty()) return path_.string();
    auto base = path_.string();
    if (!base.empty() && base.back() != '/') base += '/';
    return base + member_;
}

std::string CPath::name() const {
    if (member_.empty()) return path_.filename().string();
    auto slash = member_.rfind('/');
    return slash == std::string::npos ? member_ : member_.substr(slash + 1);
}

std::string CPath::suffix() const {
    auto n = name();
    auto dot = n.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == n.size()) return {};
    return n.substr(dot);
}

std::string CPath::stem() const {
    auto n = name();
    return n.substr(0, n.size() - suffix().size());
}

CPath CPath::parent() const {
    if (member_.empty()) return CPath(path_.parent_path());

    auto slash = member_.rfind('/');
    if (slash == std::string::npos) return CPath(path_);
    return CPath(path_, std::string_view(member_).substr(0, slash));
}

CPath CPath::operator/(std::string_view part) const {
    if (kind_.family == codec::Family::Archive) {
        return CPath(path_, member_.empty() ? std::string(part)
                                            : member_ + "/" + std::string(part));
    }
    return CPath(path_ / fs::path(part));
}

std::unique_ptr<PathBackend> CPath::backend() const {
    spdlog::trace("{}: {}", string(), codec::to_string(kind_));
    return make_backend(path_, member_, kind_);
}

Result<io::ByteStreamPtr> CPath::open_binary() const {
    return backend()->open_binary();
}

Result<io::TextStream> CPath::open_text(std::string_view encoding) const {
    return backend()->open_text(encoding);
}

Result<Bytes> CPath::read_bytes() const {
    auto stream = open_binary();
    if (!stream) return stream.error();
    return io::read_all(*stream.value());
}

Result<std::string> CPath::read_text(std::string_view encoding) const {
    auto text = open_text(encoding);
    if (!text) return text.error();
    return text.value().read_all();
}

Result<Stat> CPath::stat() const {
    return backend()->stat();
}

Result<bool> CPath::exists() const {
    auto info = stat();
    if (!info) return info.error();
    return info.value().exists;
}

Result<bool> CPath::is_file() const {
    auto info = stat();
    if (!info) return info.error();
    return info.value().is_file;
}

Result<bool> CPath::is_dir() const {
    auto info = stat();
    if (!info) return info.error();
    return info.value().is_dir;
}

CPath CPath::wrap(std::string child) const {
    if (kind_.family == codec::Family::Archive) return CPath(path_, child);
    return CPath(fs::path(std::move(child)));
}

std::vector<CPath> CPath::wrap_children(std::vector<std::string> children) const {
    std::vector<CPath> result;
    result.reserve(children.size());
    for (auto& child : children) {
        result.push_back(wrap(std::move(child)));
    }
    return result;
}

Result<std::vector<CPath>> CPath::iterate_directory() const {
    auto children = backend()->list_directory();
    if (!children) return children.error();
    return wrap_children(std::move(children.value()));
}

Result<std::vector<CPath>> CPath::glob(std::string_view pattern) const {
    auto matches = backend()->glob(pattern, false);
    if (!matches) return matches.error();
    return wrap_children(std::move(matches.value()));
}

Result<std::vector<CPath>> CPath::rglob(std::string_view pattern) const {
    auto matches = backend()->glob(pattern, true);
    if (!matches) return matches.error();
    return wrap_children(std::move(matches.value()));
}

Result<void> CPath::walk(const WalkVisitor& visit) const {
    return backend()->walk([&](const std::string& root,
                               std::vector<std::string>& dirnames,
                               const std::vector<std::string>& filenames) {
        WalkEntry entry{wrap(root), std::move(dirnames), filenames};
        visit(entry);
        dirnames = std::move(entry.dirnames);
    });
}

Result<std::vector<WalkEntry>> CPath::walk() const {
    std::vector<WalkEntry> entries;
    auto walked = walk([&](WalkEntry& entry) { entries.push_back(entry); });
    if (!walked) return walked.error();
    return entries;
}

Result<std::string> CPath::relative_to(const CPath& other) const {
    auto not_under = [&] {
        return Error(ErrorKind::InvalidArgument,
                     string() + " is not under " + other.string());
    };

    if (path_ == other.path_) {
        if (member_ == other.member_) return std::string(".");
        if (other.member_.empty()) return member_;
        const auto& base = other.member_;
        if (member_.size() > base.size() && member_.compare(0, base.size(), base) == 0 &&
            member_[base.size()] == '/') {
            return member_.substr(base.size() + 1);
        }
        return not_under();
    }
    // A member of one archive is never under another path
    if (is_member() || other.is_member()) return not_under();

    auto it = path_.begin();
    for (const auto& part : other.path_) {
        if (it == path_.end() || *it != part) return not_under();
        ++it;
    }
    fs::path rest;
    for (; it != path_.end(); ++it) rest /= *it;
    if (rest.empty()) return std::string(".");
    return rest.generic_string();
}

bool operator<(const CPath& a, const CPath& b) {
    if (a.path_ != b.path_) return a.path_ < b.path_;
    return a.member_ < b.member_;
}

bool is_compressed(const fs::path& path) noexcept {
    return codec::is_compressed(path);
}

} // namespace kmp::vfs
