#include "archive/zip_archive.hpp"

#include "archive/member_tree.hpp"

#include <algorithm>
#include <minizip/unzip.h>
#include <spdlog/spdlog.h>

namespace kmp::archive {

namespace {

constexpr u32 kHostUnix = 3;
constexpr u32 kUnixFileTypeMask = 0170000;
constexpr u32 kUnixSymlink = 0120000;

Result<UnzHandle> open_handle(const fs::path& archive_path) {
    std::error_code ec;
    if (!fs::exists(archive_path, ec)) {
        return Error(ErrorKind::NotFound,
                     "No such file: " + archive_path.string());
    }
    if (fs::is_directory(archive_path, ec)) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Is a directory: " + archive_path.string());
    }

    UnzHandle handle(unzOpen64(archive_path.string().c_str()));
    if (!handle) {
        return Error(ErrorKind::CorruptData,
                     "Not a readable ZIP archive: " + archive_path.string());
    }
    return handle;
}

/// Stream over the current file of its own unzFile handle.
class ZipMemberStream : public io::ByteStream {
public:
    ZipMemberStream(UnzHandle handle, std::string label)
        : zip_handle_(std::move(handle)), label_(std::move(label)) {}

    ~ZipMemberStream() override {
        if (open_) {
            unzCloseCurrentFile(static_cast<unzFile>(zip_handle_.get()));
        }
    }

    Result<size_t> read(char* buffer, size_t size) override {
        if (!open_ || size == 0) return size_t{0};

        auto chunk = static_cast<unsigned>(
            std::min<size_t>(size, 1u << 30));
        int got = unzReadCurrentFile(static_cast<unzFile>(zip_handle_.get()),
                                     buffer, chunk);
        if (got < 0) {
            open_ = false;
            unzCloseCurrentFile(static_cast<unzFile>(zip_handle_.get()));
            return Error(ErrorKind::CorruptData,
                         label_ + ": failed to decompress (error " +
                             std::to_string(got) + ")");
        }
        if (got == 0) {
            // End of member: the CRC is checked on close
            open_ = false;
            int ret = unzCloseCurrentFile(static_cast<unzFile>(zip_handle_.get()));
            if (ret == UNZ_CRCERROR) {
                return Error(ErrorKind::CorruptData, label_ + ": CRC mismatch");
            }
            if (ret != UNZ_OK) {
                return Error(ErrorKind::CorruptData,
                             label_ + ": failed to close member");
            }
        }
        return static_cast<size_t>(got);
    }

private:
    UnzHandle zip_handle_;
    std::string label_;
    bool open_ = true;
};

} // namespace

namespace detail {
void UnzCloser::operator()(void* handle) const {
    unzClose(static_cast<unzFile>(handle));
}
} // namespace detail

ZipArchive::ZipArchive(fs::path archive_path, UnzHandle handle)
    : ArchiveReader(std::move(archive_path)), zip_handle_(std::move(handle)) {}

Result<std::unique_ptr<ZipArchive>> ZipArchive::open(const fs::path& archive_path) {
    auto handle = open_handle(archive_path);
    if (!handle) return handle.error();

    return std::unique_ptr<ZipArchive>(
        new ZipArchive(archive_path, std::move(handle.value())));
}

Result<std::vector<MemberInfo>> ZipArchive::list_members() {
    auto zip = static_cast<unzFile>(zip_handle_.get());
    std::vector<MemberInfo> members;

    // Read central directory
    int ret = unzGoToFirstFile(zip);
    for (size_t index = 0; ret == UNZ_OK; index++) {
        unz_file_info64 file_info;
        if (unzGetCurrentFileInfo64(zip, &file_info, nullptr, 0, nullptr, 0,
                                    nullptr, 0) != UNZ_OK) {
            ret = UNZ_BADZIPFILE;
            break;
        }
        std::string filename(file_info.size_filename, '\0');
        ret = unzGetCurrentFileInfo64(zip, &file_info, filename.data(),
                                      static_cast<uLong>(filename.size()),
                                      nullptr, 0, nullptr, 0);
        if (ret != UNZ_OK) break;

        MemberInfo member;
        member.index = index;
        member.stored_name = filename;
        member.name = normalize_member_path(filename);
        member.size = file_info.uncompressed_size;

        if (!filename.empty() && filename.back() == '/') {
            member.type = MemberType::Directory;
        } else if ((file_info.version >> 8) == kHostUnix &&
                   ((file_info.external_fa >> 16) & kUnixFileTypeMask) == kUnixSymlink) {
            member.type = MemberType::Other;
        }

        if (member.name.empty()) {
            spdlog::warn("{}: skipping entry '{}'", path_.string(), filename);
        } else {
            members.push_back(std::move(member));
        }

        ret = unzGoToNextFile(zip);
    }

    if (ret != UNZ_END_OF_LIST_OF_FILE) {
        return Error(ErrorKind::CorruptData,
                     "Corrupt ZIP central directory: " + path_.string());
    }

    spdlog::debug("ZIP {}: {} entries indexed", path_.filename().string(),
                  members.size());
    return members;
}

Result<io::ByteStreamPtr> ZipArchive::open_member(const MemberInfo& member) {
    auto label = path_.string() + "/" + member.name;
    if (member.type != MemberType::File) {
        return Error(ErrorKind::UnsupportedOperation, "Not a regular file: " + label);
    }

    // Each stream owns its own handle
    auto handle = open_handle(path_);
    if (!handle) return handle.error();
    auto zip = static_cast<unzFile>(handle.value().get());

    // Walk the central directory to the member's position
    int ret = unzGoToFirstFile(zip);
    for (size_t i = 0; ret == UNZ_OK && i < member.index; i++) {
        ret = unzGoToNextFile(zip);
    }
    unz_file_info64 file_info;
    if (ret != UNZ_OK ||
        unzGetCurrentFileInfo64(zip, &file_info, nullptr, 0, nullptr, 0,
                                nullptr, 0) != UNZ_OK) {
        return Error(ErrorKind::NotFound, "No such member: " + label);
    }
    std::string filename(file_info.size_filename, '\0');
    if (unzGetCurrentFileInfo64(zip, &file_info, filename.data(),
                                static_cast<uLong>(filename.size()),
                                nullptr, 0, nullptr, 0) != UNZ_OK ||
        member.stored_name != filename) {
        return Error(ErrorKind::NotFound, "No such member: " + label);
    }
    if (unzOpenCurrentFile(zip) != UNZ_OK) {
        return Error(ErrorKind::CorruptData, "Failed to open member: " + label);
    }

    return io::ByteStreamPtr(
        std::make_unique<ZipMemberStream>(std::move(handle.value()), label));
}

} // namespace kmp::archive
