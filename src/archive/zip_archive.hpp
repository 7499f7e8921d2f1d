#pragma once

#include "archive/archive_reader.hpp"

#include <memory>

namespace kmp::archive {

namespace detail {
struct UnzCloser {
    void operator()(void* handle) const;
};
} // namespace detail

/// unzFile from minizip, closed on destruction.
using UnzHandle = std::unique_ptr<void, detail::UnzCloser>;

/// Archive reader backed by a ZIP file (minizip).
class ZipArchive : public ArchiveReader {
public:
    /// Opens the ZIP file and checks that its central directory is readable.
    static Result<std::unique_ptr<ZipArchive>> open(const fs::path& archive_path);

    Result<std::vector<MemberInfo>> list_members() override;
    Result<io::ByteStreamPtr> open_member(const MemberInfo& member) override;

private:
    ZipArchive(fs::path archive_path, UnzHandle handle);

    UnzHandle zip_handle_;
};

} // namespace kmp::archive
