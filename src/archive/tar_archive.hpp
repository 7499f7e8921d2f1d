#pragma once

#include "archive/archive_reader.hpp"

#include <optional>

namespace kmp::archive {

/// One header of a tar stream, with GNU long names and pax paths applied.
struct TarEntry {
    std::string name;
    u64 size = 0;
    char typeflag = '0';
};

/// Sequential ustar reader over a (decompressed) byte stream. Understands
/// the ustar prefix field, GNU 'L' long names, pax 'x' path/size records and
/// base-256 sizes.
class TarReader {
public:
    explicit TarReader(io::ByteStreamPtr source, std::string label);

    /// Advance to the next entry, skipping any unread data of the current
    /// one. Returns nullopt at the end of the archive.
    Result<std::optional<TarEntry>> next();

    /// Read data of the current entry. Returns 0 at the end of the entry.
    Result<size_t> read_data(char* buffer, size_t size);

private:
    /// Fill `buffer` completely. Returns false if the source ended before
    /// the first byte.
    Result<bool> read_block(char* buffer, size_t size);
    Result<void> skip(u64 count);
    Result<std::string> read_payload(u64 size);

    io::ByteStreamPtr source_;
    std::string label_;
    u64 remaining_ = 0; // data bytes left in the current entry
    u64 padding_ = 0;   // zero bytes up to the next 512-byte boundary
};

/// Archive reader for a compressed tar file (.tar.gz).
class TarArchive : public ArchiveReader {
public:
    /// `compression` is the stream engine wrapped around the tar data.
    static Result<std::unique_ptr<TarArchive>> open(const fs::path& archive_path,
                                                    codec::Engine compression);

    Result<std::vector<MemberInfo>> list_members() override;
    Result<io::ByteStreamPtr> open_member(const MemberInfo& member) override;

private:
    TarArchive(fs::path archive_path, codec::Engine compression);

    Result<std::unique_ptr<TarReader>> open_reader() const;

    codec::Engine compression_;
};

} // namespace kmp::archive
