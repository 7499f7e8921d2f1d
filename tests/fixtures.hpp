#pragma once

#include "codec/codec_kind.hpp"
#include "io/byte_stream.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kmp::test {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(std::string_view name) const { return path_ / name; }

private:
    fs::path path_;
};

struct ArchiveEntry {
    std::string name;
    std::string content;
    bool is_dir = false;
    // Symbolic link; `content` is the link target
    bool is_symlink = false;
};

struct TarHeaderFields {
    std::string name;
    u64 size = 0;
    char typeflag = '0';
    std::string linkname;
    std::string prefix;
    bool base256_size = false;
};

void write_file(const fs::path& path, std::string_view content);
std::string read_file(const fs::path& path);

void write_gzip(const fs::path& path, std::string_view content);
void write_xz(const fs::path& path, std::string_view content);
#ifdef KOMPRESS_HAVE_ZSTD
void write_zstd(const fs::path& path, std::string_view content);
#endif
#ifdef KOMPRESS_HAVE_LZ4
void write_lz4(const fs::path& path, std::string_view content);
#endif

/// Compress `content` with the single-stream engine matching `engine`.
/// Returns false when that engine is not compiled in.
bool write_compressed(const fs::path& path, codec::Engine engine,
                      std::string_view content);

/// One 512-byte ustar header block with a valid checksum.
std::string tar_header(const TarHeaderFields& fields);
/// `data` padded with NULs to the next 512-byte boundary.
std::string tar_data(std::string_view data);
/// One pax extended header record, "<length> <key>=<value>\n".
std::string pax_record(std::string_view key, std::string_view value);

/// Raw ustar bytes; names longer than 99 characters get a GNU 'L' header.
std::string tar_bytes(const std::vector<ArchiveEntry>& entries);
void write_tar_gz(const fs::path& path, const std::vector<ArchiveEntry>& entries);
void write_zip(const fs::path& path, const std::vector<ArchiveEntry>& entries);

/// XOR the bytes of [offset, offset + count) with 0xFF.
void corrupt_file(const fs::path& path, size_t offset, size_t count);
/// Drop everything after the first `size` bytes.
void truncate_file(const fs::path& path, size_t size);

/// In-memory stream that hands out at most `chunk` bytes per read.
class MemoryStream : public io::ByteStream {
public:
    explicit MemoryStream(std::string data, size_t chunk = 4096);

    Result<size_t> read(char* buffer, size_t size) override;

private:
    std::string data_;
    size_t pos_ = 0;
    size_t chunk_;
};

/// Disables an engine for the lifetime of the guard.
class ScopedEngineDisable {
public:
    explicit ScopedEngineDisable(codec::Engine engine);
    ~ScopedEngineDisable();

    ScopedEngineDisable(const ScopedEngineDisable&) = delete;
    ScopedEngineDisable& operator=(const ScopedEngineDisable&) = delete;

private:
    codec::Engine engine_;
    bool was_available_;
};

} // namespace kmp::test
