#include "fixtures.hpp"

#include "codec/capabilities.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>

#include <lzma.h>
#include <minizip/zip.h>
#include <zlib.h>

#ifdef KOMPRESS_HAVE_ZSTD
#include <zstd.h>
#endif
#ifdef KOMPRESS_HAVE_LZ4
#include <lz4frame.h>
#endif

namespace kmp::test {

namespace {

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};
static_assert(sizeof(TarHeader) == 512);

void write_octal(char* field, size_t width, u64 value) {
    std::snprintf(field, width + 1, "%0*llo", static_cast<int>(width),
                  static_cast<unsigned long long>(value));
}

void append_header(std::string& out, std::string_view name, u64 size,
                   char typeflag) {
    TarHeaderFields fields;
    fields.name = std::string(name);
    fields.size = size;
    fields.typeflag = typeflag;
    out += tar_header(fields);
}

void append_data(std::string& out, std::string_view data) {
    out += tar_data(data);
}

} // namespace

TempDir::TempDir() {
    std::random_device rd;
    auto base = fs::temp_directory_path();
    for (int attempt = 0; attempt < 100; attempt++) {
        auto candidate = base / ("kompress-test-" + std::to_string(rd()));
        if (fs::create_directory(candidate)) {
            path_ = candidate;
            return;
        }
    }
    throw std::runtime_error("could not create a temp directory");
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const fs::path& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) throw std::runtime_error("failed to write " + path.string());
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>());
}

void write_gzip(const fs::path& path, std::string_view content) {
    gzFile gz = gzopen(path.string().c_str(), "wb");
    if (!gz) throw std::runtime_error("gzopen failed");
    if (!content.empty()) {
        gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
    }
    gzclose(gz);
}

void write_xz(const fs::path& path, std::string_view content) {
    std::string out(lzma_stream_buffer_bound(content.size()), '\0');
    size_t out_pos = 0;
    lzma_ret ret = lzma_easy_buffer_encode(
        6, LZMA_CHECK_CRC64, nullptr,
        reinterpret_cast<const uint8_t*>(content.data()), content.size(),
        reinterpret_cast<uint8_t*>(out.data()), &out_pos, out.size());
    if (ret != LZMA_OK) throw std::runtime_error("lzma_easy_buffer_encode failed");
    out.resize(out_pos);
    write_file(path, out);
}

#ifdef KOMPRESS_HAVE_ZSTD
void write_zstd(const fs::path& path, std::string_view content) {
    std::string out(ZSTD_compressBound(content.size()), '\0');
    size_t n = ZSTD_compress(out.data(), out.size(), content.data(),
                             content.size(), 3);
    if (ZSTD_isError(n)) throw std::runtime_error("ZSTD_compress failed");
    out.resize(n);
    write_file(path, out);
}
#endif

#ifdef KOMPRESS_HAVE_LZ4
void write_lz4(const fs::path& path, std::string_view content) {
    std::string out(LZ4F_compressFrameBound(content.size(), nullptr), '\0');
    size_t n = LZ4F_compressFrame(out.data(), out.size(), content.data(),
                                  content.size(), nullptr);
    if (LZ4F_isError(n)) throw std::runtime_error("LZ4F_compressFrame failed");
    out.resize(n);
    write_file(path, out);
}
#endif

bool write_compressed(const fs::path& path, codec::Engine engine,
                      std::string_view content) {
    switch (engine) {
    case codec::Engine::Gzip:
        write_gzip(path, content);
        return true;
    case codec::Engine::Xz:
        write_xz(path, content);
        return true;
    case codec::Engine::Zstd:
#ifdef KOMPRESS_HAVE_ZSTD
        write_zstd(path, content);
        return true;
#else
        return false;
#endif
    case codec::Engine::Lz4:
#ifdef KOMPRESS_HAVE_LZ4
        write_lz4(path, content);
        return true;
#else
        return false;
#endif
    default:
        return false;
    }
}

std::string tar_header(const TarHeaderFields& fields) {
    TarHeader hdr{};
    std::memcpy(hdr.name, fields.name.data(),
                std::min(fields.name.size(), sizeof(hdr.name) - 1));
    write_octal(hdr.mode, 7, fields.typeflag == '5' ? 0755 : 0644);
    write_octal(hdr.uid, 7, 1000);
    write_octal(hdr.gid, 7, 1000);
    if (fields.base256_size) {
        // GNU base-256: high bit set, big-endian value in the remaining bytes
        hdr.size[0] = static_cast<char>(0x80);
        u64 value = fields.size;
        for (size_t i = sizeof(hdr.size) - 1; i > 0; i--) {
            hdr.size[i] = static_cast<char>(value & 0xFF);
            value >>= 8;
        }
    } else {
        write_octal(hdr.size, 11, fields.size);
    }
    write_octal(hdr.mtime, 11, 1700000000);
    hdr.typeflag = fields.typeflag;
    std::memcpy(hdr.linkname, fields.linkname.data(),
                std::min(fields.linkname.size(), sizeof(hdr.linkname) - 1));
    std::memcpy(hdr.magic, "ustar", 6);
    std::memcpy(hdr.version, "00", 2);
    std::memcpy(hdr.prefix, fields.prefix.data(),
                std::min(fields.prefix.size(), sizeof(hdr.prefix)));

    std::memset(hdr.checksum, ' ', sizeof(hdr.checksum));
    unsigned sum = 0;
    const auto* bytes = reinterpret_cast<const unsigned char*>(&hdr);
    for (size_t i = 0; i < sizeof(hdr); i++) sum += bytes[i];
    std::snprintf(hdr.checksum, sizeof(hdr.checksum), "%06o", sum);
    hdr.checksum[7] = ' ';

    return std::string(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
}

std::string tar_data(std::string_view data) {
    std::string out(data);
    out.append((512 - data.size() % 512) % 512, '\0');
    return out;
}

std::string pax_record(std::string_view key, std::string_view value) {
    // The length prefix counts its own digits
    const size_t body = 1 + key.size() + 1 + value.size() + 1;
    size_t length = body + 1;
    while (std::to_string(length).size() + body != length) {
        length = std::to_string(length).size() + body;
    }
    return std::to_string(length) + " " + std::string(key) + "=" +
           std::string(value) + "\n";
}

std::string tar_bytes(const std::vector<ArchiveEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        if (entry.name.size() > 99) {
            std::string long_name = entry.name + '\0';
            append_header(out, "././@LongLink", long_name.size(), 'L');
            append_data(out, long_name);
        }
        if (entry.is_dir) {
            append_header(out, entry.name, 0, '5');
        } else if (entry.is_symlink) {
            TarHeaderFields fields;
            fields.name = entry.name;
            fields.typeflag = '2';
            fields.linkname = entry.content;
            out += tar_header(fields);
        } else {
            append_header(out, entry.name, entry.content.size(), '0');
            append_data(out, entry.content);
        }
    }
    // End-of-archive marker (two zero blocks)
    out.append(1024, '\0');
    return out;
}

void write_tar_gz(const fs::path& path, const std::vector<ArchiveEntry>& entries) {
    write_gzip(path, tar_bytes(entries));
}

void write_zip(const fs::path& path, const std::vector<ArchiveEntry>& entries) {
    zipFile zip = zipOpen64(path.string().c_str(), APPEND_STATUS_CREATE);
    if (!zip) throw std::runtime_error("zipOpen64 failed");

    for (const auto& entry : entries) {
        zip_fileinfo info{};
        // Made by Unix, so the high external attribute bits carry st_mode
        uLong version_made_by = 0;
        if (entry.is_symlink) {
            info.external_fa = static_cast<uLong>(0120777) << 16;
            version_made_by = (3 << 8) | 20;
        }
        if (zipOpenNewFileInZip4_64(zip, entry.name.c_str(), &info, nullptr, 0,
                                    nullptr, 0, nullptr, Z_DEFLATED,
                                    Z_DEFAULT_COMPRESSION, 0, -MAX_WBITS,
                                    DEF_MEM_LEVEL, Z_DEFAULT_STRATEGY, nullptr,
                                    0, version_made_by, 0, 0) != ZIP_OK) {
            zipClose(zip, nullptr);
            throw std::runtime_error("zipOpenNewFileInZip4_64 failed");
        }
        if (!entry.content.empty()) {
            zipWriteInFileInZip(zip, entry.content.data(),
                                static_cast<unsigned>(entry.content.size()));
        }
        zipCloseFileInZip(zip);
    }
    zipClose(zip, nullptr);
}

void corrupt_file(const fs::path& path, size_t offset, size_t count) {
    auto data = read_file(path);
    for (size_t i = offset; i < offset + count && i < data.size(); i++) {
        data[i] = static_cast<char>(data[i] ^ 0xFF);
    }
    write_file(path, data);
}

void truncate_file(const fs::path& path, size_t size) {
    auto data = read_file(path);
    data.resize(std::min(size, data.size()));
    write_file(path, data);
}

MemoryStream::MemoryStream(std::string data, size_t chunk)
    : data_(std::move(data)), chunk_(chunk) {}

Result<size_t> MemoryStream::read(char* buffer, size_t size) {
    size_t n = std::min({size, chunk_, data_.size() - pos_});
    std::memcpy(buffer, data_.data() + pos_, n);
    pos_ += n;
    return n;
}

ScopedEngineDisable::ScopedEngineDisable(codec::Engine engine)
    : engine_(engine), was_available_(codec::engine_available(engine)) {
    codec::set_engine_enabled(engine_, false);
}

ScopedEngineDisable::~ScopedEngineDisable() {
    codec::set_engine_enabled(engine_, was_available_);
}

} // namespace kmp::test
