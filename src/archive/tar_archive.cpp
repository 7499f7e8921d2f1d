#include "archive/tar_archive.hpp"

#include "archive/member_tree.hpp"
#include "codec/decoder_stream.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <spdlog/spdlog.h>

namespace kmp::archive {

namespace {

constexpr size_t kBlockSize = 512;

// ustar header field offsets and sizes
constexpr size_t kNameOffset = 0, kNameSize = 100;
constexpr size_t kSizeOffset = 124, kSizeSize = 12;
constexpr size_t kChecksumOffset = 148, kChecksumSize = 8;
constexpr size_t kTypeOffset = 156;
constexpr size_t kMagicOffset = 257;
constexpr size_t kPrefixOffset = 345, kPrefixSize = 155;

using Block = std::array<char, kBlockSize>;

std::string field_string(const Block& block, size_t offset, size_t size) {
    const char* begin = block.data() + offset;
    const char* end = static_cast<const char*>(std::memchr(begin, '\0', size));
    return std::string(begin, end ? end : begin + size);
}

/// Parse an octal numeric field. Leading spaces and trailing NUL/spaces are
/// allowed; a high bit in the first byte means GNU base-256.
std::optional<u64> parse_number(const Block& block, size_t offset, size_t size) {
    auto first = static_cast<u8>(block[offset]);
    if (first & 0x80) {
        if (first & 0x40) return std::nullopt; // negative
        u64 value = first & 0x3F;
        for (size_t i = 1; i < size; i++) {
            if (value >> 56) return std::nullopt;
            value = (value << 8) | static_cast<u8>(block[offset + i]);
        }
        return value;
    }

    size_t i = 0;
    while (i < size && block[offset + i] == ' ') i++;

    u64 value = 0;
    bool any = false;
    for (; i < size; i++) {
        char c = block[offset + i];
        if (c == '\0' || c == ' ') break;
        if (c < '0' || c > '7') return std::nullopt;
        value = (value << 3) | static_cast<u64>(c - '0');
        any = true;
    }
    if (!any) return u64{0};
    return value;
}

bool is_zero_block(const Block& block) {
    return std::all_of(block.begin(), block.end(),
                       [](char c) { return c == '\0'; });
}

bool checksum_matches(const Block& block) {
    auto stored = parse_number(block, kChecksumOffset, kChecksumSize);
    if (!stored) return false;

    // The checksum field itself counts as eight spaces. Some old writers
    // summed signed chars, so accept either.
    u64 unsigned_sum = 0;
    i64 signed_sum = 0;
    for (size_t i = 0; i < kBlockSize; i++) {
        bool in_field = i >= kChecksumOffset && i < kChecksumOffset + kChecksumSize;
        char c = in_field ? ' ' : block[i];
        unsigned_sum += static_cast<u8>(c);
        signed_sum += static_cast<signed char>(c);
    }
    return *stored == unsigned_sum || static_cast<i64>(*stored) == signed_sum;
}

/// Apply "path" and "size" records of a pax extended header.
void apply_pax_records(std::string_view records, std::optional<std::string>& path,
                       std::optional<u64>& size) {
    size_t pos = 0;
    while (pos < records.size()) {
        // "<length> <key>=<value>\n", length counts the whole record
        auto space = records.find(' ', pos);
        if (space == std::string_view::npos) return;

        u64 length = 0;
        for (size_t i = pos; i < space; i++) {
            char c = records[i];
            if (c < '0' || c > '9') return;
            length = length * 10 + static_cast<u64>(c - '0');
        }
        if (length == 0 || pos + length > records.size()) return;

        auto record = records.substr(space + 1, pos + length - space - 2);
        auto eq = record.find('=');
        if (eq != std::string_view::npos) {
            auto key = record.substr(0, eq);
            auto value = record.substr(eq + 1);
            if (key == "path") {
                path = std::string(value);
            } else if (key == "size") {
                u64 parsed = 0;
                for (char c : value) {
                    if (c < '0' || c > '9') break;
                    parsed = parsed * 10 + static_cast<u64>(c - '0');
                }
                size = parsed;
            }
        }
        pos += length;
    }
}

MemberType member_type(char typeflag, std::string_view name) {
    switch (typeflag) {
    case '0':
    case '\0':
    case '7': // contiguous file
        // Pre-POSIX archives mark directories with a trailing slash only
        if (!name.empty() && name.back() == '/') return MemberType::Directory;
        return MemberType::File;
    case '5':
        return MemberType::Directory;
    default:
        return MemberType::Other;
    }
}

/// Stream over the data of the entry a TarReader is positioned on.
class TarMemberStream : public io::ByteStream {
public:
    explicit TarMemberStream(std::unique_ptr<TarReader> reader)
        : reader_(std::move(reader)) {}

    Result<size_t> read(char* buffer, size_t size) override {
        return reader_->read_data(buffer, size);
    }

private:
    std::unique_ptr<TarReader> reader_;
};

} // namespace

// ============================================================================
// TarReader
// ============================================================================

TarReader::TarReader(io::ByteStreamPtr source, std::string label)
    : source_(std::move(source)), label_(std::move(label)) {}

Result<bool> TarReader::read_block(char* buffer, size_t size) {
    size_t filled = 0;
    while (filled < size) {
        auto got = source_->read(buffer + filled, size - filled);
        if (!got) return got.error();
        if (got.value() == 0) {
            if (filled == 0) return false;
            return Error(ErrorKind::CorruptData,
                         label_ + ": unexpected end of tar data");
        }
        filled += got.value();
    }
    return true;
}

Result<void> TarReader::skip(u64 count) {
    char scratch[8192];
    while (count > 0) {
        auto chunk = static_cast<size_t>(std::min<u64>(count, sizeof(scratch)));
        auto got = read_block(scratch, chunk);
        if (!got) return got.error();
        if (!got.value()) {
            return Error(ErrorKind::CorruptData,
                         label_ + ": unexpected end of tar data");
        }
        count -= chunk;
    }
    return {};
}

Result<std::string> TarReader::read_payload(u64 size) {
    constexpr u64 kMaxPayload = 1 << 20;
    if (size > kMaxPayload) {
        return Error(ErrorKind::CorruptData,
                     label_ + ": oversized tar extended header");
    }

    std::string payload(static_cast<size_t>(size), '\0');
    if (size > 0) {
        auto got = read_block(payload.data(), payload.size());
        if (!got) return got.error();
        if (!got.value()) {
            return Error(ErrorKind::CorruptData,
                         label_ + ": unexpected end of tar data");
        }
    }
    auto padded = skip((kBlockSize - size % kBlockSize) % kBlockSize);
    if (!padded) return padded.error();
    return payload;
}

Result<std::optional<TarEntry>> TarReader::next() {
    auto skipped = skip(remaining_ + padding_);
    if (!skipped) return skipped.error();
    remaining_ = 0;
    padding_ = 0;

    std::optional<std::string> long_name;
    std::optional<u64> pax_size;

    while (true) {
        Block block;
        auto got = read_block(block.data(), block.size());
        if (!got) return got.error();
        // An archive that simply stops is accepted as ended
        if (!got.value() || is_zero_block(block)) return std::optional<TarEntry>{};

        if (!checksum_matches(block)) {
            return Error(ErrorKind::CorruptData,
                         label_ + ": bad tar header checksum");
        }
        auto size = parse_number(block, kSizeOffset, kSizeSize);
        if (!size) {
            return Error(ErrorKind::CorruptData, label_ + ": bad tar size field");
        }

        char typeflag = block[kTypeOffset];
        if (typeflag == 'L') {
            // GNU long name for the next header
            auto payload = read_payload(*size);
            if (!payload) return payload.error();
            long_name = payload.value().substr(0, payload.value().find('\0'));
            continue;
        }
        if (typeflag == 'x') {
            auto payload = read_payload(*size);
            if (!payload) return payload.error();
            apply_pax_records(payload.value(), long_name, pax_size);
            continue;
        }
        if (typeflag == 'g' || typeflag == 'K') {
            // Global pax header, GNU long link name
            auto payload = read_payload(*size);
            if (!payload) return payload.error();
            continue;
        }

        TarEntry entry;
        entry.typeflag = typeflag;
        entry.size = pax_size ? *pax_size : *size;
        if (long_name) {
            entry.name = std::move(*long_name);
        } else {
            entry.name = field_string(block, kNameOffset, kNameSize);
            bool ustar = std::memcmp(block.data() + kMagicOffset, "ustar", 5) == 0;
            auto prefix = ustar ? field_string(block, kPrefixOffset, kPrefixSize)
                                : std::string();
            if (!prefix.empty()) {
                entry.name = prefix + "/" + entry.name;
            }
        }

        // Only regular files carry data in the stream
        bool has_data = typeflag != '1' && typeflag != '2' && typeflag != '3' &&
                        typeflag != '4' && typeflag != '5' && typeflag != '6';
        remaining_ = has_data ? entry.size : 0;
        padding_ = (kBlockSize - remaining_ % kBlockSize) % kBlockSize;
        return std::optional<TarEntry>(std::move(entry));
    }
}

Result<size_t> TarReader::read_data(char* buffer, size_t size) {
    if (remaining_ == 0 || size == 0) return size_t{0};

    auto want = static_cast<size_t>(std::min<u64>(size, remaining_));
    auto got = source_->read(buffer, want);
    if (!got) return got.error();
    if (got.value() == 0) {
        return Error(ErrorKind::CorruptData,
                     label_ + ": unexpected end of tar data");
    }
    remaining_ -= got.value();
    return got.value();
}

// ============================================================================
// TarArchive
// ============================================================================

TarArchive::TarArchive(fs::path archive_path, codec::Engine compression)
    : ArchiveReader(std::move(archive_path)), compression_(compression) {}

Result<std::unique_ptr<TarArchive>> TarArchive::open(const fs::path& archive_path,
                                                     codec::Engine compression) {
    std::error_code ec;
    if (!fs::exists(archive_path, ec)) {
        return Error(ErrorKind::NotFound,
                     "No such file: " + archive_path.string());
    }
    if (fs::is_directory(archive_path, ec)) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Is a directory: " + archive_path.string());
    }
    return std::unique_ptr<TarArchive>(new TarArchive(archive_path, compression));
}

Result<std::unique_ptr<TarReader>> TarArchive::open_reader() const {
    auto stream = codec::open_compressed_file(path_, compression_);
    if (!stream) return stream.error();
    return std::make_unique<TarReader>(std::move(stream.value()), path_.string());
}

Result<std::vector<MemberInfo>> TarArchive::list_members() {
    auto reader = open_reader();
    if (!reader) return reader.error();

    std::vector<MemberInfo> members;
    for (size_t index = 0;; index++) {
        auto entry = reader.value()->next();
        if (!entry) return entry.error();
        if (!entry.value()) break;

        const auto& tar_entry = *entry.value();
        MemberInfo member;
        member.index = index;
        member.stored_name = tar_entry.name;
        member.name = normalize_member_path(tar_entry.name);
        member.type = member_type(tar_entry.typeflag, tar_entry.name);
        member.size = member.type == MemberType::File ? tar_entry.size : 0;

        // "." or "./" for the archive root
        if (member.name.empty()) continue;
        members.push_back(std::move(member));
    }

    spdlog::debug("TAR {}: {} entries indexed", path_.filename().string(),
                  members.size());
    return members;
}

Result<io::ByteStreamPtr> TarArchive::open_member(const MemberInfo& member) {
    auto label = path_.string() + "/" + member.name;
    if (member.type != MemberType::File) {
        return Error(ErrorKind::UnsupportedOperation, "Not a regular file: " + label);
    }

    auto reader = open_reader();
    if (!reader) return reader.error();

    // Tar has no index: walk the headers up to the member's position
    for (size_t i = 0;; i++) {
        auto entry = reader.value()->next();
        if (!entry) return entry.error();
        if (!entry.value()) break;
        if (i == member.index) {
            if (entry.value()->name != member.stored_name) break;
            return io::ByteStreamPtr(
                std::make_unique<TarMemberStream>(std::move(reader.value())));
        }
    }
    return Error(ErrorKind::NotFound, "No such member: " + label);
}

} // namespace kmp::archive
