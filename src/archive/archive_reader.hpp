#pragma once

#include "codec/codec_kind.hpp"
#include "io/byte_stream.hpp"

#include <string>
#include <vector>

namespace kmp::archive {

enum class MemberType {
    File,
    Directory,
    Other, // links, devices, fifos
};

struct MemberInfo {
    std::string name;        // normalized, '/'-separated, no leading or trailing '/'
    std::string stored_name; // exactly as recorded in the archive
    size_t index = 0;        // position in the archive's entry sequence
    u64 size = 0;
    MemberType type = MemberType::File;
};

/// Abstract reader for a multi-member archive (zip, tar).
class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    /// Read the member table, in the archive's stored order. Re-read on every
    /// call.
    virtual Result<std::vector<MemberInfo>> list_members() = 0;

    /// Open a stream over the decompressed bytes of one member. The stream
    /// holds its own handle on the archive and may outlive the reader.
    virtual Result<io::ByteStreamPtr> open_member(const MemberInfo& member) = 0;

    const fs::path& path() const { return path_; }

protected:
    explicit ArchiveReader(fs::path path) : path_(std::move(path)) {}

    fs::path path_;
};

/// Open the archive reader for `engine` (Zip or TarGzip). Fails with NotFound
/// if the file is missing and CorruptData if it is not a readable archive.
Result<std::unique_ptr<ArchiveReader>> open_archive(const fs::path& path,
                                                    codec::Engine engine);

} // namespace kmp::archive
