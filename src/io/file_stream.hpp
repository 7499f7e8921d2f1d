#pragma once

#include "io/byte_stream.hpp"

#include <fstream>

namespace kmp::io {

/// Byte stream over a regular file on disk.
class FileStream : public ByteStream {
public:
    /// Fails with NotFound if the file is missing and UnsupportedOperation if
    /// the path is a directory.
    static Result<std::unique_ptr<FileStream>> open(const fs::path& path);

    Result<size_t> read(char* buffer, size_t size) override;

    const fs::path& path() const { return path_; }

private:
    FileStream(fs::path path, std::ifstream file);

    fs::path path_;
    std::ifstream file_;
};

} // namespace kmp::io
