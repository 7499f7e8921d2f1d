#include "io/file_stream.hpp"

namespace kmp::io {

FileStream::FileStream(fs::path path, std::ifstream file)
    : path_(std::move(path)), file_(std::move(file)) {}

Result<std::unique_ptr<FileStream>> FileStream::open(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (!fs::exists(status)) {
        return Error(ErrorKind::NotFound, "No such file: " + path.string());
    }
    if (fs::is_directory(status)) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Is a directory: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error(ErrorKind::IoError, "Failed to open file: " + path.string());
    }

    return std::unique_ptr<FileStream>(new FileStream(path, std::move(file)));
}

Result<size_t> FileStream::read(char* buffer, size_t size) {
    if (size == 0 || file_.eof()) return size_t{0};

    file_.read(buffer, static_cast<std::streamsize>(size));
    if (file_.bad()) {
        return Error(ErrorKind::IoError, "Failed to read file: " + path_.string());
    }
    return static_cast<size_t>(file_.gcount());
}

} // namespace kmp::io
