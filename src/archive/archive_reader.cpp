#include "archive/archive_reader.hpp"

#include "archive/tar_archive.hpp"
#include "archive/zip_archive.hpp"
#include "codec/capabilities.hpp"

namespace kmp::archive {

Result<std::unique_ptr<ArchiveReader>> open_archive(const fs::path& path,
                                                    codec::Engine engine) {
    if (!codec::engine_available(engine)) {
        return Error(ErrorKind::UnsupportedFormat,
                     std::string(codec::to_string(engine)) +
                         " support is not available: " + path.string());
    }

    switch (engine) {
    case codec::Engine::Zip: {
        auto zip = ZipArchive::open(path);
        if (!zip) return zip.error();
        return std::unique_ptr<ArchiveReader>(std::move(zip.value()));
    }
    case codec::Engine::TarGzip: {
        auto tar = TarArchive::open(path, codec::Engine::Gzip);
        if (!tar) return tar.error();
        return std::unique_ptr<ArchiveReader>(std::move(tar.value()));
    }
    case codec::Engine::None:
    case codec::Engine::Gzip:
    case codec::Engine::Xz:
    case codec::Engine::Lz4:
    case codec::Engine::Zstd:
        break;
    }
    return Error(ErrorKind::UnsupportedFormat,
                 std::string(codec::to_string(engine)) +
                     " is not an archive format");
}

} // namespace kmp::archive
