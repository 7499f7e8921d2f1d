#include "codec/decoder_stream.hpp"

#include "codec/capabilities.hpp"
#include "codec/gzip_stream.hpp"
#include "codec/xz_stream.hpp"
#include "io/file_stream.hpp"

#ifdef KOMPRESS_HAVE_LZ4
#include "codec/lz4_stream.hpp"
#endif
#ifdef KOMPRESS_HAVE_ZSTD
#include "codec/zstd_stream.hpp"
#endif

#include <spdlog/spdlog.h>

namespace kmp::codec {

namespace {
constexpr size_t kInputChunk = 64 * 1024;
}

DecoderStream::DecoderStream(io::ByteStreamPtr source, std::string label)
    : source_(std::move(source)), in_(kInputChunk), label_(std::move(label)) {}

Result<void> DecoderStream::refill() {
    auto got = source_->read(in_.data(), in_.size());
    if (!got) return got.error();

    in_pos_ = 0;
    in_size_ = got.value();
    if (in_size_ == 0) source_eof_ = true;
    return {};
}

Error DecoderStream::corrupt(std::string_view what) const {
    return Error(ErrorKind::CorruptData, label_ + ": " + std::string(what));
}

Result<io::ByteStreamPtr> open_decoder(Engine engine, io::ByteStreamPtr source,
                                       std::string label) {
    if (!engine_available(engine)) {
        return Error(ErrorKind::UnsupportedFormat,
                     std::string(to_string(engine)) +
                         " support is not available: " + label);
    }

    switch (engine) {
    case Engine::Gzip: {
        auto stream = GzipStream::open(std::move(source), std::move(label));
        if (!stream) return stream.error();
        return io::ByteStreamPtr(std::move(stream.value()));
    }
    case Engine::Xz: {
        auto stream = XzStream::open(std::move(source), std::move(label));
        if (!stream) return stream.error();
        return io::ByteStreamPtr(std::move(stream.value()));
    }
    case Engine::Lz4: {
#ifdef KOMPRESS_HAVE_LZ4
        auto stream = Lz4Stream::open(std::move(source), std::move(label));
        if (!stream) return stream.error();
        return io::ByteStreamPtr(std::move(stream.value()));
#else
        break;
#endif
    }
    case Engine::Zstd: {
#ifdef KOMPRESS_HAVE_ZSTD
        auto stream = ZstdStream::open(std::move(source), std::move(label));
        if (!stream) return stream.error();
        return io::ByteStreamPtr(std::move(stream.value()));
#else
        break;
#endif
    }
    case Engine::None:
    case Engine::Zip:
    case Engine::TarGzip:
        break;
    }
    return Error(ErrorKind::UnsupportedFormat,
                 std::string(to_string(engine)) + " is not a stream codec");
}

Result<io::ByteStreamPtr> open_compressed_file(const fs::path& path,
                                               Engine engine) {
    if (!engine_available(engine)) {
        return Error(ErrorKind::UnsupportedFormat,
                     std::string(to_string(engine)) +
                         " support is not available: " + path.string());
    }

    auto file = io::FileStream::open(path);
    if (!file) return file.error();

    spdlog::debug("opening {} with {}", path.string(), to_string(engine));
    return open_decoder(engine, std::move(file.value()), path.string());
}

} // namespace kmp::codec
