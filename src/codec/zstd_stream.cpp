#include "codec/zstd_stream.hpp"

namespace kmp::codec {

ZstdStream::ZstdStream(io::ByteStreamPtr source, std::string label)
    : DecoderStream(std::move(source), std::move(label)) {}

Result<std::unique_ptr<ZstdStream>> ZstdStream::open(io::ByteStreamPtr source,
                                                     std::string label) {
    std::unique_ptr<ZstdStream> stream(
        new ZstdStream(std::move(source), std::move(label)));

    stream->dstream_ = ZSTD_createDStream();
    if (!stream->dstream_) {
        return Error(ErrorKind::IoError,
                     "ZSTD_createDStream failed: " + stream->label_);
    }
    size_t ret = ZSTD_initDStream(stream->dstream_);
    if (ZSTD_isError(ret)) {
        return Error(ErrorKind::IoError, std::string("ZSTD_initDStream: ") +
                                             ZSTD_getErrorName(ret));
    }
    return stream;
}

ZstdStream::~ZstdStream() {
    if (dstream_) {
        ZSTD_freeDStream(dstream_);
    }
}

Result<size_t> ZstdStream::read(char* buffer, size_t size) {
    if (finished_ || size == 0) return size_t{0};

    ZSTD_outBuffer out = {buffer, size, 0};
    while (out.pos < out.size) {
        if (input_empty() && !source_eof_) {
            auto filled = refill();
            if (!filled) return filled.error();
        }
        if (input_empty() && source_eof_ && frame_done_) {
            finished_ = true;
            break;
        }

        size_t in_before = in_pos_;
        size_t out_before = out.pos;
        ZSTD_inBuffer in = {in_.data(), in_size_, in_pos_};
        size_t ret = ZSTD_decompressStream(dstream_, &out, &in);
        in_pos_ = in.pos;

        if (ZSTD_isError(ret)) {
            return corrupt(ZSTD_getErrorName(ret));
        }

        bool progress = in_pos_ != in_before || out.pos != out_before;
        if (progress) {
            // 0: frame fully decoded and flushed
            frame_done_ = ret == 0;
        } else if (source_eof_) {
            return corrupt("unexpected end of zstd stream");
        }
    }

    return out.pos;
}

} // namespace kmp::codec
