#include "codec/lz4_stream.hpp"

namespace kmp::codec {

Lz4Stream::Lz4Stream(io::ByteStreamPtr source, std::string label)
    : DecoderStream(std::move(source), std::move(label)) {}

Result<std::unique_ptr<Lz4Stream>> Lz4Stream::open(io::ByteStreamPtr source,
                                                   std::string label) {
    std::unique_ptr<Lz4Stream> stream(
        new Lz4Stream(std::move(source), std::move(label)));

    LZ4F_errorCode_t err =
        LZ4F_createDecompressionContext(&stream->dctx_, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        stream->dctx_ = nullptr;
        return Error(ErrorKind::IoError,
                     std::string("LZ4F_createDecompressionContext: ") +
                         LZ4F_getErrorName(err));
    }
    return stream;
}

Lz4Stream::~Lz4Stream() {
    if (dctx_) {
        LZ4F_freeDecompressionContext(dctx_);
    }
}

Result<size_t> Lz4Stream::read(char* buffer, size_t size) {
    if (finished_ || size == 0) return size_t{0};

    size_t produced = 0;
    while (produced < size) {
        if (input_empty() && !source_eof_) {
            auto filled = refill();
            if (!filled) return filled.error();
        }
        if (input_empty() && source_eof_ && frame_done_) {
            finished_ = true;
            break;
        }

        size_t dst_size = size - produced;
        size_t src_size = in_size_ - in_pos_;
        size_t hint = LZ4F_decompress(dctx_, buffer + produced, &dst_size,
                                      in_.data() + in_pos_, &src_size, nullptr);
        if (LZ4F_isError(hint)) {
            return corrupt(LZ4F_getErrorName(hint));
        }
        in_pos_ += src_size;
        produced += dst_size;

        if (src_size > 0 || dst_size > 0) {
            // 0: frame fully decoded and flushed
            frame_done_ = hint == 0;
        } else if (source_eof_) {
            return corrupt("unexpected end of lz4 stream");
        }
    }

    return produced;
}

} // namespace kmp::codec
