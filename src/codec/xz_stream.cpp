#include "codec/xz_stream.hpp"

#include <cstdint>

namespace kmp::codec {

namespace {

const char* describe(lzma_ret ret) {
    switch (ret) {
    case LZMA_FORMAT_ERROR: return "not an xz stream";
    case LZMA_DATA_ERROR: return "corrupt xz data";
    case LZMA_OPTIONS_ERROR: return "unsupported xz options";
    case LZMA_BUF_ERROR: return "unexpected end of xz stream";
    case LZMA_MEM_ERROR: return "out of memory";
    case LZMA_MEMLIMIT_ERROR: return "memory limit reached";
    default: return "lzma_code failed";
    }
}

} // namespace

XzStream::XzStream(io::ByteStreamPtr source, std::string label)
    : DecoderStream(std::move(source), std::move(label)) {}

Result<std::unique_ptr<XzStream>> XzStream::open(io::ByteStreamPtr source,
                                                 std::string label) {
    std::unique_ptr<XzStream> stream(
        new XzStream(std::move(source), std::move(label)));

    lzma_ret ret = lzma_stream_decoder(&stream->strm_, UINT64_MAX,
                                       LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        return Error(ErrorKind::IoError, std::string("lzma_stream_decoder: ") +
                                             describe(ret));
    }
    stream->initialized_ = true;
    return stream;
}

XzStream::~XzStream() {
    if (initialized_) {
        lzma_end(&strm_);
    }
}

Result<size_t> XzStream::read(char* buffer, size_t size) {
    if (finished_ || size == 0) return size_t{0};

    strm_.next_out = reinterpret_cast<uint8_t*>(buffer);
    strm_.avail_out = size;

    while (strm_.avail_out > 0) {
        if (input_empty() && !source_eof_) {
            auto filled = refill();
            if (!filled) return filled.error();
        }

        strm_.next_in = reinterpret_cast<const uint8_t*>(in_.data() + in_pos_);
        strm_.avail_in = in_size_ - in_pos_;

        // LZMA_CONCATENATED needs LZMA_FINISH to report the final stream end
        lzma_ret ret = lzma_code(&strm_, source_eof_ ? LZMA_FINISH : LZMA_RUN);
        in_pos_ = in_size_ - strm_.avail_in;

        if (ret == LZMA_STREAM_END) {
            finished_ = true;
            break;
        }
        if (ret != LZMA_OK) {
            if (ret == LZMA_MEM_ERROR || ret == LZMA_MEMLIMIT_ERROR) {
                return Error(ErrorKind::IoError, label_ + ": " + describe(ret));
            }
            return corrupt(describe(ret));
        }
    }

    return size - strm_.avail_out;
}

} // namespace kmp::codec
