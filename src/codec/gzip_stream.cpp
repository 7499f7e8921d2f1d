#include "codec/gzip_stream.hpp"

namespace kmp::codec {

GzipStream::GzipStream(io::ByteStreamPtr source, std::string label)
    : DecoderStream(std::move(source), std::move(label)) {}

Result<std::unique_ptr<GzipStream>> GzipStream::open(io::ByteStreamPtr source,
                                                     std::string label) {
    std::unique_ptr<GzipStream> stream(
        new GzipStream(std::move(source), std::move(label)));

    // 16 + MAX_WBITS: expect a gzip header and trailer
    if (inflateInit2(&stream->strm_, 16 + MAX_WBITS) != Z_OK) {
        return Error(ErrorKind::IoError,
                     "inflateInit2 failed: " + stream->label_);
    }
    stream->initialized_ = true;
    return stream;
}

GzipStream::~GzipStream() {
    if (initialized_) {
        inflateEnd(&strm_);
    }
}

Result<size_t> GzipStream::read(char* buffer, size_t size) {
    if (finished_ || size == 0) return size_t{0};

    strm_.next_out = reinterpret_cast<Bytef*>(buffer);
    strm_.avail_out = static_cast<uInt>(size);

    while (strm_.avail_out > 0) {
        if (input_empty() && !source_eof_) {
            auto filled = refill();
            if (!filled) return filled.error();
        }
        if (input_empty() && source_eof_) {
            if (!at_member_boundary_) {
                return corrupt("unexpected end of gzip stream");
            }
            finished_ = true;
            break;
        }

        if (at_member_boundary_ && member_seen_) {
            // Zero padding may follow a complete member
            while (in_pos_ < in_size_ && in_[in_pos_] == '\0') ++in_pos_;
            if (input_empty()) continue;
        }

        strm_.next_in = reinterpret_cast<Bytef*>(in_.data() + in_pos_);
        strm_.avail_in = static_cast<uInt>(in_size_ - in_pos_);

        int ret = inflate(&strm_, Z_NO_FLUSH);
        in_pos_ = in_size_ - strm_.avail_in;

        if (ret == Z_STREAM_END) {
            // Another member may follow
            at_member_boundary_ = true;
            member_seen_ = true;
            inflateReset(&strm_);
            continue;
        }
        if (ret == Z_OK || ret == Z_BUF_ERROR) {
            at_member_boundary_ = false;
            continue;
        }
        return corrupt(strm_.msg ? strm_.msg : "inflate failed");
    }

    return size - strm_.avail_out;
}

} // namespace kmp::codec
