#pragma once

#include "codec/decoder_stream.hpp"

#include <zstd.h>

namespace kmp::codec {

/// zstd decoder (libzstd streaming API). Consecutive frames read as one stream.
class ZstdStream : public DecoderStream {
public:
    static Result<std::unique_ptr<ZstdStream>> open(io::ByteStreamPtr source,
                                                    std::string label);
    ~ZstdStream() override;

    ZstdStream(const ZstdStream&) = delete;
    ZstdStream& operator=(const ZstdStream&) = delete;

    Result<size_t> read(char* buffer, size_t size) override;

private:
    ZstdStream(io::ByteStreamPtr source, std::string label);

    ZSTD_DStream* dstream_ = nullptr;
    bool frame_done_ = true;
};

} // namespace kmp::codec
