#pragma once

#include "codec/decoder_stream.hpp"

#include <lzma.h>

namespace kmp::codec {

/// xz decoder (liblzma). Concatenated .xz streams read as one stream.
class XzStream : public DecoderStream {
public:
    static Result<std::unique_ptr<XzStream>> open(io::ByteStreamPtr source,
                                                  std::string label);
    ~XzStream() override;

    XzStream(const XzStream&) = delete;
    XzStream& operator=(const XzStream&) = delete;

    Result<size_t> read(char* buffer, size_t size) override;

private:
    XzStream(io::ByteStreamPtr source, std::string label);

    lzma_stream strm_ = LZMA_STREAM_INIT;
    bool initialized_ = false;
};

} // namespace kmp::codec
