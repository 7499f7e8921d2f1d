#pragma once

#include "codec/decoder_stream.hpp"

#include <zlib.h>

namespace kmp::codec {

/// gzip decoder (zlib). Concatenated gzip members read as one stream.
class GzipStream : public DecoderStream {
public:
    static Result<std::unique_ptr<GzipStream>> open(io::ByteStreamPtr source,
                                                    std::string label);
    ~GzipStream() override;

    GzipStream(const GzipStream&) = delete;
    GzipStream& operator=(const GzipStream&) = delete;

    Result<size_t> read(char* buffer, size_t size) override;

private:
    GzipStream(io::ByteStreamPtr source, std::string label);

    z_stream strm_{};
    bool initialized_ = false;
    // True between members: input may legally end here.
    bool at_member_boundary_ = true;
    bool member_seen_ = false;
};

} // namespace kmp::codec
