#pragma once

#include "codec/decoder_stream.hpp"

#include <lz4frame.h>

namespace kmp::codec {

/// lz4 frame decoder (liblz4 LZ4F API). Consecutive frames read as one stream.
class Lz4Stream : public DecoderStream {
public:
    static Result<std::unique_ptr<Lz4Stream>> open(io::ByteStreamPtr source,
                                                   std::string label);
    ~Lz4Stream() override;

    Lz4Stream(const Lz4Stream&) = delete;
    Lz4Stream& operator=(const Lz4Stream&) = delete;

    Result<size_t> read(char* buffer, size_t size) override;

private:
    Lz4Stream(io::ByteStreamPtr source, std::string label);

    LZ4F_dctx* dctx_ = nullptr;
    bool frame_done_ = true;
};

} // namespace kmp::codec
