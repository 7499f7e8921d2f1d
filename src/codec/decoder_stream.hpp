#pragma once

#include "codec/codec_kind.hpp"
#include "io/byte_stream.hpp"

#include <string>
#include <vector>

namespace kmp::codec {

/// Base for streaming decompressors. Owns the compressed source and an input
/// buffer; subclasses drive their engine from in_[in_pos_, in_size_).
class DecoderStream : public io::ByteStream {
protected:
    DecoderStream(io::ByteStreamPtr source, std::string label);

    /// Replace the consumed input with the next chunk of the source.
    /// Sets source_eof_ once the source is exhausted.
    Result<void> refill();

    bool input_empty() const { return in_pos_ == in_size_; }

    /// CorruptData error naming the stream.
    Error corrupt(std::string_view what) const;

    io::ByteStreamPtr source_;
    std::vector<char> in_;
    size_t in_pos_ = 0;
    size_t in_size_ = 0;
    bool source_eof_ = false;
    bool finished_ = false;
    std::string label_; // for error messages, usually the file path
};

/// Wrap `source` in the streaming decoder for `engine`. Fails with
/// UnsupportedFormat when the engine is not available.
Result<io::ByteStreamPtr> open_decoder(Engine engine, io::ByteStreamPtr source,
                                       std::string label);

/// Open a compressed file and wrap it in the decoder for `engine`.
Result<io::ByteStreamPtr> open_compressed_file(const fs::path& path,
                                               Engine engine);

} // namespace kmp::codec
