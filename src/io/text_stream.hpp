#pragma once

#include "io/byte_stream.hpp"

#include <string>
#include <string_view>

namespace kmp::io {

enum class Encoding {
    Utf8,
    Utf8Sig, // UTF-8, leading byte order mark dropped
    Ascii,
    Latin1,
};

/// Parse an encoding name. Case and '-'/'_' are ignored, so "UTF-8", "utf8"
/// and "utf_8" are all Utf8. Unknown names are InvalidArgument.
Result<Encoding> parse_encoding(std::string_view name);

/// Convert bytes in `encoding` to UTF-8. `offset` is the position of
/// `bytes` in the whole stream and only feeds error messages.
Result<std::string> decode(std::string_view bytes, Encoding encoding,
                           u64 offset = 0);

/// Decoded text over a byte stream. Output is UTF-8 with CRLF turned into LF.
class TextStream {
public:
    TextStream(ByteStreamPtr source, Encoding encoding);

    /// Read the next line without its terminator. Returns false once the
    /// stream is exhausted.
    Result<bool> read_line(std::string& line);

    /// Whether the line last returned by read_line ended with a newline.
    /// Only the final line of a stream can lack one.
    bool line_terminated() const { return line_terminated_; }

    /// Read everything that is left.
    Result<std::string> read_all();

    Encoding encoding() const { return encoding_; }

private:
    /// Pull another chunk from the source into pending_.
    Result<void> fill();
    Result<std::string> take(size_t count);

    ByteStreamPtr source_;
    Encoding encoding_;
    std::string pending_;
    u64 consumed_ = 0;
    bool eof_ = false;
    bool bom_checked_ = false;
    bool line_terminated_ = false;
};

} // namespace kmp::io
