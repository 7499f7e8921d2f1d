#include "io/text_stream.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/fmt/fmt.h>

namespace kmp::io {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// Index of the first byte that is not valid UTF-8, or npos.
size_t find_invalid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<u8>(s[i]);
        size_t len;
        u32 min_cp;
        u32 cp;
        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; min_cp = 0x80; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; min_cp = 0x800; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; min_cp = 0x10000; cp = c & 0x07;
        } else {
            return i;
        }

        if (i + len > s.size()) return i;
        for (size_t k = 1; k < len; k++) {
            auto cc = static_cast<u8>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, out of range
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return i;
        }
        i += len;
    }
    return std::string_view::npos;
}

void normalize_newlines(std::string& text) {
    size_t out = 0;
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        text[out++] = text[i];
    }
    text.resize(out);
}

} // namespace

Result<Encoding> parse_encoding(std::string_view name) {
    std::string key;
    for (char c : name) {
        if (c == '-' || c == '_') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (key == "utf8") return Encoding::Utf8;
    if (key == "utf8sig") return Encoding::Utf8Sig;
    if (key == "ascii" || key == "usascii") return Encoding::Ascii;
    if (key == "latin1" || key == "iso88591" || key == "l1") {
        return Encoding::Latin1;
    }
    return Error(ErrorKind::InvalidArgument,
                 fmt::format("Unknown text encoding '{}'", name));
}

Result<std::string> decode(std::string_view bytes, Encoding encoding,
                           u64 offset) {
    switch (encoding) {
    case Encoding::Utf8:
    case Encoding::Utf8Sig: {
        auto bad = find_invalid_utf8(bytes);
        if (bad != std::string_view::npos) {
            return Error(ErrorKind::DecodeError,
                         fmt::format("Invalid UTF-8 at byte {}", offset + bad));
        }
        return std::string(bytes);
    }
    case Encoding::Ascii: {
        auto it = std::find_if(bytes.begin(), bytes.end(),
                               [](char c) { return static_cast<u8>(c) >= 0x80; });
        if (it != bytes.end()) {
            return Error(ErrorKind::DecodeError,
                         fmt::format("Non-ASCII byte 0x{:02x} at byte {}",
                                     static_cast<u8>(*it),
                                     offset + (it - bytes.begin())));
        }
        return std::string(bytes);
    }
    case Encoding::Latin1: {
        std::string out;
        out.reserve(bytes.size());
        for (char c : bytes) {
            auto b = static_cast<u8>(c);
            if (b < 0x80) {
                out += c;
            } else {
                out += static_cast<char>(0xC0 | (b >> 6));
                out += static_cast<char>(0x80 | (b & 0x3F));
            }
        }
        return out;
    }
    }
    return Error(ErrorKind::InvalidArgument, "Unknown text encoding");
}

TextStream::TextStream(ByteStreamPtr source, Encoding encoding)
    : source_(std::move(source)), encoding_(encoding) {}

Result<void> TextStream::fill() {
    constexpr size_t kChunk = 16 * 1024;

    char buffer[kChunk];
    auto got = source_->read(buffer, kChunk);
    if (!got) return got.error();
    if (got.value() == 0) {
        eof_ = true;
    } else {
        pending_.append(buffer, got.value());
    }

    if (!bom_checked_ && (pending_.size() >= kUtf8Bom.size() || eof_)) {
        bom_checked_ = true;
        if (encoding_ == Encoding::Utf8Sig && pending_.starts_with(kUtf8Bom)) {
            pending_.erase(0, kUtf8Bom.size());
            consumed_ += kUtf8Bom.size();
        }
    }
    return {};
}

Result<std::string> TextStream::take(size_t count) {
    auto text = decode(std::string_view(pending_).substr(0, count), encoding_,
                       consumed_);
    pending_.erase(0, count);
    consumed_ += count;
    return text;
}

Result<bool> TextStream::read_line(std::string& line) {
    // '\n' never appears inside a multi-byte sequence of any supported
    // encoding, so lines can be split before decoding.
    size_t newline;
    while ((newline = pending_.find('\n')) == std::string::npos || !bom_checked_) {
        if (eof_) break;
        auto filled = fill();
        if (!filled) return filled.error();
    }

    line_terminated_ = newline != std::string::npos;
    if (!line_terminated_) {
        if (pending_.empty()) return false;
        newline = pending_.size();
    }

    // A lone '\r' at end of stream is text, not half of a CRLF
    size_t length = newline;
    if (line_terminated_ && length > 0 && pending_[length - 1] == '\r') length--;

    auto text = take(length);
    if (!text) return text.error();
    if (line_terminated_) {
        size_t skip = newline - length + 1;
        pending_.erase(0, skip);
        consumed_ += skip;
    }

    line = std::move(text.value());
    return true;
}

Result<std::string> TextStream::read_all() {
    while (!eof_) {
        auto filled = fill();
        if (!filled) return filled.error();
    }

    auto text = take(pending_.size());
    if (!text) return text.error();
    normalize_newlines(text.value());
    return text;
}

} // namespace kmp::io
