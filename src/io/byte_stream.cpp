#include "io/byte_stream.hpp"

namespace kmp::io {

Result<Bytes> read_all(ByteStream& stream) {
    constexpr size_t kChunk = 64 * 1024;

    Bytes data;
    size_t filled = 0;
    while (true) {
        data.resize(filled + kChunk);
        auto got = stream.read(data.data() + filled, kChunk);
        if (!got) return got.error();
        if (got.value() == 0) break;
        filled += got.value();
    }
    data.resize(filled);
    return data;
}

} // namespace kmp::io
