#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>

namespace kmp::io {

/// Sequential source of bytes. Implementations own every resource they read
/// from and release it on destruction.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Read up to `size` bytes into `buffer`. Returns 0 at end of stream.
    virtual Result<size_t> read(char* buffer, size_t size) = 0;
};

using ByteStreamPtr = std::unique_ptr<ByteStream>;

/// Drain a stream into memory.
Result<Bytes> read_all(ByteStream& stream);

} // namespace kmp::io
