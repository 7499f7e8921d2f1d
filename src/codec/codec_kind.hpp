#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace kmp::codec {

/// Decompression or extraction engine behind a codec.
enum class Engine {
    None, // passthrough
    Gzip,
    Xz,
    Lz4,
    Zstd,
    Zip,
    TarGzip,
};

/// How a path's bytes have to be read.
enum class Family {
    Passthrough,  // plain file
    SingleStream, // one decompressed byte stream
    Archive,      // zero or more named members
};

struct CodecKind {
    Family family = Family::Passthrough;
    Engine engine = Engine::None;

    bool operator==(const CodecKind&) const = default;
};

inline constexpr CodecKind kPassthrough{Family::Passthrough, Engine::None};

/// Pick the codec for a path from its file name. Pure and total: no I/O,
/// names matching no known suffix give kPassthrough.
CodecKind resolve_codec(const fs::path& path) noexcept;

/// True when the file name carries a known compressed or archive suffix.
bool is_compressed(const fs::path& path) noexcept;

std::string_view to_string(Engine engine);
std::string to_string(const CodecKind& kind);

/// Parse an engine name as printed by to_string(Engine).
std::optional<Engine> engine_from_string(std::string_view name);

} // namespace kmp::codec
