#include "codec/codec_kind.hpp"

#include <array>

namespace kmp::codec {

namespace {

struct FormatDescriptor {
    std::string_view suffix;
    CodecKind kind;
};

// Checked top to bottom. A multi-segment suffix must come before every
// shorter suffix it ends with (".tar.gz" before ".gz").
constexpr std::array<FormatDescriptor, 7> kFormats = {{
    {".tar.gz", {Family::Archive, Engine::TarGzip}},
    {".xz", {Family::SingleStream, Engine::Xz}},
    {".zip", {Family::Archive, Engine::Zip}},
    {".lz4", {Family::SingleStream, Engine::Lz4}},
    {".zstd", {Family::SingleStream, Engine::Zstd}},
    {".zst", {Family::SingleStream, Engine::Zstd}},
    {".gz", {Family::SingleStream, Engine::Gzip}},
}};

bool ends_with(std::string_view name, std::string_view suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

CodecKind resolve_codec(const fs::path& path) noexcept {
    // Matched case-sensitively against the last component only.
    const std::string name = path.filename().string();

    for (const auto& format : kFormats) {
        if (ends_with(name, format.suffix)) {
            return format.kind;
        }
    }
    return kPassthrough;
}

bool is_compressed(const fs::path& path) noexcept {
    return resolve_codec(path).family != Family::Passthrough;
}

std::string_view to_string(Engine engine) {
    switch (engine) {
    case Engine::None: return "none";
    case Engine::Gzip: return "gzip";
    case Engine::Xz: return "xz";
    case Engine::Lz4: return "lz4";
    case Engine::Zstd: return "zstd";
    case Engine::Zip: return "zip";
    case Engine::TarGzip: return "tar+gzip";
    }
    return "unknown";
}

std::string to_string(const CodecKind& kind) {
    switch (kind.family) {
    case Family::Passthrough:
        return "passthrough";
    case Family::SingleStream:
        return "single-stream(" + std::string(to_string(kind.engine)) + ")";
    case Family::Archive:
        return "archive(" + std::string(to_string(kind.engine)) + ")";
    }
    return "unknown";
}

std::optional<Engine> engine_from_string(std::string_view name) {
    for (auto engine : {Engine::Gzip, Engine::Xz, Engine::Lz4, Engine::Zstd,
                        Engine::Zip, Engine::TarGzip}) {
        if (name == to_string(engine)) return engine;
    }
    if (name == "zst") return Engine::Zstd;
    if (name == "tar.gz" || name == "targz") return Engine::TarGzip;
    return std::nullopt;
}

} // namespace kmp::codec
