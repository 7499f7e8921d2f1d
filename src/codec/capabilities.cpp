#include "codec/capabilities.hpp"

#include <array>
#include <atomic>
#include <spdlog/spdlog.h>

namespace kmp::codec {

namespace {

constexpr size_t kEngineCount = static_cast<size_t>(Engine::TarGzip) + 1;

struct CapabilityTable {
    std::array<std::atomic<bool>, kEngineCount> enabled;

    CapabilityTable() {
        for (size_t i = 0; i < kEngineCount; i++) {
            enabled[i] = engine_compiled_in(static_cast<Engine>(i));
        }
    }

    std::atomic<bool>& operator[](size_t i) { return enabled[i]; }
};

CapabilityTable& table() {
    static CapabilityTable caps;
    return caps;
}

} // namespace

bool engine_compiled_in(Engine engine) {
    switch (engine) {
    case Engine::None:
    case Engine::Gzip:
    case Engine::Xz:
    case Engine::Zip:
    case Engine::TarGzip:
        return true;
    case Engine::Lz4:
#ifdef KOMPRESS_HAVE_LZ4
        return true;
#else
        return false;
#endif
    case Engine::Zstd:
#ifdef KOMPRESS_HAVE_ZSTD
        return true;
#else
        return false;
#endif
    }
    return false;
}

bool engine_available(Engine engine) {
    return table()[static_cast<size_t>(engine)].load();
}

void set_engine_enabled(Engine engine, bool enabled) {
    bool value = enabled && engine_compiled_in(engine);
    table()[static_cast<size_t>(engine)].store(value);
    spdlog::debug("engine {}: {}", to_string(engine),
                  value ? "enabled" : "disabled");
}

void apply_config(const Config& config) {
    for (const auto& name : config.disabled_engines) {
        auto engine = engine_from_string(name);
        if (!engine) {
            spdlog::warn("Ignoring unknown engine '{}'", name);
            continue;
        }
        set_engine_enabled(*engine, false);
    }
}

} // namespace kmp::codec
