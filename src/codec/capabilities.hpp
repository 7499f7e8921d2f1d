#pragma once

#include "codec/codec_kind.hpp"
#include "core/config.hpp"

namespace kmp::codec {

/// Whether the engine was compiled in and has not been disabled.
/// The table is built once per process on first use.
bool engine_available(Engine engine);

/// Whether support for the engine was compiled in at all.
bool engine_compiled_in(Engine engine);

/// Enable or disable an engine at run time. Enabling an engine that was not
/// compiled in has no effect.
void set_engine_enabled(Engine engine, bool enabled);

/// Disable every engine named in config.disabled_engines.
void apply_config(const Config& config);

} // namespace kmp::codec
