#include <catch2/catch_test_macros.hpp>
#include "codec/capabilities.hpp"
#include "core/config.hpp"

using namespace kmp;

TEST_CASE("Engine list splitting", "[config]") {
    CHECK(split_list("zstd,lz4") == std::vector<std::string>{"zstd", "lz4"});
    CHECK(split_list(" ZSTD , , Lz4 ,") == std::vector<std::string>{"zstd", "lz4"});
    CHECK(split_list("").empty());
    CHECK(split_list(" , ").empty());
}

TEST_CASE("Log level parsing", "[config]") {
    CHECK(parse_log_level("debug") == spdlog::level::debug);
    CHECK(parse_log_level("WARNING") == spdlog::level::warn);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("Config from raw settings", "[config]") {
    auto empty = parse_config(nullptr, nullptr);
    CHECK(empty.disabled_engines.empty());
    CHECK_FALSE(empty.log_level.has_value());

    auto config = parse_config("zstd", "trace");
    CHECK(config.disabled_engines == std::vector<std::string>{"zstd"});
    CHECK(config.log_level == spdlog::level::trace);

    // Unknown levels are dropped with a warning
    CHECK_FALSE(parse_config(nullptr, "chatty").log_level.has_value());
}

TEST_CASE("Applying config disables engines", "[config][codec]") {
    using codec::Engine;
    REQUIRE(codec::engine_available(Engine::Xz));

    Config config;
    config.disabled_engines = {"xz", "no-such-engine"};
    codec::apply_config(config);
    CHECK_FALSE(codec::engine_available(Engine::Xz));
    CHECK(codec::engine_available(Engine::Gzip));

    codec::set_engine_enabled(Engine::Xz, true);
    CHECK(codec::engine_available(Engine::Xz));
}

TEST_CASE("Engines not compiled in cannot be enabled", "[config][codec]") {
    using codec::Engine;
    CHECK(codec::engine_compiled_in(Engine::Gzip));
    CHECK(codec::engine_compiled_in(Engine::Zip));
    if (!codec::engine_compiled_in(Engine::Zstd)) {
        codec::set_engine_enabled(Engine::Zstd, true);
        CHECK_FALSE(codec::engine_available(Engine::Zstd));
    }
}
