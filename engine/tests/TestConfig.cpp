/**
 * @file TestConfig.cpp
 * @brief Unit tests for engine::Config and its Builder.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rift/engine/Config.hpp"

namespace rift::engine {

using Catch::Matchers::WithinAbs;

TEST_CASE("Defaults build and derive timing", "[engine][config]")
{
    auto config = Config::Builder{}.build();
    REQUIRE(config.has_value());

    REQUIRE(config->tickRate() == core::kTickRate);
    REQUIRE_THAT(config->fixedDeltaTime(), WithinAbs(1.0f / static_cast<core::f32>(core::kTickRate), 1e-7f));
    REQUIRE_THAT(config->tickBudgetSeconds(), WithinAbs(1.0 / core::kTickRate, 1e-9));
    REQUIRE_THAT(config->interpolationDelaySeconds(), WithinAbs(core::kInterpolationDelayMs / 1000.0, 1e-6));
    REQUIRE(config->clientTimeoutTicks() == gameplay::msToTicks(core::kClientTimeoutMs, core::kTickRate));
}

TEST_CASE("Character tuning follows the tick rate", "[engine][config]")
{
    auto config = Config::Builder{}.tickRate(30).inputBufferWindowMs(100.0f).build();
    REQUIRE(config.has_value());
    REQUIRE(config->character().inputBufferTicks == gameplay::msToTicks(100.0f, 30));

    gameplay::CharacterConfig custom;
    custom.moveSpeed = 10.0f;
    auto overridden = Config::Builder{}.character(custom).build();
    REQUIRE(overridden.has_value());
    REQUIRE(overridden->character().moveSpeed == 10.0f);
}

TEST_CASE("Explicit tick budget", "[engine][config]")
{
    auto config = Config::Builder{}.tickBudgetMs(4.0f).build();
    REQUIRE(config.has_value());
    REQUIRE_THAT(config->tickBudgetSeconds(), WithinAbs(0.004, 1e-9));
}

TEST_CASE("Invalid values are rejected", "[engine][config]")
{
    Config::Builder builder;

    SECTION("zero tick rate")             { builder.tickRate(0); }
    SECTION("empty world")                { builder.worldBounds({{0.0f, 0.0f}, {0.0f, 10.0f}}); }
    SECTION("zero cell size")             { builder.cellSize(0.0f); }
    SECTION("negative interpolation")     { builder.interpolationDelayMs(-1.0f); }
    SECTION("zero full snapshot interval") { builder.fullSnapshotInterval(0); }
    SECTION("zero client timeout")        { builder.clientTimeoutMs(0.0f); }
    SECTION("zero malformed threshold")   { builder.malformedThreshold(0); }
    SECTION("oversized prediction")       { builder.predictionHistory(core::kPredictionHistorySize + 1); }
    SECTION("single snapshot history")    { builder.snapshotHistory(1); }
    SECTION("no sessions")                { builder.maxSessions(0); }

    auto config = builder.build();
    REQUIRE_FALSE(config.has_value());
    REQUIRE(config.error().code() == core::ErrorCode::kInvalidArgument);
}

} // namespace rift::engine
