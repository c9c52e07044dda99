/**
 * @file TestNetcode.cpp
 * @brief Unit tests for prediction history, reconciliation and interpolation.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rift/net/netcode/Interpolator.hpp"
#include "rift/net/netcode/Reconciliation.hpp"
#include "rift/core/Log.hpp"

#include <string>
#include <vector>

namespace rift::net::netcode {

using Catch::Matchers::WithinAbs;

namespace {

constexpr core::f32 kStep = 4.0f;

PredictedState at(core::f32 x)
{
    PredictedState state;
    state.transform.position = {x, 0.0f};
    state.transform.velocity = {kStep * 60.0f, 0.0f};
    return state;
}

PredictedInput predicted(core::Sequence sequence, core::f32 x)
{
    PredictedInput entry;
    entry.sequence         = sequence;
    entry.command.sequence = sequence;
    entry.command.move     = {1.0f, 0.0f};
    entry.result           = at(x);
    return entry;
}

/// Tiny stand-in for the local world: moves kStep per replayed input.
struct FakeWorld
{
    PredictedState        current{};
    std::vector<core::Sequence> replayed;

    Reconciliation::ApplyStateCallback apply()
    {
        return [this](const PredictedState& state) { current = state; };
    }

    Reconciliation::ResimulateCallback resimulate()
    {
        return [this](const protocol::InputCommand& command) {
            replayed.push_back(command.sequence);
            current.transform.position.x += kStep * command.move.x;
            return current;
        };
    }
};

struct CaptureLogger final : public core::ILogger
{
    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        if (level == core::LogLevel::kDebug && tag == "NET")
            lines.emplace_back(message);
    }

    std::vector<std::string> lines;
};

} // namespace

// ========================================================================== //
//  Prediction                                                                //
// ========================================================================== //

TEST_CASE("Prediction keeps a bounded ordered history", "[net][prediction]")
{
    Prediction prediction{3};
    for (core::Sequence seq = 1; seq <= 5; ++seq)
    {
        prediction.push(predicted(seq, static_cast<core::f32>(seq) * kStep));
    }

    REQUIRE(prediction.pendingCount() == 3);
    REQUIRE(prediction[0].sequence == 3);
    REQUIRE(prediction.find(2) == nullptr);
    REQUIRE(prediction.find(4)->result.transform.position.x == 16.0f);

    prediction.discardBefore(5);
    REQUIRE(prediction.pendingCount() == 1);
    REQUIRE(prediction[0].sequence == 5);
}

TEST_CASE("Prediction limit is clamped", "[net][prediction]")
{
    REQUIRE(Prediction{0}.limit() == 1);
    REQUIRE(Prediction{100000}.limit() == core::kPredictionHistorySize);
}

// ========================================================================== //
//  Reconciliation                                                            //
// ========================================================================== //

TEST_CASE("Matching authoritative state replays nothing", "[net][reconciliation]")
{
    Prediction prediction;
    prediction.push(predicted(1, 4.0f));
    prediction.push(predicted(2, 8.0f));

    FakeWorld world;
    world.current = at(8.0f);
    Reconciliation reconciliation{prediction, 0.01f};

    const auto result = reconciliation.reconcile(at(4.005f), 1, world.apply(), world.resimulate());

    REQUIRE_FALSE(result.diverged);
    REQUIRE(result.replayed == 0);
    REQUIRE(world.replayed.empty());
    REQUIRE(world.current.transform.position.x == 8.0f);
    REQUIRE(prediction.pendingCount() == 2);
    REQUIRE(prediction.find(1)->result.transform.position.x == 4.0f);

    // Reconciling the same snapshot again changes nothing.
    const auto again = reconciliation.reconcile(at(4.005f), 1, world.apply(), world.resimulate());
    REQUIRE(again.replayed == 0);
    REQUIRE(prediction.pendingCount() == 2);
}

TEST_CASE("Divergence snaps to the server and replays later inputs", "[net][reconciliation]")
{
    Prediction prediction;
    prediction.push(predicted(1, 4.0f));
    prediction.push(predicted(2, 8.0f));
    prediction.push(predicted(3, 12.0f));

    FakeWorld world;
    world.current = at(12.0f);
    Reconciliation reconciliation{prediction, 0.01f};

    const auto result = reconciliation.reconcile(at(54.0f), 1, world.apply(), world.resimulate());

    REQUIRE(result.diverged);
    REQUIRE(result.replayed == 2);
    REQUIRE_THAT(result.positionError, WithinAbs(50.0f, 1e-4f));
    REQUIRE(world.replayed == std::vector<core::Sequence>{2, 3});
    REQUIRE(world.current.transform.position.x == 62.0f);
    REQUIRE(prediction.find(1)->result.transform.position.x == 54.0f);
    REQUIRE(prediction.find(2)->result.transform.position.x == 58.0f);
    REQUIRE(prediction.find(3)->result.transform.position.x == 62.0f);
}

TEST_CASE("Divergence keeps the local action buffer", "[net][reconciliation]")
{
    Prediction prediction;
    auto entry = predicted(1, 4.0f);
    REQUIRE(entry.result.character.actions.push({.action = ecs::kActionDash, .ticksLeft = 3}));
    prediction.push(entry);

    FakeWorld world;
    Reconciliation reconciliation{prediction, 0.01f};
    (void)reconciliation.reconcile(at(30.0f), 1, world.apply(), world.resimulate());

    REQUIRE(world.current.character.actions.size() == 1);
    REQUIRE(world.current.character.actions[0].action == ecs::kActionDash);
}

TEST_CASE("Divergence is reported at debug level", "[net][reconciliation]")
{
    CaptureLogger capture;
    core::Log::setLogger(&capture);
    core::Log::setMinLevel(core::LogLevel::kDebug);

    Prediction prediction;
    prediction.push(predicted(1, 4.0f));
    FakeWorld world;
    Reconciliation reconciliation{prediction, 0.01f};
    (void)reconciliation.reconcile(at(4.0f), 1, world.apply(), world.resimulate());
    REQUIRE(capture.lines.empty());

    (void)reconciliation.reconcile(at(9.0f), 1, world.apply(), world.resimulate());

    core::Log::setMinLevel(core::LogLevel::kInfo);
    core::Log::setLogger(nullptr);

    REQUIRE(capture.lines.size() == 1);
    REQUIRE(capture.lines[0].starts_with("ReconciliationDivergence"));
}

TEST_CASE("Without pending inputs the server state is adopted", "[net][reconciliation]")
{
    Prediction prediction;
    FakeWorld world;
    Reconciliation reconciliation{prediction, 0.01f};

    const auto result = reconciliation.reconcile(at(100.0f), 0, world.apply(), world.resimulate());
    REQUIRE_FALSE(result.diverged);
    REQUIRE(world.current.transform.position.x == 100.0f);
    REQUIRE(world.replayed.empty());
}

// ========================================================================== //
//  Interpolation                                                             //
// ========================================================================== //

TEST_CASE("Interpolator renders a fixed delay behind the server", "[net][interpolation]")
{
    Interpolator interpolator{0.1};
    ecs::Transform a;
    a.position = {0.0f, 0.0f};
    ecs::Transform b;
    b.position = {10.0f, 20.0f};

    interpolator.push(1, 1.0, a);
    interpolator.push(1, 1.2, b);

    auto middle = interpolator.sample(1, 1.2);
    REQUIRE(middle.has_value());
    REQUIRE_THAT(middle->position.x, WithinAbs(5.0f, 1e-4f));
    REQUIRE_THAT(middle->position.y, WithinAbs(10.0f, 1e-4f));
}

TEST_CASE("Interpolator never extrapolates", "[net][interpolation]")
{
    Interpolator interpolator{0.1};
    ecs::Transform a;
    a.position = {0.0f, 0.0f};
    ecs::Transform b;
    b.position = {10.0f, 0.0f};
    interpolator.push(7, 1.0, a);
    interpolator.push(7, 1.1, b);

    REQUIRE(interpolator.sample(7, 0.5)->position.x == 0.0f);
    REQUIRE(interpolator.sample(7, 5.0)->position.x == 10.0f);
    REQUIRE_FALSE(interpolator.sample(8, 1.0).has_value());
}

TEST_CASE("Interpolator ignores stale samples and forgets entities", "[net][interpolation]")
{
    Interpolator interpolator{0.0, 2};
    interpolator.push(1, 1.0, {});
    interpolator.push(1, 0.5, {});
    REQUIRE(interpolator.sampleCount(1) == 1);

    interpolator.push(1, 2.0, {});
    interpolator.push(1, 3.0, {});
    REQUIRE(interpolator.sampleCount(1) == 2);

    interpolator.remove(1);
    REQUIRE(interpolator.sampleCount(1) == 0);
}

} // namespace rift::net::netcode
