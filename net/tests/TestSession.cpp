/**
 * @file TestSession.cpp
 * @brief Unit tests for net::session input buffering and lifecycle.
 */

#include <catch2/catch_test_macros.hpp>

#include "rift/net/session/SessionManager.hpp"

#include <vector>

namespace rift::net::session {

namespace {

protocol::InputCommand input(core::Sequence sequence, core::f32 moveX = 1.0f, core::u16 flags = ecs::kActionNone)
{
    return {.sequence = sequence, .tick = 0, .move = {moveX, 0.0f}, .actionFlags = flags};
}

} // namespace

TEST_CASE("Inputs are applied in sequence order", "[net][session]")
{
    Session session{1, 0};

    REQUIRE(session.pushInput(input(3)));
    REQUIRE(session.pushInput(input(1)));
    REQUIRE(session.pushInput(input(2)));
    REQUIRE(session.pendingInputs() == 3);

    REQUIRE(session.nextInput().sequence == 1);
    REQUIRE(session.nextInput().sequence == 2);
    REQUIRE(session.nextInput().sequence == 3);
    REQUIRE(session.lastAppliedSequence() == 3);
}

TEST_CASE("Duplicate and stale inputs are dropped", "[net][session]")
{
    Session session{1, 0};

    REQUIRE(session.pushInput(input(5)));
    REQUIRE_FALSE(session.pushInput(input(5)));

    (void)session.nextInput();
    REQUIRE_FALSE(session.pushInput(input(4)));
    REQUIRE_FALSE(session.pushInput(input(5)));
    REQUIRE(session.pushInput(input(6)));
}

TEST_CASE("Input buffer is bounded", "[net][session]")
{
    Session session{1, 0};
    for (core::Sequence seq = 1; seq <= core::kMaxBufferedInputs; ++seq)
    {
        REQUIRE(session.pushInput(input(seq)));
    }
    REQUIRE_FALSE(session.pushInput(input(core::kMaxBufferedInputs + 1)));
}

TEST_CASE("Starved session repeats the last move without actions", "[net][session]")
{
    Session session{1, 0};
    REQUIRE(session.pushInput(input(1, -1.0f, ecs::kActionAttack)));

    const auto applied = session.nextInput();
    REQUIRE(applied.actionFlags == ecs::kActionAttack);

    const auto repeated = session.nextInput();
    REQUIRE(repeated.sequence == 1);
    REQUIRE(repeated.move.x == -1.0f);
    REQUIRE(repeated.actionFlags == ecs::kActionNone);
}

TEST_CASE("Snapshot acknowledgements never go backwards", "[net][session]")
{
    Session session{1, 0};
    session.acknowledgeSnapshot(10);
    session.acknowledgeSnapshot(7);
    REQUIRE(session.ackedTick() == 10);

    REQUIRE_FALSE(session.lastFullSnapshot().has_value());
    session.markFullSnapshot(10);
    REQUIRE(session.lastFullSnapshot() == 10u);
}

TEST_CASE("Activity resets the malformed streak", "[net][session]")
{
    Session session{1, 0};
    REQUIRE(session.recordMalformed() == 1);
    REQUIRE(session.recordMalformed() == 2);
    session.touch(4);
    REQUIRE(session.consecutiveMalformed() == 0);
    REQUIRE(session.lastActivity() == 4);
}

// ========================================================================== //
//  Manager                                                                   //
// ========================================================================== //

TEST_CASE("Manager enforces capacity and uniqueness", "[net][session][manager]")
{
    SessionManager manager{2};

    REQUIRE(manager.connect(1, 0).has_value());
    auto again = manager.connect(1, 0);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyExists);

    REQUIRE(manager.connect(2, 0).has_value());
    auto full = manager.connect(3, 0);
    REQUIRE_FALSE(full.has_value());
    REQUIRE(full.error().code() == core::ErrorCode::kOutOfRange);

    REQUIRE(manager.disconnect(1).has_value());
    REQUIRE_FALSE(manager.disconnect(1).has_value());
    REQUIRE(manager.activeCount() == 1);
    REQUIRE(manager.connect(3, 0).has_value());
}

TEST_CASE("Idle sessions are reaped", "[net][session][manager]")
{
    SessionManager manager;
    REQUIRE(manager.connect(1, 0).has_value());
    REQUIRE(manager.connect(2, 0).has_value());
    manager.find(2)->touch(150);

    std::vector<core::ClientId> reaped;
    const auto count = manager.reapTimedOut(200, 180, [&](Session& s) { reaped.push_back(s.clientId()); });

    REQUIRE(count == 1);
    REQUIRE(reaped == std::vector<core::ClientId>{1});
    REQUIRE_FALSE(manager.contains(1));
    REQUIRE(manager.contains(2));
}

} // namespace rift::net::session
