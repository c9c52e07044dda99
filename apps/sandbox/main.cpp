/**
 * @file main.cpp
 * @brief In-process sandbox: one server and two scripted clients over a
 *        lossy, delayed loopback network.
 *
 * Runs ten simulated seconds and reports how far each client's predicted
 * character strayed from the authoritative one.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/Client.hpp>
#include <rift/net/Server.hpp>
#include <rift/net/transport/LoopbackNetwork.hpp>
#include <rift/engine/GameLoop.hpp>
#include <rift/engine/World.hpp>
#include <rift/math/Vec2.hpp>
#include <rift/core/Log.hpp>

#include <array>
#include <memory>
#include <string>

namespace {

using namespace rift;

constexpr core::u32 kLatencyTicks = 3;
constexpr core::u64 kRunTicks     = 600;

struct Player
{
    std::unique_ptr<net::transport::IClientTransport> link;
    std::unique_ptr<engine::World>                    world;
    std::unique_ptr<net::Client>                      client;
    core::Sequence                                    sequence{0};
    core::u32                                         replays{0};
};

net::protocol::InputCommand scripted(core::Sequence sequence, core::f32 direction)
{
    net::protocol::InputCommand command;
    command.sequence = sequence;
    command.move.x   = ((sequence / 100) % 2 == 0 ? 1.0f : -1.0f) * direction;
    if (sequence % 70 == 0)
        command.actionFlags |= ecs::kActionJump;
    if (sequence % 50 == 25)
        command.actionFlags |= ecs::kActionAttack;
    return command;
}

} // namespace

int main()
{
    core::Log::info("=== Rift Sandbox ===");

    auto config = engine::Config::Builder{}.tickBudgetMs(50.0f).build();
    if (!config)
    {
        core::Log::error(config.error().message());
        return 1;
    }

    net::transport::LoopbackNetwork network{kLatencyTicks};
    core::u64 sent = 0;
    network.setDropFilter([&sent](net::transport::LoopbackDirection, core::ClientId, std::span<const core::byte>) {
        return ++sent % 20 == 0;
    });

    auto serverLink = network.serverEndpoint();
    engine::World serverWorld{*config};
    if (auto floor = serverWorld.spawnPlatform({{600.0f, 140.0f}, {1000.0f, 160.0f}}); !floor)
        core::Log::warn("GAME", "platform skipped: " + floor.error().message());
    net::Server server{serverWorld, *serverLink};

    std::array<Player, 2> players;
    for (auto& player : players)
    {
        player.link   = network.clientEndpoint();
        player.world  = std::make_unique<engine::World>(*config);
        player.client = std::make_unique<net::Client>(*player.world, *player.link);
        if (auto connecting = player.client->connect(); !connecting)
        {
            core::Log::error("connect failed: " + connecting.error().message());
            return 1;
        }
    }

    engine::GameLoop loop{*config};
    engine::LoopCallbacks callbacks;
    callbacks.fixedUpdate = [&](core::f64) -> core::Expected<void> {
        for (core::usize i = 0; i < players.size(); ++i)
        {
            auto& player = players[i];
            const auto seen = player.client->lastSnapshotTick();
            player.client->poll();
            if (player.client->lastSnapshotTick() != seen && player.client->lastReconcile().diverged)
                player.replays += player.client->lastReconcile().replayed;
            if (!player.client->controlledEntity().isValid())
                continue;

            const core::f32 direction = i == 0 ? 1.0f : -1.0f;
            auto ticked = player.client->tick(scripted(player.sequence + 1, direction));
            if (!ticked && ticked.error().code() != core::ErrorCode::kTickOverrun)
                return ticked;
            ++player.sequence;
        }
        auto stepped = server.tick();
        network.advance();
        return stepped;
    };
    callbacks.postFrame = [&] {
        if (loop.tickCount() >= kRunTicks)
            loop.requestStop();
    };

    loop.run(callbacks);

    for (const auto& player : players)
    {
        const auto id = player.client->clientId();
        const auto* session = server.sessions().find(id);
        const auto shown = player.client->renderState(player.client->controlledEntity());
        if (!session || !shown)
        {
            core::Log::warn("GAME", "client " + std::to_string(id) + " never got its character");
            continue;
        }
        const auto* authoritative = serverWorld.registry().getComponent<ecs::Transform>(session->boundEntity());
        const core::f32 gap = authoritative ? math::distance(authoritative->position, shown->position) : 0.0f;

        core::usize visible = 0;
        player.client->forEachRenderable([&visible](ecs::EntityId, const net::RenderTransform&) { ++visible; });

        core::Log::info("GAME", "client " + std::to_string(id) + ": " + std::to_string(player.sequence) +
                                    " inputs, " + std::to_string(player.replays) + " replayed, " +
                                    std::to_string(visible) + " visible, " + std::to_string(gap) +
                                    " units ahead of the server, state " + std::string{shown->tag});
    }
    core::Log::info("Sandbox finished: " + std::to_string(serverWorld.tick()) + " server ticks, " +
                    std::to_string(network.dropped()) + " datagrams dropped, " +
                    std::to_string(server.malformedDropped()) + " malformed");
    return 0;
}
