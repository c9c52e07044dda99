/**
 * @file main.cpp
 * @brief Headless Rift client driven by a scripted input pattern.
 *
 * Usage: rift_bot [--host H] [--port N]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/Client.hpp>
#include <rift/net/transport/UdpTransport.hpp>
#include <rift/engine/GameLoop.hpp>
#include <rift/engine/World.hpp>
#include <rift/core/Constants.hpp>
#include <rift/core/Log.hpp>

#include <charconv>
#include <csignal>
#include <cstring>
#include <string>
#include <string_view>

namespace {

rift::engine::GameLoop* g_loop = nullptr;

void onSignal(int)
{
    if (g_loop)
        g_loop->requestStop();
}

struct Options
{
    std::string     host{"127.0.0.1"};
    rift::core::u16 port{rift::core::kDefaultPort};
};

bool parseOptions(int argc, char* argv[], Options& options)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (i + 1 >= argc || (arg != "--host" && arg != "--port"))
        {
            rift::core::Log::error("usage: rift_bot [--host H] [--port N]");
            return false;
        }
        const char* value = argv[++i];
        if (arg == "--host")
        {
            options.host = value;
            continue;
        }
        const auto [end, ec] = std::from_chars(value, value + std::strlen(value), options.port);
        if (ec != std::errc{} || *end != '\0')
        {
            rift::core::Log::error("invalid port '" + std::string{value} + "'");
            return false;
        }
    }
    return true;
}

/// Walks back and forth, jumping and attacking on a fixed rhythm.
rift::net::protocol::InputCommand scripted(rift::core::Sequence sequence)
{
    using namespace rift;
    net::protocol::InputCommand command;
    command.sequence = sequence;
    command.move.x   = (sequence / 120) % 2 == 0 ? 1.0f : -1.0f;
    if (sequence % 90 == 0)
        command.actionFlags |= ecs::kActionJump;
    if (sequence % 45 == 0)
        command.actionFlags |= ecs::kActionAttack;
    if (sequence % 200 == 0)
        command.actionFlags |= ecs::kActionDash;
    return command;
}

} // namespace

int main(int argc, char* argv[])
{
    using namespace rift;

    Options options;
    if (!parseOptions(argc, argv, options))
        return 1;

    core::Log::info("=== Rift Bot ===");

    auto config = engine::Config::Builder{}.build();
    if (!config)
    {
        core::Log::error(config.error().message());
        return 1;
    }

    engine::World world{*config};
    net::transport::UdpClientTransport transport{options.host, options.port};
    if (auto opened = transport.open(); !opened)
    {
        core::Log::error("Bot init failed: " + opened.error().message());
        return 1;
    }

    net::Client client{world, transport};
    if (auto connecting = client.connect(); !connecting)
    {
        core::Log::error("connect failed: " + connecting.error().message());
        return 1;
    }

    engine::GameLoop loop{*config};
    g_loop = &loop;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    core::Sequence sequence = 0;
    core::Sequence reported = 0;
    engine::LoopCallbacks callbacks;
    callbacks.preFrame = [&client] { client.poll(); };
    callbacks.fixedUpdate = [&](core::f64) -> core::Expected<void> {
        if (!client.controlledEntity().isValid())
            return {};
        auto ticked = client.tick(scripted(sequence + 1));
        if (ticked || ticked.error().code() == core::ErrorCode::kTickOverrun)
            ++sequence;
        return ticked;
    };
    callbacks.render = [&](core::f64) {
        if (sequence == reported || sequence % 60 != 0)
            return;
        reported = sequence;
        if (auto shown = client.renderState(client.controlledEntity()))
        {
            core::Log::info("GAME", "seq " + std::to_string(sequence) + " at (" +
                                        std::to_string(shown->position.x) + ", " +
                                        std::to_string(shown->position.y) + ") " + std::string{shown->tag} +
                                        ", last replay " + std::to_string(client.lastReconcile().replayed));
        }
    };

    loop.run(callbacks);
    g_loop = nullptr;

    if (client.state() != net::ClientState::Disconnected)
    {
        if (auto left = client.disconnect(); !left)
            core::Log::warn("NET", "disconnect failed: " + left.error().message());
    }
    transport.close();
    core::Log::info("Bot exited cleanly");
    return 0;
}
