/**
 * @file main.cpp
 * @brief Rift dedicated server entry-point.
 *
 * Headless authoritative simulation over UDP.
 * Usage: rift_server [--port N]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/Server.hpp>
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

bool parsePort(int argc, char* argv[], rift::core::u16& port)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg != "--port" || i + 1 >= argc)
        {
            rift::core::Log::error("usage: rift_server [--port N]");
            return false;
        }
        const char* value = argv[++i];
        const auto [end, ec] = std::from_chars(value, value + std::strlen(value), port);
        if (ec != std::errc{} || *end != '\0')
        {
            rift::core::Log::error("invalid port '" + std::string{value} + "'");
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    using namespace rift;

    core::u16 port = core::kDefaultPort;
    if (!parsePort(argc, argv, port))
        return 1;

    core::Log::info("=== Rift Server ===");

    auto config = engine::Config::Builder{}.build();
    if (!config)
    {
        core::Log::error(config.error().message());
        return 1;
    }

    engine::World world{*config};
    const auto& bounds = config->worldBounds();
    const core::f32 width = bounds.max.x - bounds.min.x;
    for (int i = 0; i < 3; ++i)
    {
        const core::f32 left = bounds.min.x + width * (0.15f + 0.3f * static_cast<core::f32>(i));
        const core::f32 top  = bounds.min.y + 120.0f + 80.0f * static_cast<core::f32>(i % 2);
        if (auto platform = world.spawnPlatform({{left, top - 16.0f}, {left + width * 0.15f, top}}); !platform)
            core::Log::warn("GAME", "platform skipped: " + platform.error().message());
    }

    net::transport::UdpServerTransport transport{port};
    if (auto opened = transport.open(); !opened)
    {
        core::Log::error("Server init failed: " + opened.error().message());
        return 1;
    }

    net::Server server{world, transport};
    engine::GameLoop loop{*config};
    g_loop = &loop;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    engine::LoopCallbacks callbacks;
    callbacks.fixedUpdate = [&server](core::f64) { return server.tick(); };
    callbacks.onOverrun = [](const core::Error& error) { core::Log::debug("ENGINE", error.message()); };

    core::Log::info("listening on UDP port " + std::to_string(transport.port()));
    loop.run(callbacks);

    g_loop = nullptr;
    transport.close();
    core::Log::info("Server exited cleanly after " + std::to_string(world.tick()) + " ticks");
    return 0;
}
