/**
 * @file Log.cpp
 * @brief Severity filter, tick stamping and the default stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "rift/core/Log.hpp"

#include <cstdio>

namespace rift::core {

namespace {

thread_local std::optional<Tick> tCurrentTick;

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr const char* kLevelNames[] = {
            "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
        };
        const auto idx = static_cast<unsigned>(level);
        if (const auto tick = Log::currentTick())
        {
            std::fprintf(stderr, "[%s][%.*s][t%u] %.*s\n", kLevelNames[idx],
                         static_cast<int>(tag.size()), tag.data(), static_cast<unsigned>(*tick),
                         static_cast<int>(message.size()), message.data());
            return;
        }
        std::fprintf(stderr, "[%s][%.*s] %.*s\n", kLevelNames[idx],
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }
};

StderrLogger gDefaultLogger;
ILogger*     gActiveLogger = &gDefaultLogger;
LogLevel     gMinLevel     = LogLevel::kInfo;

} // anonymous namespace

Log::TickScope::TickScope(Tick tick) noexcept
    : _previous{tCurrentTick}
{
    tCurrentTick = tick;
}

Log::TickScope::~TickScope() { tCurrentTick = _previous; }

std::optional<Tick> Log::currentTick() noexcept { return tCurrentTick; }

void Log::setLogger(ILogger* logger)  { gActiveLogger = logger ? logger : &gDefaultLogger; }
void Log::setMinLevel(LogLevel level) { gMinLevel = level; }

bool Log::enabled(LogLevel level) { return level >= gMinLevel; }

void Log::write(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!enabled(level))
        return;
    gActiveLogger->write(level, tag, msg);
}

void Log::debug(std::string_view tag, std::string_view msg) { write(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { write(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { write(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { write(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { write(LogLevel::kFatal, tag, msg); }

} // namespace rift::core
