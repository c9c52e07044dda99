/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup (tests install a capturing
 * logger to assert on diagnostics).
 *
 * Messages emitted while a Log::TickScope is open on the calling thread are
 * stamped with that simulation tick, so server and client lines of the same
 * tick line up in a shared log.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_CORE_LOG_HPP
    #define RIFT_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace rift::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "NET", "ECS", "PHYS").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the simulation core.
 *
 * The façade is not synchronised: each process side logs from its own tick
 * thread, and an installed ILogger must be thread-safe if shared.
 */
class Log final {
public:
    Log() = delete;

    /**
     * @brief RAII marker for the simulation tick being processed on this
     *        thread.  Scopes nest; the innermost tick wins.
     */
    class TickScope final {
    public:
        explicit TickScope(Tick tick) noexcept;
        ~TickScope();

        TickScope(const TickScope&)            = delete;
        TickScope& operator=(const TickScope&) = delete;

    private:
        std::optional<Tick> _previous;
    };

    /** @brief Tick of the innermost open TickScope on this thread. */
    [[nodiscard]] static std::optional<Tick> currentTick() noexcept;

    static void setLogger(ILogger* logger);
    static void setMinLevel(LogLevel level);

    /** @brief Whether a message at @p level would reach the sink. */
    [[nodiscard]] static bool enabled(LogLevel level);

    static void write(LogLevel level, std::string_view tag, std::string_view msg);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("rift", msg); }
    static void info (std::string_view msg) { info ("rift", msg); }
    static void warn (std::string_view msg) { warn ("rift", msg); }
    static void error(std::string_view msg) { error("rift", msg); }
};

} // namespace rift::core

#endif // RIFT_CORE_LOG_HPP
