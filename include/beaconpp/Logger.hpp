/**
 * @file Logger.hpp
 * @brief Logging interface consumed by the discovery pipeline, with console and null sinks.
 */

#pragma once

#include <cstdint>
#include <exception>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace beaconpp
{

/**
 * @brief Severity of a log entry.
 * @ingroup core
 */
enum class LogLevel : std::uint8_t
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

/**
 * @brief Upper-case tag for a level ("DEBUG", "INFO", "WARN", "ERROR").
 * @ingroup core
 */
[[nodiscard]] std::string_view logLevelName(LogLevel level) noexcept;

/**
 * @brief Renders an exception for a log line.
 * @ingroup core
 *
 * Includes the nested cause of a SocketException, and the causes attached with
 * `std::throw_with_nested`, separated by `": caused by: "`.
 */
[[nodiscard]] std::string describeException(const std::exception& ex);

/**
 * @class Logger
 * @ingroup core
 * @brief Sink for the operational log of a responder.
 *
 * Implementations must be safe to call from several threads at once: the receive loop and every
 * in-flight responder log through the same instance.
 */
class Logger
{
  public:
    virtual ~Logger() = default;

    /**
     * @brief Records one entry.
     *
     * @param level   Severity.
     * @param message Text of the entry.
     * @param ex      Exception the entry is about, or `nullptr`.
     */
    virtual void log(LogLevel level, std::string_view message, const std::exception* ex = nullptr) = 0;

    void debug(const std::string_view message) { log(LogLevel::Debug, message); }
    void info(const std::string_view message) { log(LogLevel::Info, message); }
    void warn(const std::string_view message) { log(LogLevel::Warn, message); }
    void error(const std::string_view message) { log(LogLevel::Error, message); }
    void error(const std::string_view message, const std::exception& ex) { log(LogLevel::Error, message, &ex); }
};

/**
 * @class ConsoleLogger
 * @ingroup core
 * @brief Writes timestamped, level-tagged lines to a stream (stderr by default).
 *
 * Output format: `2026-10-19 14:03:11.042 [WARN] message: exception text`.
 */
class ConsoleLogger final : public Logger
{
  public:
    /**
     * @param minimumLevel Entries below this level are dropped.
     */
    explicit ConsoleLogger(LogLevel minimumLevel = LogLevel::Info);

    /**
     * @param out          Destination stream; must outlive the logger.
     * @param minimumLevel Entries below this level are dropped.
     */
    ConsoleLogger(std::ostream& out, LogLevel minimumLevel);

    void log(LogLevel level, std::string_view message, const std::exception* ex = nullptr) override;

  private:
    std::ostream& _out;
    LogLevel _minimumLevel;
    std::mutex _mutex;
};

/**
 * @class NullLogger
 * @ingroup core
 * @brief Discards every entry.
 */
class NullLogger final : public Logger
{
  public:
    void log(LogLevel, std::string_view, const std::exception* = nullptr) override {}
};

} // namespace beaconpp
