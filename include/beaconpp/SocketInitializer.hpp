/**
 * @file SocketInitializer.hpp
 * @brief Process-wide socket subsystem lifetime for beaconpp programs.
 */

#pragma once

#include "common.hpp"
#include "Logger.hpp"

#include <memory>

namespace beaconpp
{

/**
 * @class SocketInitializer
 * @ingroup core
 * @brief Keeps the platform socket subsystem up for as long as an instance exists.
 *
 * On Windows the first live instance calls WSAStartup and the last one calls WSACleanup; on POSIX
 * the instances only keep count. Instances nest, so a test fixture and a demo `main()` can each
 * hold one. Create one before starting a UdpServer and keep it alive while the server runs.
 */
class SocketInitializer
{
  public:
    /**
     * @param logger Receives cleanup failures; `nullptr` reports them through a ConsoleLogger.
     * @throws SocketException if the subsystem cannot be initialized.
     */
    explicit SocketInitializer(std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Releases this instance's hold; the last one shuts the subsystem down.
     * @note Cleanup failures are logged, never thrown.
     */
    ~SocketInitializer() noexcept;

    SocketInitializer(const SocketInitializer& rhs) = delete;
    SocketInitializer& operator=(const SocketInitializer& rhs) = delete;

    /**
     * @brief Whether any SocketInitializer is currently alive in this process.
     */
    [[nodiscard]] static bool active() noexcept;

  private:
    std::shared_ptr<Logger> _logger;
};

} // namespace beaconpp
