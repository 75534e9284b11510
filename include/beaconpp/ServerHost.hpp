/**
 * @file ServerHost.hpp
 * @brief The local service a responder describes, and a fixed-value implementation of it.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace beaconpp
{

/**
 * @class ServerHost
 * @ingroup discovery
 * @brief What the discovery responder needs to know about the service it advertises.
 *
 * Called concurrently from responder threads; implementations must be thread-safe.
 */
class ServerHost
{
  public:
    virtual ~ServerHost() = default;

    /**
     * @brief Externally reachable base URL of the service's API.
     *
     * May block (e.g. while interfaces are enumerated). Returns an empty optional, or an empty
     * string, while no reachable address is known; no reply is sent in that case.
     */
    [[nodiscard]] virtual std::optional<std::string> getLocalApiUrl() = 0;

    /**
     * @brief Unique, stable identifier of this service instance.
     */
    [[nodiscard]] virtual std::string systemId() const = 0;

    /**
     * @brief Human-readable name of this service instance.
     */
    [[nodiscard]] virtual std::string friendlyName() const = 0;

    /**
     * @brief Asks the service to treat @p argument (normally an address) as a loopback alias.
     */
    virtual void enableLoopback(const std::string& argument) = 0;
};

/**
 * @class StaticServerHost
 * @ingroup discovery
 * @brief ServerHost with a fixed URL, id and name that remembers every loopback alias requested.
 */
class StaticServerHost final : public ServerHost
{
  public:
    StaticServerHost(std::string localApiUrl, std::string systemId, std::string friendlyName);

    [[nodiscard]] std::optional<std::string> getLocalApiUrl() override;
    [[nodiscard]] std::string systemId() const override { return _systemId; }
    [[nodiscard]] std::string friendlyName() const override { return _friendlyName; }
    void enableLoopback(const std::string& argument) override;

    /**
     * @brief Replaces the advertised URL; an empty string makes the host report no address.
     */
    void setLocalApiUrl(std::string localApiUrl);

    /**
     * @brief Aliases passed to enableLoopback(), without duplicates, in first-seen order.
     */
    [[nodiscard]] std::vector<std::string> loopbackAliases() const;

  private:
    mutable std::mutex _mutex;
    std::string _localApiUrl;
    const std::string _systemId;
    const std::string _friendlyName;
    std::vector<std::string> _loopbackAliases;
};

} // namespace beaconpp
