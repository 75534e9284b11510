/**
 * @file DiscoveryReply.hpp
 * @brief The JSON descriptor sent in answer to a discovery probe.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace beaconpp
{

/**
 * @struct DiscoveryReply
 * @ingroup discovery
 * @brief Identifies one service instance to a probing client.
 *
 * Serialized as `{"Address": "...", "Id": "...", "Name": "..."}`.
 */
struct DiscoveryReply
{
    std::string address; ///< Base URL of the service's API.
    std::string id;      ///< Unique id of the service instance.
    std::string name;    ///< Friendly name of the service instance.

    bool operator==(const DiscoveryReply&) const = default;
};

void to_json(nlohmann::json& j, const DiscoveryReply& reply);

/**
 * @throws nlohmann::json::exception if a field is missing or not a string.
 */
void from_json(const nlohmann::json& j, DiscoveryReply& reply);

/**
 * @brief Serializes a reply to compact JSON text.
 * @ingroup discovery
 */
[[nodiscard]] std::string serializeToString(const DiscoveryReply& reply);

/**
 * @brief Parses JSON text produced by serializeToString().
 * @ingroup discovery
 *
 * @throws nlohmann::json::exception on malformed input.
 */
[[nodiscard]] DiscoveryReply parseDiscoveryReply(const std::string& text);

} // namespace beaconpp
