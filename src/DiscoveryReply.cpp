#include "beaconpp/DiscoveryReply.hpp"

using namespace beaconpp;

void beaconpp::to_json(nlohmann::json& j, const DiscoveryReply& reply)
{
    j = nlohmann::json{{"Address", reply.address}, {"Id", reply.id}, {"Name", reply.name}};
}

void beaconpp::from_json(const nlohmann::json& j, DiscoveryReply& reply)
{
    j.at("Address").get_to(reply.address);
    j.at("Id").get_to(reply.id);
    j.at("Name").get_to(reply.name);
}

std::string beaconpp::serializeToString(const DiscoveryReply& reply)
{
    return nlohmann::json(reply).dump();
}

DiscoveryReply beaconpp::parseDiscoveryReply(const std::string& text)
{
    return nlohmann::json::parse(text).get<DiscoveryReply>();
}
