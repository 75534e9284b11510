#include "beaconpp/ServerHost.hpp"

#include <algorithm>
#include <utility>

using namespace beaconpp;

StaticServerHost::StaticServerHost(std::string localApiUrl, std::string systemId, std::string friendlyName)
    : _localApiUrl(std::move(localApiUrl)), _systemId(std::move(systemId)), _friendlyName(std::move(friendlyName))
{
}

std::optional<std::string> StaticServerHost::getLocalApiUrl()
{
    const std::lock_guard lock(_mutex);
    if (_localApiUrl.empty())
        return std::nullopt;
    return _localApiUrl;
}

void StaticServerHost::setLocalApiUrl(std::string localApiUrl)
{
    const std::lock_guard lock(_mutex);
    _localApiUrl = std::move(localApiUrl);
}

void StaticServerHost::enableLoopback(const std::string& argument)
{
    const std::lock_guard lock(_mutex);
    if (std::find(_loopbackAliases.begin(), _loopbackAliases.end(), argument) == _loopbackAliases.end())
        _loopbackAliases.push_back(argument);
}

std::vector<std::string> StaticServerHost::loopbackAliases() const
{
    const std::lock_guard lock(_mutex);
    return _loopbackAliases;
}
