#include "beaconpp/DiscoveryResponder.hpp"
#include "beaconpp/DiscoveryReply.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

using namespace beaconpp;

namespace
{

std::vector<std::string> splitOnPipe(const std::string& text)
{
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;)
    {
        const auto pos = text.find('|', start);
        if (pos == std::string::npos)
        {
            parts.emplace_back(text.substr(start));
            return parts;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

DiscoveryResponder::DiscoveryResponder(std::shared_ptr<ServerHost> host, std::shared_ptr<ReplySender> sender,
                                       std::shared_ptr<Logger> logger)
    : _host(std::move(host)), _sender(std::move(sender)), _logger(std::move(logger))
{
    if (!_host || !_sender || !_logger)
        throw std::invalid_argument("DiscoveryResponder: host, sender and logger must not be null");
}

void DiscoveryResponder::operator()(const std::string& matchedText, const std::string& remoteEndpoint,
                                    const TextEncoding encoding) const
{
    const auto parts = splitOnPipe(matchedText);

    const auto localUrl = _host->getLocalApiUrl();
    if (localUrl && !localUrl->empty())
    {
        const DiscoveryReply reply{*localUrl, _host->systemId(), _host->friendlyName()};
        const auto bytes = encodeText(serializeToString(reply), encoding);
        _sender->sendTo(bytes, remoteEndpoint);
    }
    else
    {
        _logger->warn("Unable to respond to udp request because the local ip address could not be determined.");
    }

    if (parts.size() > 1)
        _host->enableLoopback(parts[1]);
}
