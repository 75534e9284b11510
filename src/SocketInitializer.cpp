#include "beaconpp/SocketInitializer.hpp"
#include "beaconpp/SocketException.hpp"

#include <mutex>
#include <utility>

using namespace beaconpp;

namespace
{

std::mutex& initMutex()
{
    static std::mutex mutex;
    return mutex;
}

int liveInstances = 0;

} // namespace

SocketInitializer::SocketInitializer(std::shared_ptr<Logger> logger) : _logger(std::move(logger))
{
    if (!_logger)
        _logger = std::make_shared<ConsoleLogger>(LogLevel::Warn);

    const std::lock_guard lock(initMutex());
    if (liveInstances == 0 && InitSockets() != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
    ++liveInstances;
}

SocketInitializer::~SocketInitializer() noexcept
{
    const std::lock_guard lock(initMutex());
    if (--liveInstances > 0)
        return;

    if (CleanupSockets() != 0)
    {
        const int error = GetSocketError();
        const SocketException ex(error, SocketErrorMessage(error));
        _logger->error("Socket subsystem cleanup failed", ex);
    }
}

bool SocketInitializer::active() noexcept
{
    const std::lock_guard lock(initMutex());
    return liveInstances > 0;
}
