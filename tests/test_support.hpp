// Shared fakes and helpers for the beaconpp GoogleTest suite
#pragma once

#include "beaconpp/DatagramSocket.hpp"
#include "beaconpp/Dispatcher.hpp"
#include "beaconpp/Logger.hpp"
#include "beaconpp/ServerHost.hpp"
#include "beaconpp/TextEncoding.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace beaconpp::test_support
{

/**
 * @brief Logger that keeps every entry, with its exception text, for later inspection.
 */
class RecordingLogger final : public Logger
{
  public:
    struct Entry
    {
        LogLevel level;
        std::string message;
        std::string exception; ///< describeException() text, empty if none.
    };

    void log(const LogLevel level, const std::string_view message, const std::exception* ex = nullptr) override
    {
        {
            const std::lock_guard lock(_mutex);
            _entries.push_back(Entry{level, std::string(message), ex ? describeException(*ex) : std::string()});
        }
        _cv.notify_all();
    }

    std::vector<Entry> entries() const
    {
        const std::lock_guard lock(_mutex);
        return _entries;
    }

    std::size_t count(const LogLevel level) const
    {
        const std::lock_guard lock(_mutex);
        return static_cast<std::size_t>(
            std::count_if(_entries.begin(), _entries.end(), [level](const Entry& e) { return e.level == level; }));
    }

    bool contains(const LogLevel level, const std::string& fragment) const
    {
        const std::lock_guard lock(_mutex);
        return std::any_of(_entries.begin(), _entries.end(), [&](const Entry& e)
                           { return e.level == level && e.message.find(fragment) != std::string::npos; });
    }

    /// Blocks until an entry of @p level containing @p fragment exists, or @p timeout elapses.
    bool waitFor(const LogLevel level, const std::string& fragment,
                 const std::chrono::milliseconds timeout = std::chrono::seconds(2)) const
    {
        std::unique_lock lock(_mutex);
        return _cv.wait_for(lock, timeout,
                            [&]
                            {
                                return std::any_of(_entries.begin(), _entries.end(), [&](const Entry& e) {
                                    return e.level == level && e.message.find(fragment) != std::string::npos;
                                });
                            });
    }

  private:
    mutable std::mutex _mutex;
    mutable std::condition_variable _cv;
    std::vector<Entry> _entries;
};

/**
 * @brief Scriptable ServerHost that records loopback requests.
 */
class FakeServerHost final : public ServerHost
{
  public:
    FakeServerHost(std::optional<std::string> url, std::string id, std::string name)
        : _url(std::move(url)), _id(std::move(id)), _name(std::move(name))
    {
    }

    std::optional<std::string> getLocalApiUrl() override
    {
        const std::lock_guard lock(_mutex);
        ++_urlQueries;
        return _url;
    }

    std::string systemId() const override { return _id; }
    std::string friendlyName() const override { return _name; }

    void enableLoopback(const std::string& argument) override
    {
        const std::lock_guard lock(_mutex);
        _loopbackRequests.push_back(argument);
    }

    std::vector<std::string> loopbackRequests() const
    {
        const std::lock_guard lock(_mutex);
        return _loopbackRequests;
    }

    int urlQueries() const
    {
        const std::lock_guard lock(_mutex);
        return _urlQueries;
    }

  private:
    mutable std::mutex _mutex;
    std::optional<std::string> _url;
    const std::string _id;
    const std::string _name;
    std::vector<std::string> _loopbackRequests;
    int _urlQueries = 0;
};

/**
 * @brief Executor that runs each task on the calling thread before returning.
 */
inline Executor inlineExecutor()
{
    return [](const std::function<void()>& task) { task(); };
}

/**
 * @brief Bytes of @p text in @p encoding, as a vector for convenient comparison.
 */
inline std::vector<std::byte> bytesOf(const std::string_view text, const TextEncoding encoding = TextEncoding::Utf8)
{
    return encodeText(text, encoding);
}

/**
 * @brief Waits up to @p timeoutMillis for one datagram on @p socket.
 * @return The received packet, or an empty optional on timeout.
 */
inline std::optional<DatagramPacket> receiveWithin(const DatagramSocket& socket, const int timeoutMillis = 2000)
{
    if (!socket.hasPendingData(timeoutMillis))
        return std::nullopt;
    DatagramPacket packet(MaxDatagramPayloadSafe);
    socket.receive(packet);
    return packet;
}

} // namespace beaconpp::test_support
