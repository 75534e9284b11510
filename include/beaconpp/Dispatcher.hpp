/**
 * @file Dispatcher.hpp
 * @brief Decodes inbound datagrams, selects a responder and launches it.
 */

#pragma once

#include "Logger.hpp"
#include "ResponderRegistry.hpp"
#include "TextEncoding.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace beaconpp
{

/**
 * @struct InboundMessage
 * @ingroup discovery
 * @brief One received datagram, as handed from the receive loop to the Dispatcher.
 */
struct InboundMessage
{
    std::vector<std::byte> bytes;
    std::string remoteEndpoint; ///< Sender as endpoint text (see formatEndpoint()).
};

/**
 * @struct DispatchSelection
 * @ingroup discovery
 * @brief The responder chosen for a datagram and the encoding it matched under.
 */
struct DispatchSelection
{
    ResponderMatch match;
    TextEncoding encoding = TextEncoding::Utf8;
};

/**
 * @brief Runs a unit of work somewhere other than the calling thread, without waiting for it.
 * @ingroup discovery
 */
using Executor = std::function<void(std::function<void()>)>;

/**
 * @brief Executor that starts a detached `std::thread` per task.
 * @ingroup discovery
 */
[[nodiscard]] Executor detachedThreadExecutor();

/**
 * @class Dispatcher
 * @ingroup discovery
 * @brief Routes each datagram to at most one responder.
 *
 * @details
 * The payload is decoded as UTF-8 and looked up in the registry; only if nothing matches is it
 * decoded as UTF-16LE and looked up again. The first match wins. A datagram that matches under
 * neither encoding is dropped without a log entry.
 *
 * The matched handler is launched through the Executor and never awaited: there is no
 * backpressure and no ordering between handlers, so replies may complete out of arrival order.
 * Exceptions thrown by a handler are logged on the handler's thread and go no further.
 */
class Dispatcher
{
  public:
    /**
     * @param registry Responders, frozen.
     * @param logger   Receives handler failures.
     * @param executor Where handlers run; defaults to one detached thread per datagram.
     *
     * @throws std::invalid_argument if @p registry or @p logger is null, or @p executor is empty.
     */
    Dispatcher(std::shared_ptr<const ResponderRegistry> registry, std::shared_ptr<Logger> logger,
               Executor executor = detachedThreadExecutor());

    /**
     * @brief Pure decode-and-match step: which responder, under which encoding, would handle @p bytes.
     */
    [[nodiscard]] std::optional<DispatchSelection> select(std::span<const std::byte> bytes) const;

    /**
     * @brief Selects a responder for @p message and launches it.
     *
     * @return `true` if a handler was launched, `false` if the datagram matched nothing.
     *
     * @throws Whatever the Executor throws when it cannot start the task (e.g. `std::system_error`).
     */
    bool dispatch(const InboundMessage& message) const;

  private:
    std::shared_ptr<const ResponderRegistry> _registry;
    std::shared_ptr<Logger> _logger;
    Executor _executor;
};

} // namespace beaconpp
