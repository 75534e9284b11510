/**
 * @file SocketDisposedException.hpp
 * @brief Exception class for operations on a closed socket in beaconpp.
 */

#pragma once

#include "common.hpp"
#include "SocketException.hpp"

namespace beaconpp
{

/**
 * @class SocketDisposedException
 * @ingroup exceptions
 * @brief Thrown when a socket operation runs against a socket that has been closed.
 *
 * A receive that is pending when DatagramSocket::close() is called from another thread fails with
 * this exception. The server's receive loop treats it as its termination signal rather than as an
 * error to report. Sends attempted after the close fail with it as well.
 *
 * Uses `EBADF` (POSIX) or `WSAENOTSOCK` (Windows) as the error code.
 *
 * ### Example
 * @code
 * try {
 *     socket.receive(packet);
 * } catch (const SocketDisposedException&) {
 *     return; // socket closed by stop()
 * }
 * @endcode
 */
class SocketDisposedException final : public SocketException
{
  public:
    /**
     * @brief Construct a new SocketDisposedException.
     * @param message Optional context, e.g. the operation that observed the close.
     */
    explicit SocketDisposedException(const std::string& message = "socket has been closed")
        : SocketException(BEACONPP_DISPOSED_CODE, message)
    {
    }
};

} // namespace beaconpp
