/**
 * @file SocketException.hpp
 * @brief Exception class for socket-related errors in beaconpp.
 */

#pragma once

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

namespace beaconpp
{

/**
 * @class SocketException
 * @ingroup exceptions
 * @brief Represents socket-related errors in the beaconpp library.
 *
 * SocketException is thrown whenever a socket operation fails (bind, send, receive, close, address
 * resolution) and for lifecycle misuse of the server (starting twice). It carries a platform error
 * code (errno, WSA error or EAI_* code) alongside the message, and optionally a nested cause.
 *
 * ### Example
 * @code
 * try {
 *     server.start(DefaultDiscoveryPort);
 * } catch (const SocketException& ex) {
 *     std::cerr << "Socket error (" << ex.getErrorCode() << "): " << ex.what() << std::endl;
 * }
 * @endcode
 */
class SocketException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs a SocketException with a message and no associated error code.
     *
     * Used for precondition and state failures that do not come from the operating system.
     */
    explicit SocketException(const std::string& message = "SocketException")
        : std::runtime_error(message), _errorCode(0)
    {
    }

    /**
     * @brief Constructs a SocketException with a platform error code and message.
     *
     * The resulting `what()` text is `"message (error code N)"`.
     *
     * @param code    Error code reported by the operating system.
     * @param message Description of the failure context.
     */
    explicit SocketException(int code, const std::string& message = "SocketException")
        : std::runtime_error(buildErrorMessage(message, code)), _errorCode(code)
    {
    }

    /**
     * @brief Constructs a SocketException with a message and a nested exception.
     *
     * @param message Descriptive message for the higher-level failure.
     * @param nested  The original cause, typically `std::current_exception()`.
     */
    SocketException(const std::string& message, std::exception_ptr nested)
        : std::runtime_error(message), _errorCode(0), _nested(nested)
    {
    }

    /**
     * @brief Retrieves the platform-specific error code associated with this exception.
     * @return The error code, or 0 if none was recorded.
     */
    [[nodiscard]] int getErrorCode() const noexcept { return _errorCode; }

    /**
     * @brief Retrieves the nested exception captured at construction time, if any.
     * @return The nested exception, or `nullptr`.
     */
    [[nodiscard]] std::exception_ptr getNestedException() const noexcept { return _nested; }

    ~SocketException() override = default;

  private:
    int _errorCode;             ///< Platform-specific error code (e.g., errno, WSA error).
    std::exception_ptr _nested; ///< Captured nested exception for chaining, if any.

    static std::string buildErrorMessage(const std::string& msg, const int code)
    {
        std::ostringstream oss;
        oss << msg << " (error code " << code << ")";
        return oss.str();
    }
};

} // namespace beaconpp
