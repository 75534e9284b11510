#include "beaconpp/Logger.hpp"
#include "beaconpp/SocketException.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace beaconpp;

namespace
{

void appendCauses(std::string& out, const std::exception& ex)
{
    if (const auto* socketEx = dynamic_cast<const SocketException*>(&ex); socketEx && socketEx->getNestedException())
    {
        try
        {
            std::rethrow_exception(socketEx->getNestedException());
        }
        catch (const std::exception& cause)
        {
            out.append(": caused by: ").append(cause.what());
            appendCauses(out, cause);
            return;
        }
        catch (...)
        {
            out.append(": caused by: unknown exception");
            return;
        }
    }

    try
    {
        std::rethrow_if_nested(ex);
    }
    catch (const std::exception& cause)
    {
        out.append(": caused by: ").append(cause.what());
        appendCauses(out, cause);
    }
    catch (...)
    {
        out.append(": caused by: unknown exception");
    }
}

std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

} // namespace

std::string_view beaconpp::logLevelName(const LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

std::string beaconpp::describeException(const std::exception& ex)
{
    std::string text = ex.what();
    appendCauses(text, ex);
    return text;
}

ConsoleLogger::ConsoleLogger(const LogLevel minimumLevel) : ConsoleLogger(std::cerr, minimumLevel) {}

ConsoleLogger::ConsoleLogger(std::ostream& out, const LogLevel minimumLevel) : _out(out), _minimumLevel(minimumLevel) {}

void ConsoleLogger::log(const LogLevel level, const std::string_view message, const std::exception* ex)
{
    if (level < _minimumLevel)
        return;

    std::ostringstream line;
    line << timestamp() << " [" << logLevelName(level) << "] " << message;
    if (ex)
        line << ": " << describeException(*ex);
    line << '\n';

    const std::lock_guard lock(_mutex);
    _out << line.str() << std::flush;
}
