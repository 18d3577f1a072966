#include "Dockfix/Logger.hpp"

namespace Dockfix
{

std::string toString(MessageType type)
{
    switch (type)
    {
    case MessageType::Error:
        return "error";
    case MessageType::Warning:
        return "warning";
    case MessageType::Info:
        return "info";
    case MessageType::Log:
        return "log";
    }
    return "unknown";
}

void StreamLogger::sendLogMessage(MessageType type, const std::string& message)
{
    // Lower values are more severe
    if (static_cast<int>(type) > static_cast<int>(level))
        return;

    std::lock_guard<std::mutex> guard(mutex);
    output << "[" << toString(type) << "] " << message << "\n";
}

} // namespace Dockfix
