#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace Dockfix
{

enum struct MessageType
{
    Error = 1,
    Warning = 2,
    Info = 3,
    Log = 4,
};

std::string toString(MessageType type);

// Sink for diagnostic messages emitted by the fixer.
// The fixer never prints on its own; callers that want output hand one of these in.
struct FixLogger
{
    virtual ~FixLogger() = default;

    virtual void sendLogMessage(MessageType type, const std::string& message) = 0;
};

// Writes "[type] message" lines to a stream, dropping messages more verbose than `level`
class StreamLogger : public FixLogger
{
    std::ostream& output;
    MessageType level;
    std::mutex mutex;

public:
    explicit StreamLogger(std::ostream& output = std::cerr, MessageType level = MessageType::Info)
        : output(output)
        , level(level)
    {
    }

    void sendLogMessage(MessageType type, const std::string& message) override;
};

} // namespace Dockfix
