#pragma once
#include <string>

namespace FeedScout {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

struct LogEvent {
    LogLevel level = LogLevel::Info;
    std::string event;    // e.g. "relay.failed"
    std::string endpoint; // "direct", a relay id, or empty
    std::string url;
    std::string cause;
    long elapsedMs = -1;
};

class Logger {
public:
    virtual ~Logger() = default;
    virtual void log(const LogEvent& event) = 0;
};

// Structured records through g_log_structured under the "FeedScout" domain.
class GLibLogger : public Logger {
public:
    void log(const LogEvent& event) override;
};

class NullLogger : public Logger {
public:
    void log(const LogEvent&) override {}
};

}
