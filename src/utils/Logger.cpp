#include "utils/Logger.hpp"
#include <glib.h>
#include <string>
#include <vector>

namespace FeedScout {

static GLogLevelFlags toGLibLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return G_LOG_LEVEL_DEBUG;
        case LogLevel::Info: return G_LOG_LEVEL_INFO;
        case LogLevel::Warning: return G_LOG_LEVEL_WARNING;
        case LogLevel::Error: return G_LOG_LEVEL_CRITICAL;
    }
    return G_LOG_LEVEL_MESSAGE;
}

void GLibLogger::log(const LogEvent& event) {
    std::string message = event.event;
    if (!event.endpoint.empty()) message += " [" + event.endpoint + "]";
    if (!event.url.empty()) message += " " + event.url;
    if (event.elapsedMs >= 0) message += " (" + std::to_string(event.elapsedMs) + " ms)";
    if (!event.cause.empty()) message += ": " + event.cause;

    std::string elapsed = std::to_string(event.elapsedMs);
    std::vector<GLogField> fields = {
        {"GLIB_DOMAIN", "FeedScout", -1},
        {"MESSAGE", message.c_str(), -1},
        {"FEEDSCOUT_EVENT", event.event.c_str(), -1},
    };
    if (!event.endpoint.empty()) fields.push_back({"FEEDSCOUT_ENDPOINT", event.endpoint.c_str(), -1});
    if (!event.url.empty()) fields.push_back({"FEEDSCOUT_URL", event.url.c_str(), -1});
    if (!event.cause.empty()) fields.push_back({"FEEDSCOUT_CAUSE", event.cause.c_str(), -1});
    if (event.elapsedMs >= 0) fields.push_back({"FEEDSCOUT_ELAPSED_MS", elapsed.c_str(), -1});

    g_log_structured_array(toGLibLevel(event.level), fields.data(), fields.size());
}

}
