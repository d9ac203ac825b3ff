#pragma once

#include "services/FeedTypes.hpp"
#include <memory>
#include <string>

namespace FeedScout {

class CancellationToken;

// Command-line front end: feedscout [--config FILE] [--timeout MS] [--json] [--verbose] URL
class Application {
public:
    Application();
    ~Application();

    int run(int argc, char* argv[]);

    static Application* getInstance();

private:
    static void onInterrupt(int signum);

    void printText(const DiscoveryResult& result) const;
    void printJson(const DiscoveryResult& result) const;

    std::shared_ptr<CancellationToken> cancel_;

    static Application* instance_;
};

} // namespace FeedScout
