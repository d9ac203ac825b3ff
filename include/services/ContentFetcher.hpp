#pragma once
#include "services/FeedTypes.hpp"
#include <map>
#include <memory>
#include <string>

namespace FeedScout {

class CancellationToken;

struct FetchRequest {
    std::string url;
    long timeoutMs = 10000;
    std::map<std::string, std::string> headers;
    std::shared_ptr<CancellationToken> cancel;
};

struct FetchResponse {
    int statusCode = 0;
    std::string body;
    std::map<std::string, std::string> headers; // names lower-cased
    bool success = false;
    FetchError error;

    std::string header(const std::string& name) const;
};

// One HTTP GET. Never partially succeeds: any non-2xx status or transport
// failure comes back with success == false and a tagged error.
class ContentFetcher {
public:
    virtual ~ContentFetcher() = default;
    virtual FetchResponse fetch(const FetchRequest& request) = 0;
};

}
