#pragma once
#include "services/ContentFetcher.hpp"
#include "services/FeedTypes.hpp"
#include "utils/Logger.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace FeedScout {

class CancellationToken;

struct RelayEndpoint {
    std::string id;
    std::string name;
    std::string urlTemplate;     // "{url}" is replaced by the encoded target; otherwise appended
    int priority = 0;            // lower is tried first
    bool enabled = true;
    long timeoutMs = 0;          // caps the per-call timeout when > 0
    std::map<std::string, std::string> headers;
    std::string unwrapJsonField; // relay wraps the payload in a JSON object, e.g. "contents"

    std::string buildUrl(const std::string& targetUrl) const;
};

struct RelayFailure {
    std::string relayId;
    FetchError error;
    long elapsedMs = 0;
};

// Every relay's cause, in the order the relays were tried.
struct AggregateRelayError {
    std::vector<RelayFailure> causes;

    bool empty() const { return causes.empty(); }
    bool cancelled() const;
    std::string summary() const;
};

struct RelayOutcome {
    bool success = false;
    FetchResponse response;
    std::string relayId;
    std::vector<FetchAttempt> attempts;
    AggregateRelayError error;
};

class ProxyFailoverManager {
public:
    virtual ~ProxyFailoverManager() = default;
    virtual RelayOutcome tryProxiesWithFailover(const std::string& targetUrl, long timeoutMs,
                                                const std::shared_ptr<CancellationToken>& cancel) = 0;
};

// Tries enabled relays in ascending priority, stops at the first success and
// never retries a relay within one call. The relay list is fixed at
// construction; an empty list is a configuration error.
class RelayProxyManager : public ProxyFailoverManager {
public:
    RelayProxyManager(std::shared_ptr<ContentFetcher> fetcher, std::vector<RelayEndpoint> relays,
                      std::shared_ptr<Logger> logger);

    RelayOutcome tryProxiesWithFailover(const std::string& targetUrl, long timeoutMs,
                                        const std::shared_ptr<CancellationToken>& cancel) override;
    const std::vector<RelayEndpoint>& relays() const { return relays_; }

private:
    static bool unwrap(const RelayEndpoint& relay, FetchResponse& response);

    std::shared_ptr<ContentFetcher> fetcher_;
    std::vector<RelayEndpoint> relays_;
    std::shared_ptr<Logger> logger_;
};

}
