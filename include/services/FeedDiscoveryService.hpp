#pragma once
#include "services/ContentFetcher.hpp"
#include "services/FeedFormatParser.hpp"
#include "services/FeedLinkSniffer.hpp"
#include "services/FeedTypes.hpp"
#include "services/ProxyFailoverManager.hpp"
#include "utils/Logger.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace FeedScout {

struct DiscoveryOptions {
    long directTimeoutMs = 10000;
    long relayTimeoutMs = 10000;
    long candidateTimeoutMs = 10000;
    size_t maxConcurrentCandidates = 4;
    size_t maxCandidates = 12;
    std::vector<std::string> commonFeedPaths = {"/feed", "/rss", "/rss.xml", "/atom.xml", "/feed.xml", "/index.xml"};
};

class FeedDiscoveryService {
public:
    FeedDiscoveryService(std::shared_ptr<ContentFetcher> fetcher, std::shared_ptr<ProxyFailoverManager> proxies,
                         std::shared_ptr<FeedFormatParser> parser, std::shared_ptr<Logger> logger,
                         DiscoveryOptions options = DiscoveryOptions());

    // Never throws. Every failure ends up as a suggestion in the result.
    DiscoveryResult discoverFromWebsite(const std::string& url);
    DiscoveryResult discover(const DiscoveryRequest& request);

    // Runs discover() on a detached worker; the service must outlive the callback.
    void discoverAsync(const DiscoveryRequest& request, std::function<void(DiscoveryResult)> callback);

private:
    struct Session;

    struct Retrieval {
        bool success = false;
        bool cancelled = false;
        FetchResponse response;
        std::string endpoint;
        FetchError directError;
        AggregateRelayError relayError;
    };

    struct CandidateOutcome {
        bool reached = false;
        bool isFeed = false;
        ParsedFeed feed;
    };

    void run(const std::string& url, Session& session, DiscoveryResult& result);
    Retrieval retrieve(const std::string& url, long directTimeoutMs, long relayTimeoutMs, bool relayOnNotFound,
                       Session& session);
    std::vector<CandidateOutcome> probeCandidates(const std::vector<FeedCandidate>& candidates, Session& session);
    CandidateOutcome probeCandidate(const FeedCandidate& candidate, Session& session);

    std::shared_ptr<ContentFetcher> fetcher_;
    std::shared_ptr<ProxyFailoverManager> proxies_;
    std::shared_ptr<FeedFormatParser> parser_;
    std::shared_ptr<Logger> logger_;
    DiscoveryOptions options_;
    FeedLinkSniffer sniffer_;
};

}
