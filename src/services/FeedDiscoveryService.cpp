#include "services/FeedDiscoveryService.hpp"
#include "utils/CancellationToken.hpp"
#include "utils/TextUtils.hpp"
#include "utils/UrlUtils.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace FeedScout {

namespace {

const char* ACCEPT_FEEDS_AND_PAGES =
    "application/rss+xml, application/atom+xml, application/feed+json, application/xml;q=0.9, "
    "text/html;q=0.8, */*;q=0.5";

long elapsedSince(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

// Markup explicitly pointed at these; a miss is worth reporting.
bool isAdvertised(DiscoveryMethod method) {
    return method == DiscoveryMethod::LinkTag || method == DiscoveryMethod::MetaTag ||
           method == DiscoveryMethod::PlatformRule;
}

bool isNotFound(const FetchError& error) {
    return error.kind == FetchErrorKind::HttpError && (error.status == 404 || error.status == 410);
}

}

struct FeedDiscoveryService::Session {
    std::shared_ptr<CancellationToken> cancel;
    long timeoutOverrideMs = 0;
    std::mutex mutex;
    std::vector<FetchAttempt> attempts;

    void record(const FetchAttempt& attempt) {
        std::lock_guard<std::mutex> lock(mutex);
        attempts.push_back(attempt);
    }
    long timeout(long configured) const { return timeoutOverrideMs > 0 ? timeoutOverrideMs : configured; }
    bool cancelled() const { return cancel->isCancelled(); }
};

FeedDiscoveryService::FeedDiscoveryService(std::shared_ptr<ContentFetcher> fetcher,
                                           std::shared_ptr<ProxyFailoverManager> proxies,
                                           std::shared_ptr<FeedFormatParser> parser, std::shared_ptr<Logger> logger,
                                           DiscoveryOptions options)
    : fetcher_(std::move(fetcher)),
      proxies_(std::move(proxies)),
      parser_(std::move(parser)),
      logger_(std::move(logger)),
      options_(std::move(options)),
      sniffer_(options_.commonFeedPaths, options_.maxCandidates) {
    if (!fetcher_ || !proxies_ || !parser_) throw std::invalid_argument("discovery service needs a fetcher, relays and a parser");
    if (!logger_) logger_ = std::make_shared<NullLogger>();
    if (options_.maxConcurrentCandidates == 0) options_.maxConcurrentCandidates = 1;
}

DiscoveryResult FeedDiscoveryService::discoverFromWebsite(const std::string& url) {
    DiscoveryRequest request;
    request.url = url;
    return discover(request);
}

DiscoveryResult FeedDiscoveryService::discover(const DiscoveryRequest& request) {
    auto start = std::chrono::steady_clock::now();
    DiscoveryResult result;
    result.originalUrl = request.url;

    Session session;
    session.cancel = request.cancel ? request.cancel : std::make_shared<CancellationToken>();
    session.timeoutOverrideMs = request.timeoutMs;

    logger_->log({LogLevel::Info, "discovery.start", "", request.url, "", -1});
    try {
        run(TextUtils::trim(request.url), session, result);
    } catch (const std::exception& e) {
        logger_->log({LogLevel::Error, "discovery.error", "", request.url, e.what(), elapsedSince(start)});
        result.suggestions.push_back(
            {DiagnosticCode::InternalError, std::string("Discovery stopped unexpectedly: ") + e.what()});
    }
    if (result.discoveredFeeds.empty() && result.suggestions.empty()) {
        result.suggestions.push_back({DiagnosticCode::NoFeedFound, "No feed was found"});
    }

    {
        std::lock_guard<std::mutex> lock(session.mutex);
        result.totalAttempts = static_cast<int>(session.attempts.size());
        result.successfulAttempts = static_cast<int>(std::count_if(
            session.attempts.begin(), session.attempts.end(), [](const FetchAttempt& a) { return a.success; }));
    }
    result.discoveryTimeMs = elapsedSince(start);
    logger_->log({LogLevel::Info, "discovery.done", "", request.url,
                  std::to_string(result.discoveredFeeds.size()) + " feeds, " +
                      std::to_string(result.suggestions.size()) + " suggestions",
                  result.discoveryTimeMs});
    return result;
}

void FeedDiscoveryService::discoverAsync(const DiscoveryRequest& request,
                                         std::function<void(DiscoveryResult)> callback) {
    std::thread([this, request, callback]() {
        DiscoveryResult result = discover(request);
        if (callback) callback(std::move(result));
    }).detach();
}

void FeedDiscoveryService::run(const std::string& url, Session& session, DiscoveryResult& result) {
    if (!UrlUtils::isValidAbsoluteUrl(url)) {
        result.suggestions.push_back({DiagnosticCode::InvalidUrl, "\"" + url + "\" is not an absolute http(s) URL"});
        return;
    }
    if (session.cancelled()) {
        result.suggestions.push_back({DiagnosticCode::Cancelled, "Discovery was cancelled"});
        return;
    }

    Retrieval page = retrieve(url, session.timeout(options_.directTimeoutMs), session.timeout(options_.relayTimeoutMs),
                              true, session);
    if (!page.success) {
        if (page.cancelled) {
            result.suggestions.push_back({DiagnosticCode::Cancelled, "Discovery was cancelled"});
            return;
        }
        result.suggestions.push_back({DiagnosticCode::SiteUnreachable,
                                      "Could not reach " + UrlUtils::hostOf(url) + " (" +
                                          page.directError.describe() + ")"});
        result.suggestions.push_back({DiagnosticCode::AllRelaysFailed, page.relayError.summary()});
        return;
    }

    const std::string& body = page.response.body;
    std::string contentType = page.response.header("content-type");
    FeedParseResult parsed = parser_->parse(body, contentType, url);
    if (parsed.success) {
        parsed.feed.method = DiscoveryMethod::Direct;
        logger_->log({LogLevel::Info, "classify.feed", page.endpoint, url, feedFormatName(parsed.feed.format), -1});
        result.discoveredFeeds.push_back(std::move(parsed.feed));
        return;
    }
    if (!FeedLinkSniffer::looksLikeHtml(body, contentType)) {
        logger_->log({LogLevel::Info, "classify.unrecognized", page.endpoint, url, parsed.error, -1});
        result.suggestions.push_back({DiagnosticCode::UnrecognizedContent,
                                      "Content at " + url + " is neither a feed nor a web page (" + parsed.error +
                                          ")"});
        return;
    }
    logger_->log({LogLevel::Debug, "classify.html", page.endpoint, url, "", -1});

    std::vector<FeedCandidate> candidates = sniffer_.sniff(body, url);
    logger_->log({LogLevel::Info, "sniff.candidates", "", url, std::to_string(candidates.size()) + " candidates", -1});
    if (candidates.empty()) {
        result.suggestions.push_back(
            {DiagnosticCode::NoFeedFound, UrlUtils::hostOf(url) + " does not advertise a feed"});
        return;
    }

    std::vector<CandidateOutcome> outcomes = probeCandidates(candidates, session);
    size_t unreachable = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].isFeed) {
            result.discoveredFeeds.push_back(std::move(outcomes[i].feed));
        } else if (!outcomes[i].reached && isAdvertised(candidates[i].method)) {
            unreachable++;
        }
    }

    bool cancelled = session.cancelled();
    if (cancelled) {
        result.suggestions.push_back({DiagnosticCode::Cancelled, "Discovery was cancelled before all candidates were checked"});
    }
    if (unreachable > 0 && !cancelled) {
        result.suggestions.push_back({DiagnosticCode::CandidatesFailed,
                                      std::to_string(unreachable) + " advertised feed URL(s) could not be retrieved"});
    }
    if (result.discoveredFeeds.empty() && !cancelled) {
        result.suggestions.push_back({DiagnosticCode::NoFeedFound,
                                      "None of the " + std::to_string(candidates.size()) + " candidate URLs on " +
                                          UrlUtils::hostOf(url) + " is a feed"});
    }
    if (result.discoveredFeeds.size() > 1) {
        result.suggestions.push_back({DiagnosticCode::MultipleFeedsFound,
                                      "Found " + std::to_string(result.discoveredFeeds.size()) +
                                          " feeds; pick the one you want to follow"});
    }
}

FeedDiscoveryService::Retrieval FeedDiscoveryService::retrieve(const std::string& url, long directTimeoutMs,
                                                               long relayTimeoutMs, bool relayOnNotFound,
                                                               Session& session) {
    Retrieval retrieval;

    FetchRequest request;
    request.url = url;
    request.timeoutMs = directTimeoutMs;
    request.headers["Accept"] = ACCEPT_FEEDS_AND_PAGES;
    request.cancel = session.cancel;

    logger_->log({LogLevel::Debug, "fetch.attempt", "direct", url, "", -1});
    auto start = std::chrono::steady_clock::now();
    FetchResponse response = fetcher_->fetch(request);

    FetchAttempt attempt;
    attempt.endpoint = "direct";
    attempt.url = url;
    attempt.success = response.success;
    attempt.elapsedMs = elapsedSince(start);
    attempt.error = response.error;
    session.record(attempt);

    if (response.success) {
        logger_->log({LogLevel::Info, "fetch.succeeded", "direct", url, "", attempt.elapsedMs});
        retrieval.success = true;
        retrieval.endpoint = "direct";
        retrieval.response = std::move(response);
        return retrieval;
    }

    logger_->log({LogLevel::Info, "fetch.failed", "direct", url, response.error.describe(), attempt.elapsedMs});
    retrieval.directError = response.error;
    if (response.error.kind == FetchErrorKind::Cancelled || session.cancelled()) {
        retrieval.cancelled = true;
        return retrieval;
    }
    // The origin answered; a relay would only fetch the same 404
    if (!relayOnNotFound && isNotFound(response.error)) return retrieval;

    RelayOutcome relayed = proxies_->tryProxiesWithFailover(url, relayTimeoutMs, session.cancel);
    for (const auto& relayAttempt : relayed.attempts) session.record(relayAttempt);
    if (relayed.success) {
        retrieval.success = true;
        retrieval.endpoint = relayed.relayId;
        retrieval.response = std::move(relayed.response);
        return retrieval;
    }
    retrieval.relayError = relayed.error;
    retrieval.cancelled = relayed.error.cancelled() || session.cancelled();
    return retrieval;
}

std::vector<FeedDiscoveryService::CandidateOutcome> FeedDiscoveryService::probeCandidates(
    const std::vector<FeedCandidate>& candidates, Session& session) {
    std::vector<CandidateOutcome> outcomes;
    size_t window = options_.maxConcurrentCandidates;

    for (size_t first = 0; first < candidates.size(); first += window) {
        if (session.cancelled()) break;
        size_t last = std::min(candidates.size(), first + window);

        std::vector<std::future<CandidateOutcome>> pending;
        for (size_t i = first; i < last; ++i) {
            pending.push_back(std::async(std::launch::async, &FeedDiscoveryService::probeCandidate, this,
                                         std::cref(candidates[i]), std::ref(session)));
        }
        for (auto& future : pending) outcomes.push_back(future.get());
    }
    return outcomes;
}

FeedDiscoveryService::CandidateOutcome FeedDiscoveryService::probeCandidate(const FeedCandidate& candidate,
                                                                            Session& session) {
    CandidateOutcome outcome;
    long timeout = session.timeout(options_.candidateTimeoutMs);
    Retrieval retrieval = retrieve(candidate.url, timeout, timeout, false, session);
    if (!retrieval.success) {
        std::string cause = retrieval.relayError.empty() ? retrieval.directError.describe()
                                                         : retrieval.relayError.summary();
        logger_->log({LogLevel::Debug, "candidate.rejected", discoveryMethodName(candidate.method), candidate.url,
                      cause, -1});
        return outcome;
    }
    outcome.reached = true;

    // Candidates are leaves: an HTML answer is rejected, never sniffed again
    FeedParseResult parsed =
        parser_->parse(retrieval.response.body, retrieval.response.header("content-type"), candidate.url);
    if (!parsed.success) {
        logger_->log({LogLevel::Debug, "candidate.rejected", discoveryMethodName(candidate.method), candidate.url,
                      parsed.error, -1});
        return outcome;
    }

    parsed.feed.method = candidate.method;
    logger_->log({LogLevel::Info, "candidate.feed", discoveryMethodName(candidate.method), candidate.url,
                  feedFormatName(parsed.feed.format), -1});
    outcome.isFeed = true;
    outcome.feed = std::move(parsed.feed);
    return outcome;
}

}
