#include "services/ProxyFailoverManager.hpp"
#include "utils/CancellationToken.hpp"
#include "utils/UrlUtils.hpp"
#include <json-glib/json-glib.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace FeedScout {

std::string RelayEndpoint::buildUrl(const std::string& targetUrl) const {
    std::string encoded = UrlUtils::encodeComponent(targetUrl);
    std::string url = urlTemplate;
    size_t pos = url.find("{url}");
    if (pos == std::string::npos) return url + encoded;
    return url.replace(pos, 5, encoded);
}

bool AggregateRelayError::cancelled() const {
    return !causes.empty() && causes.back().error.kind == FetchErrorKind::Cancelled;
}

std::string AggregateRelayError::summary() const {
    if (causes.empty()) return "no relay was tried";

    // Count per failure kind, in order of first appearance
    std::vector<std::pair<FetchErrorKind, int>> counts;
    for (const auto& cause : causes) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const std::pair<FetchErrorKind, int>& c) { return c.first == cause.error.kind; });
        if (it == counts.end()) counts.emplace_back(cause.error.kind, 1);
        else it->second++;
    }
    std::string detail;
    for (const auto& c : counts) {
        if (!detail.empty()) detail += ", ";
        detail += std::to_string(c.second) + " " + fetchErrorKindName(c.first);
    }
    std::string noun = causes.size() == 1 ? " relay failed (" : " relays failed (";
    return "All " + std::to_string(causes.size()) + noun + detail + ")";
}

RelayProxyManager::RelayProxyManager(std::shared_ptr<ContentFetcher> fetcher, std::vector<RelayEndpoint> relays,
                                     std::shared_ptr<Logger> logger)
    : fetcher_(std::move(fetcher)), logger_(std::move(logger)) {
    if (!fetcher_) throw std::invalid_argument("relay manager needs a content fetcher");
    if (!logger_) logger_ = std::make_shared<NullLogger>();

    for (auto& relay : relays) {
        if (relay.enabled && !relay.urlTemplate.empty()) relays_.push_back(std::move(relay));
    }
    if (relays_.empty()) throw std::invalid_argument("no enabled relay endpoints configured");
    std::stable_sort(relays_.begin(), relays_.end(),
                     [](const RelayEndpoint& a, const RelayEndpoint& b) { return a.priority < b.priority; });
}

bool RelayProxyManager::unwrap(const RelayEndpoint& relay, FetchResponse& response) {
    if (relay.unwrapJsonField.empty()) return true;

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;
    bool ok = false;
    if (!json_parser_load_from_data(parser, response.body.c_str(), static_cast<gssize>(response.body.size()), &error)) {
        response.error = {FetchErrorKind::InvalidResponse, 0,
                          std::string("relay payload is not JSON: ") + (error ? error->message : "")};
        if (error) g_error_free(error);
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    JsonObject* obj = (root && JSON_NODE_HOLDS_OBJECT(root)) ? json_node_get_object(root) : nullptr;
    JsonNode* field = (obj && json_object_has_member(obj, relay.unwrapJsonField.c_str()))
                          ? json_object_get_member(obj, relay.unwrapJsonField.c_str())
                          : nullptr;

    // Some relays report the origin status beside the payload
    JsonObject* status = nullptr;
    if (obj && json_object_has_member(obj, "status")) {
        JsonNode* statusNode = json_object_get_member(obj, "status");
        if (JSON_NODE_HOLDS_OBJECT(statusNode)) status = json_node_get_object(statusNode);
    }
    int originStatus = 0;
    if (status && json_object_has_member(status, "http_code")) {
        JsonNode* code = json_object_get_member(status, "http_code");
        if (JSON_NODE_HOLDS_VALUE(code) && json_node_get_value_type(code) == G_TYPE_INT64)
            originStatus = static_cast<int>(json_node_get_int(code));
    }

    if (originStatus != 0 && (originStatus < 200 || originStatus >= 300)) {
        response.error = {FetchErrorKind::HttpError, originStatus, "origin status reported by relay"};
    } else if (field && JSON_NODE_HOLDS_VALUE(field) && json_node_get_value_type(field) == G_TYPE_STRING) {
        const char* contents = json_node_get_string(field);
        response.body = contents ? contents : "";
        // The relay's JSON content type no longer describes the body
        response.headers.erase("content-type");
        ok = !response.body.empty();
        if (!ok) response.error = {FetchErrorKind::InvalidResponse, 0, "relay returned an empty payload"};
    } else {
        response.error = {FetchErrorKind::InvalidResponse, 0, "relay payload lacks \"" + relay.unwrapJsonField + "\""};
    }
    g_object_unref(parser);
    return ok;
}

RelayOutcome RelayProxyManager::tryProxiesWithFailover(const std::string& targetUrl, long timeoutMs,
                                                       const std::shared_ptr<CancellationToken>& cancel) {
    RelayOutcome outcome;

    for (const auto& relay : relays_) {
        if (cancel && cancel->isCancelled()) {
            outcome.error.causes.push_back({relay.id, {FetchErrorKind::Cancelled, 0, "cancelled"}, 0});
            break;
        }

        FetchRequest request;
        request.url = relay.buildUrl(targetUrl);
        request.timeoutMs = (relay.timeoutMs > 0 && (timeoutMs <= 0 || relay.timeoutMs < timeoutMs))
                                ? relay.timeoutMs
                                : timeoutMs;
        request.headers = relay.headers;
        request.cancel = cancel;

        logger_->log({LogLevel::Debug, "relay.attempt", relay.id, targetUrl, "", -1});
        auto start = std::chrono::steady_clock::now();
        FetchResponse response = fetcher_->fetch(request);
        bool ok = response.success && unwrap(relay, response);
        long elapsed = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                             std::chrono::steady_clock::now() - start).count());

        FetchAttempt attempt;
        attempt.endpoint = relay.id;
        attempt.url = targetUrl;
        attempt.success = ok;
        attempt.elapsedMs = elapsed;
        if (!ok) attempt.error = response.error;
        outcome.attempts.push_back(attempt);

        if (ok) {
            logger_->log({LogLevel::Info, "relay.succeeded", relay.id, targetUrl, "", elapsed});
            outcome.success = true;
            outcome.relayId = relay.id;
            outcome.response = std::move(response);
            return outcome;
        }

        logger_->log({LogLevel::Info, "relay.failed", relay.id, targetUrl, response.error.describe(), elapsed});
        outcome.error.causes.push_back({relay.id, response.error, elapsed});
        if (response.error.kind == FetchErrorKind::Cancelled) break;
    }

    logger_->log({LogLevel::Warning, "relay.exhausted", "", targetUrl, outcome.error.summary(), -1});
    return outcome;
}

}
