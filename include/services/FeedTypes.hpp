#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace FeedScout {

class CancellationToken;

enum class FeedFormat {
    Rss,
    Atom,
    JsonFeed
};

// How a feed ended up in a result
enum class DiscoveryMethod {
    Direct,
    LinkTag,
    MetaTag,
    AnchorScan,
    CommonPath,
    PlatformRule
};

struct FeedItem {
    std::string id;
    std::string title;
    std::string link;
    std::string description;
    std::string imageUrl;
    std::string author;
    std::string rawDate;
    std::optional<int64_t> publishedMs; // UTC epoch ms, empty when missing or unparsable
};

struct ParsedFeed {
    FeedFormat format = FeedFormat::Rss;
    std::string title;
    std::string link;
    std::string feedUrl;
    std::string description;
    DiscoveryMethod method = DiscoveryMethod::Direct;
    std::vector<FeedItem> items;
};

enum class FetchErrorKind {
    None,
    NetworkError,
    TimeoutError,
    HttpError,
    InvalidResponse,
    Cancelled
};

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::None;
    int status = 0;
    std::string message;

    std::string describe() const;
};

struct FetchAttempt {
    std::string endpoint; // "direct" or a relay id
    std::string url;
    bool success = false;
    long elapsedMs = 0;
    FetchError error;
};

struct DiscoveryRequest {
    std::string url;
    long timeoutMs = 0; // 0 keeps the configured per-phase timeouts
    std::shared_ptr<CancellationToken> cancel;
};

enum class DiagnosticCode {
    InvalidUrl,
    SiteUnreachable,
    AllRelaysFailed,
    NoFeedFound,
    UnrecognizedContent,
    CandidatesFailed,
    MultipleFeedsFound,
    Cancelled,
    InternalError
};

struct Suggestion {
    DiagnosticCode code;
    std::string text;
};

struct DiscoveryResult {
    std::string originalUrl;
    std::vector<ParsedFeed> discoveredFeeds;
    std::vector<Suggestion> suggestions;
    int totalAttempts = 0;
    int successfulAttempts = 0;
    long discoveryTimeMs = 0;
};

const char* feedFormatName(FeedFormat format);
const char* discoveryMethodName(DiscoveryMethod method);
const char* fetchErrorKindName(FetchErrorKind kind);
const char* diagnosticCodeName(DiagnosticCode code);

}
