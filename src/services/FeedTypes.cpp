#include "services/FeedTypes.hpp"

namespace FeedScout {

std::string FetchError::describe() const {
    switch (kind) {
        case FetchErrorKind::None: return "ok";
        case FetchErrorKind::HttpError: return "HTTP " + std::to_string(status);
        case FetchErrorKind::TimeoutError: return message.empty() ? "timed out" : "timed out: " + message;
        default: break;
    }
    std::string name = fetchErrorKindName(kind);
    return message.empty() ? name : name + ": " + message;
}

const char* feedFormatName(FeedFormat format) {
    switch (format) {
        case FeedFormat::Rss: return "rss";
        case FeedFormat::Atom: return "atom";
        case FeedFormat::JsonFeed: return "json";
    }
    return "unknown";
}

const char* discoveryMethodName(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::Direct: return "direct";
        case DiscoveryMethod::LinkTag: return "link-tag";
        case DiscoveryMethod::MetaTag: return "meta-tag";
        case DiscoveryMethod::AnchorScan: return "anchor-scan";
        case DiscoveryMethod::CommonPath: return "common-path";
        case DiscoveryMethod::PlatformRule: return "platform-rule";
    }
    return "unknown";
}

const char* fetchErrorKindName(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::None: return "none";
        case FetchErrorKind::NetworkError: return "network error";
        case FetchErrorKind::TimeoutError: return "timeout";
        case FetchErrorKind::HttpError: return "http error";
        case FetchErrorKind::InvalidResponse: return "invalid response";
        case FetchErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* diagnosticCodeName(DiagnosticCode code) {
    switch (code) {
        case DiagnosticCode::InvalidUrl: return "INVALID_URL";
        case DiagnosticCode::SiteUnreachable: return "SITE_UNREACHABLE";
        case DiagnosticCode::AllRelaysFailed: return "ALL_RELAYS_FAILED";
        case DiagnosticCode::NoFeedFound: return "NO_FEED_FOUND";
        case DiagnosticCode::UnrecognizedContent: return "UNRECOGNIZED_CONTENT";
        case DiagnosticCode::CandidatesFailed: return "CANDIDATES_FAILED";
        case DiagnosticCode::MultipleFeedsFound: return "MULTIPLE_FEEDS_FOUND";
        case DiagnosticCode::Cancelled: return "CANCELLED";
        case DiagnosticCode::InternalError: return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

}
