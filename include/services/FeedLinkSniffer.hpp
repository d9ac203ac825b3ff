#pragma once
#include "services/FeedTypes.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace FeedScout {

struct FeedCandidate {
    std::string url;
    DiscoveryMethod method = DiscoveryMethod::LinkTag;
};

// Extracts candidate feed URLs from an HTML page. Candidates come back
// absolute, deduplicated by normalized URL, without the page itself and in
// priority order: platform rules, link tags, meta tags, then (only when the
// markup advertises nothing) feed-looking anchors and conventional paths.
class FeedLinkSniffer {
public:
    FeedLinkSniffer(std::vector<std::string> commonPaths, size_t maxCandidates);

    std::vector<FeedCandidate> sniff(const std::string& html, const std::string& pageUrl) const;

    static bool looksLikeHtml(const std::string& body, const std::string& contentType);

    // YouTube channel, user and playlist feeds derivable from the page URL or
    // from a channelId embedded in the page.
    static std::vector<std::string> platformFeedUrls(const std::string& pageUrl, const std::string& html);

private:
    std::vector<std::string> commonPaths_;
    size_t maxCandidates_;
};

}
