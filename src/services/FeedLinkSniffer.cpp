#include "services/FeedLinkSniffer.hpp"
#include "utils/HtmlParser.hpp"
#include "utils/TextUtils.hpp"
#include "utils/UrlUtils.hpp"
#include <cctype>
#include <regex>
#include <set>
#include <sstream>
#include <utility>

namespace FeedScout {

namespace {

const char* YOUTUBE_FEED_BASE = "https://www.youtube.com/feeds/videos.xml";

bool hasToken(const std::string& list, const std::string& token) {
    std::istringstream in(TextUtils::toLower(list));
    std::string word;
    while (in >> word) {
        if (word == token) return true;
    }
    return false;
}

bool isFeedType(const std::string& type) {
    std::string t = TextUtils::toLower(TextUtils::trim(type.substr(0, type.find(';'))));
    return t == "application/rss+xml" || t == "application/atom+xml" || t == "application/rdf+xml" ||
           t == "application/feed+json" || t.find("rss") != std::string::npos ||
           t.find("atom") != std::string::npos;
}

std::string attr(const std::map<std::string, std::string>& attrs, const char* name) {
    auto it = attrs.find(name);
    return it == attrs.end() ? "" : TextUtils::trim(it->second);
}

bool isYouTube(const std::string& host) {
    return host == "youtube.com" || host == "youtu.be" ||
           (host.size() > 12 && host.compare(host.size() - 12, 12, ".youtube.com") == 0);
}

bool isIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// First "channelId": "UC..." pair in inline page data.
std::string channelIdFromScript(const std::string& html) {
    const std::string key = "\"channelId\"";
    size_t pos = 0;
    while ((pos = html.find(key, pos)) != std::string::npos) {
        pos += key.size();
        size_t p = pos;
        while (p < html.size() && std::isspace(static_cast<unsigned char>(html[p]))) ++p;
        if (p >= html.size() || html[p] != ':') continue;
        ++p;
        while (p < html.size() && std::isspace(static_cast<unsigned char>(html[p]))) ++p;
        if (p >= html.size() || html[p] != '"' || html.compare(p + 1, 2, "UC") != 0) continue;
        size_t start = p + 1;
        size_t end = start + 2;
        while (end < html.size() && isIdChar(html[end])) ++end;
        if (end < html.size() && html[end] == '"') return html.substr(start, end - start);
    }
    return "";
}

class CandidateList {
public:
    CandidateList(const std::string& pageUrl, size_t cap) : cap_(cap) {
        seen_.insert(UrlUtils::normalizeUrl(pageUrl));
    }

    void add(const std::string& url, DiscoveryMethod method) {
        if (full() || url.empty() || !UrlUtils::isValidAbsoluteUrl(url)) return;
        if (!seen_.insert(UrlUtils::normalizeUrl(url)).second) return;
        items_.push_back({url, method});
    }

    bool full() const { return items_.size() >= cap_; }
    size_t size() const { return items_.size(); }
    std::vector<FeedCandidate> take() { return std::move(items_); }

private:
    size_t cap_;
    std::set<std::string> seen_;
    std::vector<FeedCandidate> items_;
};

}

FeedLinkSniffer::FeedLinkSniffer(std::vector<std::string> commonPaths, size_t maxCandidates)
    : commonPaths_(std::move(commonPaths)), maxCandidates_(maxCandidates) {}

bool FeedLinkSniffer::looksLikeHtml(const std::string& body, const std::string& contentType) {
    if (TextUtils::containsIgnoreCase(contentType, "html")) return true;
    std::string head = TextUtils::toLower(body.substr(0, 1024));
    return head.find("<!doctype html") != std::string::npos || head.find("<html") != std::string::npos ||
           head.find("<head") != std::string::npos;
}

std::vector<std::string> FeedLinkSniffer::platformFeedUrls(const std::string& pageUrl, const std::string& html) {
    std::vector<std::string> urls;
    if (!isYouTube(UrlUtils::hostOf(pageUrl))) return urls;

    static const std::regex channelPath(R"(/channel/(UC[\w-]+))");
    static const std::regex userPath(R"(/user/([\w-]+))");
    static const std::regex playlistParam(R"([?&]list=(PL[\w-]+))");

    std::smatch m;
    if (std::regex_search(pageUrl, m, channelPath)) {
        urls.push_back(std::string(YOUTUBE_FEED_BASE) + "?channel_id=" + m[1].str());
    } else if (std::regex_search(pageUrl, m, userPath)) {
        urls.push_back(std::string(YOUTUBE_FEED_BASE) + "?user=" + m[1].str());
    }
    if (std::regex_search(pageUrl, m, playlistParam)) {
        urls.push_back(std::string(YOUTUBE_FEED_BASE) + "?playlist_id=" + m[1].str());
    }
    if (!urls.empty() || html.empty()) return urls;

    // Handle and custom URLs only reveal the channel inside the page
    HtmlParser parser;
    std::string channelId;
    if (parser.parse(html)) channelId = parser.getAttribute("//meta[@itemprop='channelId']", "content");
    if (channelId.empty()) channelId = channelIdFromScript(html);
    if (!channelId.empty()) urls.push_back(std::string(YOUTUBE_FEED_BASE) + "?channel_id=" + channelId);
    return urls;
}

std::vector<FeedCandidate> FeedLinkSniffer::sniff(const std::string& html, const std::string& pageUrl) const {
    CandidateList candidates(pageUrl, maxCandidates_);
    for (const auto& url : platformFeedUrls(pageUrl, html)) candidates.add(url, DiscoveryMethod::PlatformRule);

    HtmlParser parser;
    if (!parser.parse(html)) return candidates.take();

    size_t beforeMarkup = candidates.size();
    for (const auto& link : parser.getElements("//link[@href]")) {
        std::string rel = attr(link, "rel");
        if (!rel.empty() && !hasToken(rel, "alternate")) continue;
        if (!isFeedType(attr(link, "type"))) continue;
        candidates.add(UrlUtils::resolveUrl(pageUrl, attr(link, "href")), DiscoveryMethod::LinkTag);
    }

    for (const auto& meta : parser.getElements("//meta[@content]")) {
        std::string name = TextUtils::toLower(attr(meta, "name"));
        std::string property = TextUtils::toLower(attr(meta, "property"));
        if (name != "rss" && name != "feed" && property != "og:rss") continue;
        candidates.add(UrlUtils::resolveUrl(pageUrl, attr(meta, "content")), DiscoveryMethod::MetaTag);
    }

    if (candidates.size() > beforeMarkup) return candidates.take();

    for (const auto& anchor : parser.getElements("//a[@href]")) {
        std::string href = attr(anchor, "href");
        std::string lower = TextUtils::toLower(href);
        if (lower.rfind("javascript:", 0) == 0 || lower.rfind("mailto:", 0) == 0) continue;
        if (lower.find("rss") == std::string::npos && lower.find("feed") == std::string::npos &&
            lower.find("atom") == std::string::npos) {
            continue;
        }
        candidates.add(UrlUtils::resolveUrl(pageUrl, href), DiscoveryMethod::AnchorScan);
    }

    std::string origin = UrlUtils::originOf(pageUrl);
    for (const auto& path : commonPaths_) {
        if (candidates.full()) break;
        candidates.add(UrlUtils::resolveUrl(origin + "/", path), DiscoveryMethod::CommonPath);
    }
    return candidates.take();
}

}
