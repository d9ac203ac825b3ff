#pragma once
#include <string>

namespace FeedScout {
namespace UrlUtils {

// http(s) scheme plus a host; anything else is rejected before any network call.
bool isValidAbsoluteUrl(const std::string& url);

// RFC 3986 reference resolution. Empty string when href cannot be resolved.
std::string resolveUrl(const std::string& base, const std::string& href);

// Dedup key: lower-cased scheme and host, default port, fragment and
// tracking parameters dropped, trailing slash trimmed.
std::string normalizeUrl(const std::string& url);

std::string hostOf(const std::string& url);
std::string originOf(const std::string& url);
std::string encodeComponent(const std::string& str);

}
}
