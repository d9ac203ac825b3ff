#include "utils/UrlUtils.hpp"
#include <libxml/uri.h>
#include <libxml/xmlmemory.h>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace FeedScout {
namespace UrlUtils {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

static bool startsWith(const std::string& s, const std::string& p) {
    return s.rfind(p, 0) == 0;
}

bool isValidAbsoluteUrl(const std::string& url) {
    if (url.empty() || url.find_first_of(" \t\r\n") != std::string::npos) return false;
    xmlURIPtr uri = xmlParseURI(url.c_str());
    if (!uri) return false;
    bool valid = false;
    if (uri->scheme && uri->server && uri->server[0] != '\0') {
        std::string scheme = toLower(uri->scheme);
        valid = (scheme == "http" || scheme == "https");
    }
    xmlFreeURI(uri);
    return valid;
}

std::string resolveUrl(const std::string& base, const std::string& href) {
    std::string ref = trim(href);
    if (ref.empty()) return "";
    xmlChar* built = xmlBuildURI(reinterpret_cast<const xmlChar*>(ref.c_str()),
                                 reinterpret_cast<const xmlChar*>(base.c_str()));
    if (!built) return "";
    std::string result(reinterpret_cast<char*>(built));
    xmlFree(built);
    return result;
}

std::string hostOf(const std::string& url) {
    xmlURIPtr uri = xmlParseURI(url.c_str());
    if (!uri) return "";
    std::string host = uri->server ? toLower(uri->server) : "";
    xmlFreeURI(uri);
    return host;
}

std::string originOf(const std::string& url) {
    xmlURIPtr uri = xmlParseURI(url.c_str());
    if (!uri) return "";
    std::string origin;
    if (uri->scheme && uri->server) {
        origin = toLower(uri->scheme) + "://" + toLower(uri->server);
        if (uri->port > 0) origin += ":" + std::to_string(uri->port);
    }
    xmlFreeURI(uri);
    return origin;
}

std::string normalizeUrl(const std::string& in) {
    std::string url = trim(in);
    if (auto pos = url.find('#'); pos != std::string::npos) url.erase(pos);

    auto schemePos = url.find("://");
    if (schemePos == std::string::npos) return url;
    std::string scheme = toLower(url.substr(0, schemePos));
    std::string rest = url.substr(schemePos + 3);

    auto slash = rest.find_first_of("/?");
    std::string hostport = toLower(slash == std::string::npos ? rest : rest.substr(0, slash));
    std::string pathquery = (slash == std::string::npos) ? "" : rest.substr(slash);

    if (scheme == "http" && hostport.size() > 3 && hostport.compare(hostport.size() - 3, 3, ":80") == 0)
        hostport.erase(hostport.size() - 3);
    if (scheme == "https" && hostport.size() > 4 && hostport.compare(hostport.size() - 4, 4, ":443") == 0)
        hostport.erase(hostport.size() - 4);

    std::string path = pathquery;
    std::string query;
    if (auto qpos = pathquery.find('?'); qpos != std::string::npos) {
        path = pathquery.substr(0, qpos);
        query = pathquery.substr(qpos + 1);
    }
    if (path.empty()) path = "/";
    if (path.size() > 1 && path.back() == '/') path.pop_back();

    // drop utm_* and fbclid
    if (!query.empty()) {
        std::string outq;
        size_t start = 0;
        while (start < query.size()) {
            auto amp = query.find('&', start);
            auto part = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            if (!part.empty() && !(startsWith(part, "utm_") || startsWith(part, "fbclid="))) {
                if (!outq.empty()) outq.push_back('&');
                outq += part;
            }
            if (amp == std::string::npos) break;
            start = amp + 1;
        }
        query = outq;
    }

    std::string out = scheme + "://" + hostport + path;
    if (!query.empty()) out += "?" + query;
    return out;
}

std::string encodeComponent(const std::string& str) {
    std::string result;
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

}
}
