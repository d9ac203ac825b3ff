#include "utils/TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace FeedScout {
namespace TextUtils {

std::string sanitizeUtf8(const std::string& input) {
    std::string result;
    const char* p = input.c_str();
    while (*p) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (c < 0x80) {
            result += *p;
            p++;
        } else if ((c & 0xE0) == 0xC0 && p[1]) {
            if ((p[1] & 0xC0) == 0x80) {
                result.append(p, 2);
                p += 2;
            } else {
                p++; // Skip invalid
            }
        } else if ((c & 0xF0) == 0xE0 && p[1] && p[2]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80) {
                result.append(p, 3);
                p += 3;
            } else {
                p++;
            }
        } else if ((c & 0xF8) == 0xF0 && p[1] && p[2] && p[3]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80 && (p[3] & 0xC0) == 0x80) {
                result.append(p, 4);
                p += 4;
            } else {
                p++;
            }
        } else {
            p++;
        }
    }
    return result;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    size_t end = s.find_last_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

static void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.length(), to);
        pos += to.length();
    }
}

std::string stripMarkup(const std::string& html) {
    std::string desc;
    desc.reserve(html.size());
    size_t pos = 0;
    while (pos < html.size()) {
        size_t lt = html.find('<', pos);
        size_t gt = (lt == std::string::npos) ? std::string::npos : html.find('>', lt + 1);
        // An unclosed '<' is text
        if (gt == std::string::npos) {
            desc.append(html, pos, std::string::npos);
            break;
        }
        desc.append(html, pos, lt - pos);
        desc.push_back(' ');
        pos = gt + 1;
    }
    replaceAll(desc, "&lt;", "<");
    replaceAll(desc, "&gt;", ">");
    replaceAll(desc, "&quot;", "\"");
    replaceAll(desc, "&nbsp;", " ");
    replaceAll(desc, "&#39;", "'");
    replaceAll(desc, "&apos;", "'");
    // last, so "&amp;lt;" stays "&lt;"
    replaceAll(desc, "&amp;", "&");

    std::string collapsed;
    collapsed.reserve(desc.size());
    bool inSpace = false;
    for (char c : desc) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            inSpace = true;
            continue;
        }
        if (inSpace && !collapsed.empty()) collapsed.push_back(' ');
        inSpace = false;
        collapsed.push_back(c);
    }
    return collapsed;
}

std::string extractImageFromHtml(const std::string& html) {
    const std::string lower = toLower(html);
    size_t tag = 0;
    while ((tag = lower.find("<img", tag)) != std::string::npos) {
        size_t tagEnd = lower.find('>', tag);
        bool closed = tagEnd != std::string::npos;
        if (!closed) tagEnd = lower.size();
        for (size_t src = tag + 5; src + 3 <= tagEnd; ++src) {
            if (lower.compare(src, 3, "src") != 0) continue;
            size_t p = src + 3;
            while (p < tagEnd && std::isspace(static_cast<unsigned char>(lower[p]))) ++p;
            if (p >= tagEnd || lower[p] != '=') continue;
            ++p;
            while (p < tagEnd && std::isspace(static_cast<unsigned char>(lower[p]))) ++p;
            if (p >= tagEnd || (lower[p] != '"' && lower[p] != '\'')) continue;
            size_t valueStart = p + 1;
            size_t valueEnd = html.find_first_of("\"'", valueStart);
            if (valueEnd == std::string::npos || valueEnd == valueStart) continue;
            return html.substr(valueStart, valueEnd - valueStart);
        }
        if (!closed) break;
        tag = tagEnd;
    }
    return "";
}

}
}
