#pragma once
#include <string>

namespace FeedScout {
namespace TextUtils {

std::string sanitizeUtf8(const std::string& input);
std::string trim(const std::string& s);
std::string toLower(std::string s);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Tags removed, common entities decoded, whitespace trimmed.
std::string stripMarkup(const std::string& html);

// First <img src> in a markup fragment, empty if none.
std::string extractImageFromHtml(const std::string& html);

}
}
