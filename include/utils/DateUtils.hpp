#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace FeedScout {
namespace DateUtils {

// RFC 822 / RFC 2822 dates as used by RSS pubDate, including obsolete zone
// names, two-digit years and the asctime form. Result is UTC epoch ms.
std::optional<int64_t> parseRfc822(const std::string& text);

// ISO 8601 / RFC 3339 as used by Atom and JSON Feed; a missing zone means UTC.
std::optional<int64_t> parseIso8601(const std::string& text);

// Tries both forms.
std::optional<int64_t> parseFeedDate(const std::string& text);

}
}
