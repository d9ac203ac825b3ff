#include "utils/DateUtils.hpp"
#include <glib.h>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <regex>

namespace FeedScout {
namespace DateUtils {

// Longer input is not a date
static const size_t MAX_DATE_LENGTH = 64;

static const char* kShortMonths[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                     "jul", "aug", "sep", "oct", "nov", "dec"};

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

static int monthIndex(const std::string& name) {
    if (name.size() < 3) return -1;
    std::string key = name.substr(0, 3);
    for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (int i = 0; i < 12; ++i)
        if (key == kShortMonths[i]) return i + 1;
    return -1;
}

// Offset east of UTC in seconds. Unknown alphabetic zones count as -0000.
static bool zoneOffset(const std::string& zone, int& offset) {
    offset = 0;
    if (zone.empty()) return true;
    static const std::regex numeric(R"(^([+-])(\d\d):?(\d\d)$)");
    std::smatch m;
    if (std::regex_match(zone, m, numeric)) {
        int minutes = std::atoi(m[3].str().c_str());
        if (minutes > 59) return false;
        offset = std::atoi(m[2].str().c_str()) * 3600 + minutes * 60;
        if (m[1].str() == "-") offset = -offset;
        return true;
    }
    for (char c : zone)
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;

    std::string z = zone;
    for (auto& c : z) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (z == "EDT") offset = -4 * 3600;
    else if (z == "EST" || z == "CDT") offset = -5 * 3600;
    else if (z == "CST" || z == "MDT") offset = -6 * 3600;
    else if (z == "MST" || z == "PDT") offset = -7 * 3600;
    else if (z == "PST") offset = -8 * 3600;
    return true;
}

static std::optional<int64_t> toEpochMs(int year, int month, int day, int hour, int minute, int second, int offset) {
    if (second == 60) second = 59;
    GDateTime* dt = g_date_time_new_utc(year, month, day, hour, minute, second);
    if (!dt) return std::nullopt;
    int64_t ms = (static_cast<int64_t>(g_date_time_to_unix(dt)) - offset) * 1000;
    g_date_time_unref(dt);
    return ms;
}

std::optional<int64_t> parseRfc822(const std::string& text) {
    const std::string str = trim(text);
    if (str.empty() || str.size() > MAX_DATE_LENGTH) return std::nullopt;

    static const std::regex rfc(
        R"(^(?:([A-Za-z]+),?\s*)?(\d{1,2})(\s+|-)([A-Za-z]+)(\s+|-)(\d{2,4})\s+(\d{1,2}):(\d\d)(?::(\d\d))?(?:\s+(\S+))?$)");
    static const std::regex asctime(
        R"(^([A-Za-z]+)\s+([A-Za-z]+)\s+(\d{1,2})\s+(\d\d):(\d\d):(\d\d)\s+(\d{4})$)");

    std::smatch m;
    int year, month, day, hour, minute, second = 0, offset = 0;
    if (std::regex_match(str, m, rfc)) {
        if ((m[3].str() == "-") != (m[5].str() == "-")) return std::nullopt;
        day = std::atoi(m[2].str().c_str());
        month = monthIndex(m[4].str());
        year = std::atoi(m[6].str().c_str());
        if (m[6].length() < 4) year += (m[6].length() == 2 && year < 50) ? 2000 : 1900;
        hour = std::atoi(m[7].str().c_str());
        minute = std::atoi(m[8].str().c_str());
        if (m[9].matched) second = std::atoi(m[9].str().c_str());
        if (m[10].matched && !zoneOffset(m[10].str(), offset)) return std::nullopt;
    } else if (std::regex_match(str, m, asctime)) {
        month = monthIndex(m[2].str());
        day = std::atoi(m[3].str().c_str());
        hour = std::atoi(m[4].str().c_str());
        minute = std::atoi(m[5].str().c_str());
        second = std::atoi(m[6].str().c_str());
        year = std::atoi(m[7].str().c_str());
    } else {
        return std::nullopt;
    }
    if (month < 1) return std::nullopt;
    return toEpochMs(year, month, day, hour, minute, second, offset);
}

std::optional<int64_t> parseIso8601(const std::string& text) {
    std::string str = trim(text);
    if (str.empty() || str.size() > MAX_DATE_LENGTH) return std::nullopt;

    static const std::regex dateOnly(R"(^\d{4}-\d{2}-\d{2}$)");
    if (std::regex_match(str, dateOnly)) str += "T00:00:00Z";

    GTimeZone* utc = g_time_zone_new_utc();
    GDateTime* dt = g_date_time_new_from_iso8601(str.c_str(), utc);
    g_time_zone_unref(utc);
    if (!dt) return std::nullopt;
    int64_t ms = static_cast<int64_t>(g_date_time_to_unix(dt)) * 1000 + g_date_time_get_microsecond(dt) / 1000;
    g_date_time_unref(dt);
    return ms;
}

std::optional<int64_t> parseFeedDate(const std::string& text) {
    auto ms = parseRfc822(text);
    if (ms) return ms;
    return parseIso8601(text);
}

}
}
