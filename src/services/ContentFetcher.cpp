#include "services/ContentFetcher.hpp"
#include <algorithm>
#include <cctype>

namespace FeedScout {

std::string FetchResponse::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), ::tolower);
    auto it = headers.find(key);
    return it == headers.end() ? "" : it->second;
}

}
