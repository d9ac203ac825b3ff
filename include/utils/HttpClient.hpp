#pragma once
#include "services/ContentFetcher.hpp"
#include <cstddef>
#include <string>

namespace FeedScout {

class HttpClient : public ContentFetcher {
public:
    HttpClient();

    FetchResponse fetch(const FetchRequest& request) override;
    void setUserAgent(const std::string& userAgent);
    void setMaxBodyBytes(size_t maxBytes);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    std::string userAgent_;
    size_t maxBodyBytes_;
};

}
