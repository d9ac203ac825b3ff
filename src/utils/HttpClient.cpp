#include "utils/HttpClient.hpp"
#include "utils/CancellationToken.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace FeedScout {

namespace {

struct BodySink {
    std::string* body;
    size_t maxBytes;
    bool overflow;
};

std::once_flag curlInitFlag;

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<CancellationToken*>(clientp);
    return (token && token->isCancelled()) ? 1 : 0;
}

}

HttpClient::HttpClient()
    : userAgent_("FeedScout/1.0 (+feed discovery)"), maxBodyBytes_(8 * 1024 * 1024) {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<BodySink*>(userp);
    size_t total = size * nmemb;
    if (sink->body->size() + total > sink->maxBytes) {
        sink->overflow = true;
        return 0;
    }
    sink->body->append(static_cast<char*>(contents), total);
    return total;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string header(buffer, size * nitems);
    // A new status line starts another response of a redirect chain
    if (header.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return size * nitems;
    }
    size_t pos = header.find(':');
    if (pos != std::string::npos) {
        std::string key = header.substr(0, pos);
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        std::string val = header.substr(pos + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        val.erase(val.find_last_not_of(" \t\r\n") + 1);
        (*headers)[key] = val;
    }
    return size * nitems;
}

FetchResponse HttpClient::fetch(const FetchRequest& request) {
    FetchResponse response;
    if (request.cancel && request.cancel->isCancelled()) {
        response.error = {FetchErrorKind::Cancelled, 0, "cancelled before start"};
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = {FetchErrorKind::NetworkError, 0, "CURL init failed"};
        return response;
    }

    BodySink sink{&response.body, maxBodyBytes_, false};
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = 0;

    struct curl_slist* headerList = nullptr;
    for (const auto& h : request.headers) {
        std::string line = h.first + ": " + h.second;
        headerList = curl_slist_append(headerList, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (request.timeoutMs > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeoutMs);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.timeoutMs);
    }
    if (headerList) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    if (request.cancel) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.cancel.get());
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = (httpCode >= 200 && httpCode < 300);
        if (!response.success) {
            response.error = {FetchErrorKind::HttpError, response.statusCode, ""};
        }
    } else if (res == CURLE_OPERATION_TIMEDOUT) {
        response.error = {FetchErrorKind::TimeoutError, 0,
                          "no response within " + std::to_string(request.timeoutMs) + " ms"};
    } else if (res == CURLE_ABORTED_BY_CALLBACK) {
        response.error = {FetchErrorKind::Cancelled, 0, "transfer aborted"};
    } else if (res == CURLE_WRITE_ERROR && sink.overflow) {
        response.error = {FetchErrorKind::NetworkError, 0,
                          "response exceeds " + std::to_string(maxBodyBytes_) + " bytes"};
    } else {
        response.error = {FetchErrorKind::NetworkError, 0, errbuf[0] ? errbuf : curl_easy_strerror(res)};
    }
    if (!response.success) response.body.clear();

    if (headerList) curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setUserAgent(const std::string& ua) { userAgent_ = ua; }
void HttpClient::setMaxBodyBytes(size_t maxBytes) { maxBodyBytes_ = maxBytes; }

}
