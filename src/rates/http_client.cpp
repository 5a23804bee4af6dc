#include "rates/http_client.hpp"

#include <memory>
#include <utility>

namespace rates {
namespace {

constexpr long kConnectTimeoutMs = 10000;
constexpr long kMaxRedirects = 5;
constexpr const char* kUserAgent = "costbook/0.1";

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

HttpClient::HttpClient(long timeout_ms)
    : timeout_ms_(timeout_ms),
      global_initialized_(false) {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw HttpError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
    global_initialized_ = true;
}

HttpClient::~HttpClient() {
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

RequestTimings HttpClient::collect_timings(CURL* handle) const {
    RequestTimings timings;
    double value = 0.0;

    if (curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &value) == CURLE_OK) {
        timings.connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_APPCONNECT_TIME, &value) == CURLE_OK) {
        timings.app_connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &value) == CURLE_OK) {
        timings.total_ms = value * 1000.0;
    }

    return timings;
}

HttpResponse HttpClient::get(
    const std::string& url,
    const std::vector<std::pair<std::string, std::string>>& headers) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        throw HttpError("Failed to create CURL easy handle");
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, &curl_slist_free_all);
    for (const auto& [name, value] : headers) {
        auto* appended = curl_slist_append(header_list.get(), (name + ": " + value).c_str());
        if (!appended) {
            throw HttpError("Failed to build request headers for " + url);
        }
        header_list.release();
        header_list.reset(appended);
    }

    std::string response_body;
    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }

    const auto perform_code = curl_easy_perform(curl);
    if (perform_code != CURLE_OK) {
        throw HttpError("GET " + url + " failed: " + std::string(curl_easy_strerror(perform_code)));
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    if (status_code >= 400) {
        throw HttpError("HTTP " + std::to_string(status_code) + " for " + url, status_code);
    }

    return HttpResponse{status_code, std::move(response_body), collect_timings(curl)};
}

} // namespace rates
