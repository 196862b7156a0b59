/**
 * @file curl_http_client.cpp
 * @brief CurlHttpClient: one easy handle per request.
 */

#include "alerting/http_client.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>

namespace container_pulse {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::once_flag g_curl_init;

size_t discard_body(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

}  // anonymous namespace

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> CurlHttpClient::send(const HttpRequest& request) {
    CurlEasyPtr handle{curl_easy_init()};
    if (!handle) {
        return Error{"curl_easy_init failed"};
    }

    CurlSlistPtr header_list;
    for (const auto& [name, value] : request.headers) {
        auto line = name + ": " + value;
        auto* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            return Error{"failed to build request headers"};
        }
        header_list.release();
        header_list.reset(appended);
    }

    const std::string method{to_string(request.method)};
    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &discard_body);
    if (header_list) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    }
    if (request.body) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body->c_str());
    } else if (request.method == HttpMethod::Get) {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        return Error{curl_easy_strerror(rc)};
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    return HttpResponse{static_cast<int>(status)};
}

}  // namespace container_pulse
