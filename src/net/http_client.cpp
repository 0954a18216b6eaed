#include "net/http_client.hpp"

#include <chrono>
#include <mutex>
#include <curl/curl.h>

namespace webaudit::net {

namespace {

void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { static_cast<void>(curl_global_init(CURL_GLOBAL_DEFAULT)); });
}

size_t write_body_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const std::atomic_bool*>(clientp);
    return (token != nullptr && token->load()) ? 1 : 0;
}

}  // namespace

HttpResponse perform(const HttpRequest& request) {
    ensure_global_init();

    HttpResponse result;
    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "User-Agent: webaudit/1.0");
    for (const auto& h : request.headers) {
        header_list = curl_slist_append(header_list, h.c_str());
    }

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

    if (request.cancel_token) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.cancel_token.get());
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (request.body.has_value()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
    }

    const auto start = std::chrono::steady_clock::now();
    const CURLcode code = curl_easy_perform(curl);
    const auto end = std::chrono::steady_clock::now();
    result.latency_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    if (code != CURLE_OK) {
        result.error = curl_easy_strerror(code);
        result.timed_out = (code == CURLE_OPERATION_TIMEDOUT);
        result.cancelled = (code == CURLE_ABORTED_BY_CALLBACK);
    }

    long http_status = -1;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    result.status = http_status;
    result.body = std::move(response_body);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return result;
}

std::string escape_segment(const std::string& segment) {
    ensure_global_init();
    CURL* curl = curl_easy_init();
    if (!curl) {
        return segment;
    }
    char* escaped = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
    std::string out = escaped != nullptr ? std::string(escaped) : segment;
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return out;
}

}  // namespace webaudit::net
