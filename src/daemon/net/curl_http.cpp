#include "net/curl_http.hpp"

#include <algorithm>

namespace net {

size_t append_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

namespace {

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<const std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

} // namespace

void abort_on_stop(CURL* curl, const std::stop_token& stop) {
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::stop_token*>(&stop));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

std::expected<HttpResponse, std::string>
post_json(const std::string& url, const std::string& body,
          const std::vector<std::string>& headers, long timeout_ms,
          std::stop_token stop) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_slist* header_list = curl_slist_append(nullptr, "Content-Type: application/json");
    for (const auto& h : headers) {
        header_list = curl_slist_append(header_list, h.c_str());
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, 5000L));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    abort_on_stop(curl, stop);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("cancelled");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return response;
}

} // namespace net
