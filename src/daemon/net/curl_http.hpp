#pragma once

#include <curl/curl.h>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

// Thin libcurl helpers shared by the HTTP speech engine and LLM provider.
namespace net {

// curl_global_init/cleanup for the lifetime of the owning object.
class CurlGlobal {
public:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// CURLOPT_WRITEFUNCTION appending into a std::string*.
size_t append_to_string(char* ptr, size_t size, size_t nmemb, void* userdata);

// Makes an in-flight transfer abort once `stop` is requested. The token must
// outlive the transfer.
void abort_on_stop(CURL* curl, const std::stop_token& stop);

std::expected<HttpResponse, std::string>
post_json(const std::string& url, const std::string& body,
          const std::vector<std::string>& headers, long timeout_ms,
          std::stop_token stop = {});

} // namespace net
