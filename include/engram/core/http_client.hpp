#ifndef ENGRAM_CORE_HTTP_CLIENT_HPP
#define ENGRAM_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <curl/curl.h>

namespace engram {

struct HttpResponse {
    long status_code;           // 0 when no response arrived
    std::string body;
    std::string error;
    bool timed_out;

    HttpResponse() : status_code(0), timed_out(false) {}

    bool ok() const { return status_code >= 200 && status_code < 300; }

    // Transport failures, timeouts, 429 and 5xx are worth retrying
    bool retryable() const {
        return status_code == 0 || status_code == 429 || status_code >= 500;
    }
};

// Blocking libcurl JSON POST client. One instance per calling thread; the easy handle
// is not shareable.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    void set_timeout(long ms);

    HttpResponse post_json(const std::string& url,
                           const Json& body,
                           const std::map<std::string, std::string>& extra_headers = std::map<std::string, std::string>());

    // curl_global_init is not thread-safe; call once from main before workers start
    static void global_init();
    static void global_cleanup();

private:
    CURL* curl_;
    long timeout_ms_;

    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);

    HttpResponse perform_request(const std::string& url,
                                 const std::string& body,
                                 const std::map<std::string, std::string>& headers);

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

} // namespace engram

#endif // ENGRAM_CORE_HTTP_CLIENT_HPP
