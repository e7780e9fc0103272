/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTP client over libcurl for the HTTP-speaking engines
 */

#pragma once

#include <core/call_context.hpp>
#include <map>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace Omnidb {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // lower-cased names

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief One curl easy handle bound to a base URL.
 *
 * The CallContext sets CURLOPT_TIMEOUT_MS and is polled from the transfer
 * progress callback, which aborts the request once cancelled. Transport
 * failures throw ConnectionError; HTTP error statuses are returned.
 */
class HttpClient {
public:
    explicit HttpClient(std::string base_url, CallContext context = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void set_header(const std::string& name, const std::string& value);
    void set_basic_auth(const std::string& username, const std::string& password);
    void set_verify_tls(bool verify) { verify_tls_ = verify; }

    HttpResponse request(const std::string& method,
                         const std::string& path,
                         const std::string& body = "",
                         const std::string& content_type = "application/json");

    HttpResponse get(const std::string& path) { return request("GET", path); }
    HttpResponse post(const std::string& path, const std::string& body,
                      const std::string& content_type = "application/json") {
        return request("POST", path, body, content_type);
    }
    HttpResponse put(const std::string& path, const std::string& body) { return request("PUT", path, body); }
    HttpResponse del(const std::string& path, const std::string& body = "") { return request("DELETE", path, body); }

    /**
     * @brief Percent-encode one URL component.
     */
    std::string escape(const std::string& text) const;

    const std::string& base_url() const { return base_url_; }

private:
    static size_t on_body(char* data, size_t size, size_t count, void* user);
    static size_t on_header(char* data, size_t size, size_t count, void* user);
    static int on_progress(void* self, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    CURL* curl_ = nullptr;
    std::string base_url_;
    std::vector<std::string> headers_;
    std::string username_;
    std::string password_;
    bool verify_tls_ = true;
    CallContext context_;
};

/**
 * @brief http(s)://host:port from credentials fields; a hostname that
 * already carries a scheme is used as-is.
 */
std::string make_base_url(const std::string& hostname, const std::string& port,
                          const std::string& default_port, bool https);

} // namespace Omnidb
