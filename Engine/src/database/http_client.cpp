/**
 * @file http_client.cpp
 * @brief libcurl easy-handle client implementation
 */

#include <database/http_client.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>

namespace Omnidb {

namespace {

void init_curl() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    return s.substr(start);
}

struct SlistFreer {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

std::string make_base_url(const std::string& hostname, const std::string& port,
                          const std::string& default_port, bool https) {
    std::string host = hostname.empty() ? "localhost" : hostname;
    while (!host.empty() && host.back() == '/') host.pop_back();
    if (host.find("://") != std::string::npos) return host;
    return std::string(https ? "https://" : "http://") + host + ":" + (port.empty() ? default_port : port);
}

HttpClient::HttpClient(std::string base_url, CallContext context)
    : base_url_(std::move(base_url)), context_(std::move(context)) {
    init_curl();
    curl_ = curl_easy_init();
    if (!curl_) throw ConnectionError("HTTP client initialisation failed");
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_header(const std::string& name, const std::string& value) {
    headers_.push_back(name + ": " + value);
}

void HttpClient::set_basic_auth(const std::string& username, const std::string& password) {
    username_ = username;
    password_ = password;
}

std::string HttpClient::escape(const std::string& text) const {
    char* escaped = curl_easy_escape(curl_, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) return text;
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

size_t HttpClient::on_body(char* data, size_t size, size_t count, void* user) {
    static_cast<std::string*>(user)->append(data, size * count);
    return size * count;
}

size_t HttpClient::on_header(char* data, size_t size, size_t count, void* user) {
    std::string line(data, size * count);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*static_cast<std::map<std::string, std::string>*>(user))[name] = trim(line.substr(colon + 1));
    }
    return size * count;
}

int HttpClient::on_progress(void* self, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<HttpClient*>(self)->context_.cancelled() ? 1 : 0;
}

HttpResponse HttpClient::request(const std::string& method,
                                 const std::string& path,
                                 const std::string& body,
                                 const std::string& content_type) {
    if (context_.should_stop()) {
        throw ConnectionError(context_.cancelled() ? "cancelled" : "deadline exceeded");
    }

    HttpResponse response;
    curl_easy_reset(curl_);

    const std::string url = base_url_ + path;
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &HttpClient::on_body);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, &HttpClient::on_header);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &HttpClient::on_progress);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, verify_tls_ ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, verify_tls_ ? 2L : 0L);

    long long remaining = context_.remaining_ms();
    if (remaining > 0) curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(remaining));

    if (!username_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl_, CURLOPT_USERNAME, username_.c_str());
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, password_.c_str());
    }

    curl_slist* list = nullptr;
    for (const auto& header : headers_) list = curl_slist_append(list, header.c_str());
    if (!body.empty()) {
        list = curl_slist_append(list, ("Content-Type: " + content_type).c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }
    std::unique_ptr<curl_slist, SlistFreer> header_list(list);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list.get());

    CURLcode rc = curl_easy_perform(curl_);
    if (rc == CURLE_ABORTED_BY_CALLBACK) throw ConnectionError("cancelled");
    if (rc == CURLE_OPERATION_TIMEDOUT) throw ConnectionError("deadline exceeded");
    if (rc != CURLE_OK) {
        throw ConnectionError("HTTP " + method + " " + url + " failed: " + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace Omnidb
