#include "http_client.hpp"

#include <curl/curl.h>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpClient::HttpClient(std::string base_url, std::string api_key)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

std::expected<HttpReply, std::string> HttpClient::get(const std::string& path, long timeout_s) {
    return perform("GET", path, nullptr, timeout_s);
}

std::expected<HttpReply, std::string> HttpClient::post(const std::string& path, const json& body,
                                                       long timeout_s) {
    auto payload = body.dump();
    return perform("POST", path, &payload, timeout_s);
}

std::expected<HttpReply, std::string> HttpClient::perform(const std::string& method,
                                                          const std::string& path,
                                                          const std::string* body,
                                                          long timeout_s) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string url = base_url_ + path;
    std::string key_header = "X-API-Key: " + api_key_;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!api_key_.empty()) headers = curl_slist_append(headers, key_header.c_str());

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, body ? static_cast<long>(body->size()) : 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    HttpReply reply{.status = status, .body = nullptr};
    if (!response_body.empty()) {
        try {
            reply.body = json::parse(response_body);
        } catch (const json::exception& e) {
            return std::unexpected(std::string("JSON parse error: ") + e.what());
        }
    }
    return reply;
}
