#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct HttpReply {
    long status = 0;
    nlohmann::json body;
};

class HttpClient {
public:
    HttpClient(std::string base_url, std::string api_key);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpReply, std::string> get(const std::string& path, long timeout_s = 30);
    std::expected<HttpReply, std::string> post(const std::string& path, const nlohmann::json& body,
                                               long timeout_s = 30);

private:
    std::expected<HttpReply, std::string> perform(const std::string& method, const std::string& path,
                                                  const std::string* body, long timeout_s);

    std::string base_url_;
    std::string api_key_;
};
