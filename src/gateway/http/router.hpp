#pragma once

#include "engine/model_config.hpp"
#include "engine/transcriber.hpp"
#include "service/job_service.hpp"
#include "service/transcribe_service.hpp"
#include "storage/job_store.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

struct HttpRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers; // lower-case names
    std::string body;

    std::string header(std::string_view name) const;
};

struct HttpResponse {
    int status = 200;
    nlohmann::json body;
};

struct ServiceInfo {
    std::string app_name;
    std::string version;
    std::string api_key;
    ModelConfig model;
    double started_at = 0.0; // unix seconds when the model became ready
};

// Maps requests to the transcription services. No sockets involved.
class Router {
public:
    Router(ServiceInfo info, Transcriber& engine, TranscribeService& sync,
           JobService& jobs, JobStore& store);

    HttpResponse handle(const HttpRequest& req);

private:
    HttpResponse root();
    HttpResponse health();
    HttpResponse transcribe_sync(const HttpRequest& req);
    HttpResponse submit_job(const HttpRequest& req);
    HttpResponse job_status(const std::string& request_id);

    bool authorized(const HttpRequest& req) const;

    ServiceInfo info_;
    Transcriber& engine_;
    TranscribeService& sync_;
    JobService& jobs_;
    JobStore& store_;
};

namespace api {

nlohmann::json success(const std::string& message, nlohmann::json data = nullptr);
nlohmann::json failure(const std::string& message, nlohmann::json errors = nullptr);

} // namespace api
