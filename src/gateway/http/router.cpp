#include "http/router.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>

using json = nlohmann::json;

namespace {

constexpr std::string_view kJobsPrefix = "/api/v1/transcribe/";
constexpr size_t kMaxRequestIdLength = 256;

std::string trim(std::string_view s) {
    auto a = s.find_first_not_of(" \t\n\r");
    if (a == std::string_view::npos) return {};
    auto b = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(a, b - a + 1));
}

bool valid_media_url(const std::string& url) {
    return url.starts_with("http://") || url.starts_with("https://") ||
           url.starts_with("minio://");
}

HttpResponse error(int status, const std::string& message, const std::string& detail) {
    return {status, api::failure(message, {{"detail", detail}})};
}

HttpResponse validation_error(json errors) {
    std::string summary;
    for (auto& [field, msg] : errors.items()) {
        if (!summary.empty()) summary += "; ";
        summary += field + ": " + msg.get<std::string>();
    }
    logging::error("Validation error: {}", summary);
    return {422, api::failure("Validation error", std::move(errors))};
}

// Parses a JSON object body; on failure fills the validation errors.
std::optional<json> parse_object(const std::string& body, json& errors) {
    try {
        auto j = json::parse(body);
        if (j.is_object()) return j;
        errors["body"] = "Request body must be a JSON object";
    } catch (const json::exception& e) {
        errors["body"] = std::string("Invalid JSON: ") + e.what();
    }
    return std::nullopt;
}

std::string string_field(const json& j, const char* key, json& errors, bool required) {
    if (!j.contains(key) || j[key].is_null()) {
        if (required) errors[key] = "Field required";
        return {};
    }
    if (!j[key].is_string()) {
        errors[key] = "Input should be a valid string";
        return {};
    }
    return j[key].get<std::string>();
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

std::string HttpRequest::header(std::string_view name) const {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
}

namespace api {

json success(const std::string& message, json data) {
    json j = {{"error_code", 0}, {"message", message}};
    if (!data.is_null()) j["data"] = std::move(data);
    return j;
}

json failure(const std::string& message, json errors) {
    json j = {{"error_code", 1}, {"message", message}};
    if (!errors.is_null()) j["errors"] = std::move(errors);
    return j;
}

} // namespace api

Router::Router(ServiceInfo info, Transcriber& engine, TranscribeService& sync,
               JobService& jobs, JobStore& store)
    : info_(std::move(info)), engine_(engine), sync_(sync), jobs_(jobs), store_(store) {}

bool Router::authorized(const HttpRequest& req) const {
    auto key = req.header("x-api-key");
    return !key.empty() && key == info_.api_key;
}

HttpResponse Router::handle(const HttpRequest& req) {
    std::string path = req.target.substr(0, req.target.find('?'));
    logging::debug("{} {}", req.method, path);

    auto method_not_allowed = [] {
        return error(405, "Method Not Allowed", "Method Not Allowed");
    };
    auto unauthorized = [] {
        return error(401, "Invalid or missing API key", "Invalid or missing API key");
    };

    if (path == "/") {
        return req.method == "GET" ? root() : method_not_allowed();
    }
    if (path == "/health") {
        return req.method == "GET" ? health() : method_not_allowed();
    }
    if (path == "/transcribe") {
        if (req.method != "POST") return method_not_allowed();
        if (!authorized(req)) return unauthorized();
        return transcribe_sync(req);
    }
    if (path == "/api/v1/transcribe") {
        if (req.method != "POST") return method_not_allowed();
        if (!authorized(req)) return unauthorized();
        return submit_job(req);
    }
    if (path.starts_with(kJobsPrefix) && path.size() > kJobsPrefix.size()) {
        if (req.method != "GET") return method_not_allowed();
        if (!authorized(req)) return unauthorized();
        return job_status(path.substr(kJobsPrefix.size()));
    }
    return error(404, "Not Found", "Not Found");
}

HttpResponse Router::root() {
    return {200, api::success("API service is running", {
        {"service", info_.app_name},
        {"version", info_.version},
        {"status", "running"},
    })};
}

HttpResponse Router::health() {
    bool initialized = engine_.ready();

    json model = {
        {"initialized", initialized},
        {"size", info_.model.model_size},
        {"ram_mb", info_.model.expected_ram_mb},
    };
    if (initialized && info_.started_at > 0.0) {
        model["uptime_seconds"] = round2(unix_now() - info_.started_at);
    }

    json data = {
        {"status", initialized ? "healthy" : "unhealthy"},
        {"service", info_.app_name},
        {"version", info_.version},
        {"model", std::move(model)},
        {"store", {{"healthy", store_.ping()}}},
    };

    return {200, api::success(initialized ? "Service is healthy"
                                          : "Service unhealthy: model not initialized",
                              std::move(data))};
}

HttpResponse Router::transcribe_sync(const HttpRequest& req) {
    json errors = json::object();
    auto body = parse_object(req.body, errors);
    if (!body) return validation_error(std::move(errors));

    auto media_url = string_field(*body, "media_url", errors, true);
    auto language = string_field(*body, "language", errors, false);
    if (errors.empty() && !(media_url.starts_with("http://") || media_url.starts_with("https://"))) {
        errors["media_url"] = "Input should be a valid URL";
    }
    if (!errors.empty()) return validation_error(std::move(errors));

    logging::info("Transcription request for language={}", language.empty() ? "default" : language);

    auto result = sync_.transcribe_from_url(media_url, language, true);
    if (!result) {
        const auto& err = result.error();
        switch (err.kind) {
        case ErrorKind::Timeout:
            return {200, {
                {"status", "timeout"},
                {"transcription", ""},
                {"duration", 0.0},
                {"confidence", 0.0},
                {"processing_time", 0.0},
            }};
        case ErrorKind::FileTooLarge:
            return error(413, err.message, err.message);
        case ErrorKind::InvalidRequest:
        case ErrorKind::Download:
            return error(400, err.message, err.message);
        default:
            logging::error("Transcription error: {}", err.message);
            auto msg = "Internal server error: " + err.message;
            return error(500, msg, msg);
        }
    }

    return {200, {
        {"status", "success"},
        {"transcription", result->text},
        {"duration", result->audio_duration_s},
        {"confidence", job_status::kConfidence},
        {"processing_time", result->processing_s},
    }};
}

HttpResponse Router::submit_job(const HttpRequest& req) {
    json errors = json::object();
    auto body = parse_object(req.body, errors);
    if (!body) return validation_error(std::move(errors));

    auto request_id = trim(string_field(*body, "request_id", errors, true));
    auto media_url = string_field(*body, "media_url", errors, true);
    auto language = string_field(*body, "language", errors, false);

    if (!errors.contains("request_id")) {
        if (request_id.empty()) errors["request_id"] = "request_id cannot be empty";
        else if (request_id.size() > kMaxRequestIdLength)
            errors["request_id"] = "String should have at most 256 characters";
    }
    if (!errors.contains("media_url")) {
        if (media_url.empty()) errors["media_url"] = "media_url cannot be empty";
        else if (!valid_media_url(media_url))
            errors["media_url"] = "media_url must start with http://, https://, or minio://";
    }
    if (!errors.empty()) return validation_error(std::move(errors));

    logging::info("Async job submission: request_id={}", request_id);
    auto submitted = jobs_.submit(request_id, media_url, language);
    if (!submitted) {
        logging::error("Failed to submit job: {}", submitted.error().message);
        return error(500, "Internal server error", submitted.error().message);
    }

    return {202, api::success(submitted->message, {
        {"request_id", submitted->request_id},
        {"status", submitted->status},
    })};
}

HttpResponse Router::job_status(const std::string& request_id) {
    auto state = jobs_.status(request_id);
    if (!state) {
        logging::error("Failed to get job status: {}", state.error().message);
        return error(500, "Internal server error", state.error().message);
    }
    if (!state->has_value()) {
        logging::warn("Job {} not found", request_id);
        return {404, api::failure("Job not found", {
            {"request_id", "Job " + request_id + " does not exist or has expired"},
        })};
    }

    const json& s = **state;
    auto status = s.value("status", std::string(job_status::kProcessing));

    if (status == job_status::kCompleted) {
        return {200, api::success("Transcription completed", {
            {"request_id", request_id},
            {"status", status},
            {"transcription", s.value("transcription", std::string())},
            {"duration", s.value("duration", 0.0)},
            {"confidence", s.value("confidence", 0.0)},
            {"processing_time", s.value("processing_time", 0.0)},
        })};
    }
    if (status == job_status::kFailed) {
        return {200, api::success("Transcription failed", {
            {"request_id", request_id},
            {"status", status},
            {"error", s.value("error", std::string("Unknown error"))},
        })};
    }
    return {200, api::success("Transcription in progress", {
        {"request_id", request_id},
        {"status", job_status::kProcessing},
    })};
}
