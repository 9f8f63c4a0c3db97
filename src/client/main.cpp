#include "http_client.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--url URL] [--key KEY] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe <media_url> [--language L]            Transcribe and wait");
    std::println(stderr, "  submit <request_id> <media_url> [--language L]   Queue a background job");
    std::println(stderr, "  status <request_id>                              Show job status");
    std::println(stderr, "  health                                           Show service health");
    std::println(stderr, "Environment: STT_URL, STT_API_KEY");
}

static const char* env_or(const char* name, const char* fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : fallback;
}

static int print_envelope(const HttpReply& reply) {
    const auto& body = reply.body;
    if (!body.is_object()) {
        std::println(stderr, "Unexpected response (HTTP {})", reply.status);
        return 1;
    }
    if (reply.status >= 400 || body.value("error_code", 1) != 0) {
        std::println(stderr, "Error ({}): {}", reply.status,
                     body.value("message", std::string("unknown error")));
        if (body.contains("errors")) {
            std::println(stderr, "{}", body["errors"].dump(2));
        }
        return 1;
    }

    auto data = body.value("data", json::object());
    auto status = data.value("status", std::string());
    if (status == "COMPLETED") {
        std::println("{}", data.value("transcription", std::string()));
        std::println(stderr, "duration: {:.1f}s, processing: {:.1f}s",
                     data.value("duration", 0.0), data.value("processing_time", 0.0));
    } else if (status == "FAILED") {
        std::println(stderr, "Job failed: {}", data.value("error", std::string("unknown error")));
        return 1;
    } else {
        std::println("{}", data.dump(2));
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string url = env_or("STT_URL", "http://localhost:8000");
    std::string key = env_or("STT_API_KEY", "");
    std::string language;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--key" && i + 1 < argc) {
            key = argv[++i];
        } else if ((arg == "--language" || arg == "-l") && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        usage(argv[0]);
        return 1;
    }

    HttpClient client(url, key);
    const std::string& command = positional[0];
    std::expected<HttpReply, std::string> reply;

    if (command == "transcribe" && positional.size() == 2) {
        json body = {{"media_url", positional[1]}};
        if (!language.empty()) body["language"] = language;
        // The server may wait well past its base timeout for long audio.
        reply = client.post("/transcribe", body, 3600);
        if (reply && reply->status == 200 && reply->body.is_object()) {
            auto status = reply->body.value("status", std::string());
            if (status != "success") {
                std::println(stderr, "Transcription {}", status);
                return 1;
            }
            std::println("{}", reply->body.value("transcription", std::string()));
            std::println(stderr, "duration: {:.1f}s, processing: {:.1f}s",
                         reply->body.value("duration", 0.0),
                         reply->body.value("processing_time", 0.0));
            return 0;
        }
    } else if (command == "submit" && positional.size() == 3) {
        json body = {{"request_id", positional[1]}, {"media_url", positional[2]}};
        if (!language.empty()) body["language"] = language;
        reply = client.post("/api/v1/transcribe", body);
    } else if (command == "status" && positional.size() == 2) {
        reply = client.get("/api/v1/transcribe/" + positional[1]);
    } else if (command == "health" && positional.size() == 1) {
        reply = client.get("/health");
    } else {
        std::println(stderr, "Unknown command or wrong arguments: {}", command);
        usage(argv[0]);
        return 1;
    }

    if (!reply) {
        std::println(stderr, "Failed to reach {}: {}", url, reply.error());
        return 1;
    }
    return print_envelope(*reply);
}
