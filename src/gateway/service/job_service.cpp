#include "service/job_service.hpp"

#include "logging.hpp"

#include <chrono>
#include <exception>

using json = nlohmann::json;

double unix_now() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

JobService::JobService(TranscribeService& transcribe, JobStore& store, WorkerPool& runners,
                       uint32_t ttl_s, std::string default_language)
    : JobService(
          [&transcribe](const std::string& url, const std::string& language) {
              return transcribe.transcribe_from_url(url, language, false);
          },
          store, runners, ttl_s, std::move(default_language)) {}

JobService::JobService(TranscribeFn transcribe, JobStore& store, WorkerPool& runners,
                       uint32_t ttl_s, std::string default_language)
    : transcribe_(std::move(transcribe)), store_(store), runners_(runners),
      ttl_s_(ttl_s), default_language_(std::move(default_language)) {}

std::expected<SubmitResult, Error> JobService::submit(const std::string& request_id,
                                                      const std::string& media_url,
                                                      const std::string& language) {
    std::lock_guard lock(submit_mutex_);
    auto existing = store_.get_state(request_id);
    if (!existing) return std::unexpected(std::move(existing.error()));

    if (existing->has_value()) {
        auto status = (*existing)->value("status", std::string(job_status::kProcessing));
        logging::info("Job {} already exists with status: {}", request_id, status);
        return SubmitResult{
            .request_id = request_id,
            .status = status,
            .message = "Job already exists with status: " + status,
            .created = false,
        };
    }

    std::string lang = language.empty() ? default_language_ : language;
    json initial = {
        {"status", job_status::kProcessing},
        {"media_url", media_url},
        {"language", lang},
        {"submitted_at", unix_now()},
    };

    if (auto stored = store_.set_state(request_id, initial, ttl_s_); !stored) {
        return std::unexpected(Error{ErrorKind::Storage,
            "Failed to set initial job state: " + stored.error().message});
    }

    runners_.submit([this, request_id, media_url, lang] {
        process(request_id, media_url, lang);
    });

    logging::info("Job {} submitted successfully", request_id);
    return SubmitResult{
        .request_id = request_id,
        .status = job_status::kProcessing,
        .message = "Job submitted successfully",
        .created = true,
    };
}

std::expected<std::optional<json>, Error> JobService::status(const std::string& request_id) {
    auto state = store_.get_state(request_id);
    if (state && !state->has_value()) {
        logging::debug("Job {} not found", request_id);
    }
    return state;
}

void JobService::process(const std::string& request_id, const std::string& media_url,
                         const std::string& language) {
    logging::info("Background processing started for job {}", request_id);
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    std::expected<TranscribeResult, Error> result;
    try {
        result = transcribe_(media_url, language);
    } catch (const std::exception& e) {
        result = std::unexpected(Error{ErrorKind::Transcription, e.what()});
    }

    double processing_s = elapsed();
    json state;
    if (result) {
        state = {
            {"status", job_status::kCompleted},
            {"transcription", result->text},
            {"duration", result->audio_duration_s},
            {"confidence", job_status::kConfidence},
            {"processing_time", processing_s},
            {"completed_at", unix_now()},
        };
        logging::info("Job {} completed successfully in {:.2f}s", request_id, processing_s);
    } else {
        state = {
            {"status", job_status::kFailed},
            {"error", result.error().message},
            {"processing_time", processing_s},
            {"failed_at", unix_now()},
        };
        logging::error("Job {} failed after {:.2f}s: {}", request_id, processing_s,
                       result.error().message);
    }

    if (auto stored = store_.set_state(request_id, state, ttl_s_); !stored) {
        logging::error("Job {}: could not record final state: {}", request_id,
                       stored.error().message);
    }
}
