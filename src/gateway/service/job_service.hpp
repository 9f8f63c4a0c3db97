#pragma once

#include "service/transcribe_service.hpp"
#include "service/worker_pool.hpp"
#include "storage/job_store.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct SubmitResult {
    std::string request_id;
    std::string status;
    std::string message;
    bool created = false;
};

// Background transcription jobs. State moves PROCESSING -> COMPLETED or
// PROCESSING -> FAILED exactly once and expires after ttl_s.
class JobService {
public:
    using TranscribeFn = std::function<std::expected<TranscribeResult, Error>(
        const std::string& url, const std::string& language)>;

    JobService(TranscribeService& transcribe, JobStore& store, WorkerPool& runners,
               uint32_t ttl_s, std::string default_language);

    // Test seam: replaces the call into TranscribeService.
    JobService(TranscribeFn transcribe, JobStore& store, WorkerPool& runners,
               uint32_t ttl_s, std::string default_language);

    // Idempotent on request_id: an existing job is reported, not requeued.
    std::expected<SubmitResult, Error> submit(const std::string& request_id,
                                              const std::string& media_url,
                                              const std::string& language);

    std::expected<std::optional<nlohmann::json>, Error> status(const std::string& request_id);

    // Runs one job to its terminal state. Called on the runner pool.
    void process(const std::string& request_id, const std::string& media_url,
                 const std::string& language);

private:
    TranscribeFn transcribe_;
    JobStore& store_;
    WorkerPool& runners_;
    std::mutex submit_mutex_; // check-then-create on one request_id
    uint32_t ttl_s_;
    std::string default_language_;
};

namespace job_status {

inline constexpr const char* kProcessing = "PROCESSING";
inline constexpr const char* kCompleted = "COMPLETED";
inline constexpr const char* kFailed = "FAILED";

// Constant reported with every completed job.
inline constexpr double kConfidence = 0.98;

} // namespace job_status

double unix_now();
