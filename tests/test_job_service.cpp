#include <catch2/catch_test_macros.hpp>

#include "service/job_service.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>

using json = nlohmann::json;

namespace {

TranscribeResult sample_result(const std::string& text) {
    return {.text = text, .processing_s = 1.2, .download_s = 0.3, .file_size_mb = 1.5,
            .model = "base", .language = "vi", .audio_duration_s = 42.0};
}

std::string status_of(JobService& jobs, const std::string& id) {
    auto s = jobs.status(id);
    REQUIRE(s.has_value());
    REQUIRE(s->has_value());
    return (**s)["status"].get<std::string>();
}

} // namespace

TEST_CASE("JobService", "[jobs]") {
    JobStore store;
    REQUIRE(store.open(":memory:").has_value());
    WorkerPool runners(2);

    std::atomic<int> calls{0};
    std::string seen_language;

    SECTION("CompletedJob") {
        JobService jobs([&](const std::string&, const std::string& language)
                            -> std::expected<TranscribeResult, Error> {
            ++calls;
            seen_language = language;
            return sample_result("xin chao");
        }, store, runners, 3600, "vi");

        auto submitted = jobs.submit("job-1", "https://example.com/a.wav", "");
        REQUIRE(submitted.has_value());
        REQUIRE(submitted->created);
        REQUIRE(submitted->status == "PROCESSING");
        REQUIRE(submitted->message == "Job submitted successfully");

        runners.shutdown();
        REQUIRE(calls == 1);
        REQUIRE(seen_language == "vi");

        auto state = jobs.status("job-1");
        REQUIRE(state->has_value());
        const json& s = **state;
        REQUIRE(s["status"] == "COMPLETED");
        REQUIRE(s["transcription"] == "xin chao");
        REQUIRE(s["duration"] == 42.0);
        REQUIRE(s["confidence"] == 0.98);
        REQUIRE(s.contains("completed_at"));
    }

    SECTION("ResubmitIsIdempotent") {
        std::promise<void> gate;
        auto opened = gate.get_future().share();
        JobService jobs([&, opened](const std::string&, const std::string&)
                            -> std::expected<TranscribeResult, Error> {
            ++calls;
            opened.wait();
            return sample_result("done");
        }, store, runners, 3600, "vi");

        REQUIRE(jobs.submit("job-2", "https://example.com/a.wav", "")->created);

        auto again = jobs.submit("job-2", "https://example.com/other.wav", "en");
        REQUIRE(again.has_value());
        REQUIRE_FALSE(again->created);
        REQUIRE(again->status == "PROCESSING");
        REQUIRE(again->message == "Job already exists with status: PROCESSING");

        gate.set_value();
        runners.shutdown();
        REQUIRE(calls == 1);

        auto later = jobs.submit("job-2", "https://example.com/a.wav", "");
        REQUIRE(later->message == "Job already exists with status: COMPLETED");
    }

    SECTION("FailedJobRecordsError") {
        JobService jobs([&](const std::string&, const std::string&)
                            -> std::expected<TranscribeResult, Error> {
            return std::unexpected(Error{ErrorKind::Download, "Failed to download file: HTTP 404"});
        }, store, runners, 3600, "vi");

        REQUIRE(jobs.submit("job-3", "https://example.com/missing.wav", "")->created);
        runners.shutdown();

        auto state = jobs.status("job-3");
        const json& s = **state;
        REQUIRE(s["status"] == "FAILED");
        REQUIRE(s["error"] == "Failed to download file: HTTP 404");
        REQUIRE(s.contains("failed_at"));
    }

    SECTION("ThrowingTranscriptionFails") {
        JobService jobs([&](const std::string&, const std::string&)
                            -> std::expected<TranscribeResult, Error> {
            throw std::runtime_error("engine exploded");
        }, store, runners, 3600, "vi");

        REQUIRE(jobs.submit("job-4", "https://example.com/a.wav", "")->created);
        runners.shutdown();
        REQUIRE(status_of(jobs, "job-4") == "FAILED");
    }

    SECTION("UnknownJob") {
        JobService jobs([&](const std::string&, const std::string&)
                            -> std::expected<TranscribeResult, Error> {
            return sample_result("");
        }, store, runners, 3600, "vi");

        auto state = jobs.status("never-submitted");
        REQUIRE(state.has_value());
        REQUIRE_FALSE(state->has_value());
    }

    SECTION("StoreUnavailable") {
        JobService jobs([&](const std::string&, const std::string&)
                            -> std::expected<TranscribeResult, Error> {
            ++calls;
            return sample_result("");
        }, store, runners, 3600, "vi");

        store.close();
        auto submitted = jobs.submit("job-5", "https://example.com/a.wav", "");
        REQUIRE_FALSE(submitted.has_value());
        REQUIRE(submitted.error().kind == ErrorKind::Storage);
        runners.shutdown();
        REQUIRE(calls == 0);
    }
}

TEST_CASE("JobService state expiry", "[jobs]") {
    auto now = std::make_shared<double>(1'700'000'000.0);
    JobStore store([now] { return *now; });
    REQUIRE(store.open(":memory:").has_value());
    WorkerPool runners(1);

    JobService jobs([](const std::string&, const std::string&)
                        -> std::expected<TranscribeResult, Error> {
        return sample_result("ok");
    }, store, runners, 60, "vi");

    REQUIRE(jobs.submit("job-ttl", "https://example.com/a.wav", "")->created);
    runners.shutdown();
    REQUIRE(status_of(jobs, "job-ttl") == "COMPLETED");

    *now += 61;
    auto state = jobs.status("job-ttl");
    REQUIRE(state.has_value());
    REQUIRE_FALSE(state->has_value());

    // An expired id can be submitted again.
    WorkerPool more(1);
    JobService again([](const std::string&, const std::string&)
                         -> std::expected<TranscribeResult, Error> {
        return sample_result("ok");
    }, store, more, 60, "vi");
    REQUIRE(again.submit("job-ttl", "https://example.com/a.wav", "")->created);
    more.shutdown();
}
