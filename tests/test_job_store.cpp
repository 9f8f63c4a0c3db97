#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "storage/job_store.hpp"

#include <filesystem>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace {

// Manually advanced clock so expiry is deterministic.
struct TestClock {
    std::shared_ptr<double> now = std::make_shared<double>(1'700'000'000.0);
    JobStore::Clock fn() const {
        return [now = now] { return *now; };
    }
    void advance(double s) { *now += s; }
};

} // namespace

TEST_CASE("JobStore", "[jobs]") {
    TestClock clock;
    JobStore store(clock.fn());

    SECTION("OpenCreatesFile") {
        TmpDir dir("jobstore");
        auto path = (dir.path / "state" / "jobs.sqlite").string();
        JobStore disk;
        REQUIRE(disk.open(path).has_value());
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(disk.ping());
    }

    REQUIRE(store.open(":memory:").has_value());

    SECTION("KeyConvention") {
        REQUIRE(JobStore::key_for("abc-123") == "stt:job:abc-123");
    }

    SECTION("SetAndGet") {
        json state = {{"status", "PROCESSING"}, {"created", 1700000000}};
        REQUIRE(store.set_state("r1", state, 60).has_value());

        auto got = store.get_state("r1");
        REQUIRE(got.has_value());
        REQUIRE(got->has_value());
        REQUIRE((**got)["status"] == "PROCESSING");
        REQUIRE(store.exists("r1"));
    }

    SECTION("MissingIsNullopt") {
        auto got = store.get_state("nope");
        REQUIRE(got.has_value());
        REQUIRE_FALSE(got->has_value());
        REQUIRE_FALSE(store.exists("nope"));
    }

    SECTION("OverwriteReplacesStateAndExpiry") {
        REQUIRE(store.set_state("r1", {{"status", "PROCESSING"}}, 10).has_value());
        clock.advance(8);
        REQUIRE(store.set_state("r1", {{"status", "COMPLETED"}}, 10).has_value());
        clock.advance(8);

        auto got = store.get_state("r1");
        REQUIRE(got->has_value());
        REQUIRE((**got)["status"] == "COMPLETED");
    }

    SECTION("ExpiredReportedAbsent") {
        REQUIRE(store.set_state("r1", {{"status", "COMPLETED"}}, 60).has_value());
        clock.advance(59);
        REQUIRE(store.exists("r1"));
        clock.advance(1);
        REQUIRE_FALSE(store.exists("r1"));

        // Expired reads delete the row.
        REQUIRE_FALSE(store.remove("r1"));
    }

    SECTION("PurgeExpired") {
        REQUIRE(store.set_state("a", {{"status", "COMPLETED"}}, 10).has_value());
        REQUIRE(store.set_state("b", {{"status", "COMPLETED"}}, 100).has_value());
        clock.advance(50);
        REQUIRE(store.purge_expired() == 1);
        REQUIRE(store.exists("b"));
    }

    SECTION("Remove") {
        REQUIRE(store.set_state("r1", {{"status", "FAILED"}}, 60).has_value());
        REQUIRE(store.remove("r1"));
        REQUIRE_FALSE(store.remove("r1"));
    }

    SECTION("Utf8Preserved") {
        REQUIRE(store.set_state("vi", {{"text", "xin chào thế giới"}}, 60).has_value());
        auto got = store.get_state("vi");
        REQUIRE((**got)["text"] == "xin chào thế giới");
    }

    SECTION("ClosedStoreReportsStorageError") {
        store.close();
        auto set = store.set_state("r1", {{"status", "PROCESSING"}}, 60);
        REQUIRE_FALSE(set.has_value());
        REQUIRE(set.error().kind == ErrorKind::Storage);
        REQUIRE_FALSE(store.get_state("r1").has_value());
        REQUIRE_FALSE(store.ping());
    }
}
