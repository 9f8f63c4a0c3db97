#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "engine/context_guard.hpp"
#include "fakes.hpp"

#include <chrono>
#include <thread>
#include <vector>

using Catch::Matchers::ContainsSubstring;

namespace {

std::expected<InferenceResult, Error> infer(ContextGuard& guard, FakeEngine& engine) {
    static const std::vector<float> samples(160, 0.1f);
    return guard.with_context([&](whisper_context* ctx) {
        return engine.run_inference(ctx, InferenceOptions{.language = "vi"}, samples);
    });
}

} // namespace

TEST_CASE("ContextGuard", "[engine]") {
    FakeEngine engine;

    SECTION("OpenInitialisesOnce") {
        ContextGuard guard(engine, "/models/ggml-base.bin");
        REQUIRE(guard.open().has_value());
        REQUIRE(guard.open().has_value());
        REQUIRE(engine.init_calls == 1);
        REQUIRE(guard.healthy());
        REQUIRE(guard.recoveries() == 0);
    }

    SECTION("OpenFailureIsModelInit") {
        engine.fail_init = true;
        ContextGuard guard(engine, "/models/missing.bin");
        auto r = guard.open();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::ModelInit);
        REQUIRE_FALSE(guard.healthy());
    }

    SECTION("ConcurrentCallsAreSerialised") {
        engine.delay = std::chrono::milliseconds(5);
        ContextGuard guard(engine, "/models/ggml-base.bin");
        REQUIRE(guard.open().has_value());

        std::vector<std::thread> threads;
        std::atomic<int> ok{0};
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 3; ++i) {
                    if (infer(guard, engine)) ++ok;
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(ok == 24);
        REQUIRE(engine.inference_calls == 24);
        REQUIRE(engine.max_in_flight == 1);
    }

    SECTION("HealthReadDoesNotWaitForInference") {
        using namespace std::chrono;
        engine.delay = milliseconds(500);
        ContextGuard guard(engine, "/models/ggml-base.bin");
        REQUIRE(guard.open().has_value());

        std::thread worker([&] { (void)infer(guard, engine); });
        while (engine.in_flight.load() == 0) std::this_thread::sleep_for(milliseconds(1));

        auto start = steady_clock::now();
        bool healthy = guard.healthy();
        auto took = steady_clock::now() - start;
        bool still_running = engine.in_flight.load() == 1;
        worker.join();

        REQUIRE(healthy);
        REQUIRE(still_running);
        REQUIRE(took < milliseconds(100));
        REQUIRE(engine.inference_calls == 1);
    }

    SECTION("ReleasedContextRecoversOnNextCall") {
        ContextGuard guard(engine, "/models/ggml-base.bin");
        REQUIRE(guard.open().has_value());

        guard.release();
        REQUIRE_FALSE(guard.healthy());
        REQUIRE(engine.free_calls == 1);

        REQUIRE(infer(guard, engine).has_value());
        REQUIRE(guard.recoveries() == 1);
        REQUIRE(engine.init_calls == 2);

        REQUIRE(infer(guard, engine).has_value());
        REQUIRE(guard.recoveries() == 1);
    }

    SECTION("FailedRecoveryRetriedOnNextCall") {
        ContextGuard guard(engine, "/models/ggml-base.bin");
        REQUIRE(guard.open().has_value());
        guard.release();

        engine.fail_init = true;
        auto failed = infer(guard, engine);
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error().kind == ErrorKind::ContextRecovery);
        REQUIRE_THAT(failed.error().message, ContainsSubstring("Context recovery failed"));
        REQUIRE(engine.inference_calls == 0);

        engine.fail_init = false;
        REQUIRE(infer(guard, engine).has_value());
        REQUIRE(guard.recoveries() == 2);
        REQUIRE(guard.healthy());
    }

    SECTION("UnloadedLibraryCannotRecover") {
        ContextGuard guard(engine, "/models/ggml-base.bin");
        REQUIRE(guard.open().has_value());

        engine.is_loaded = false;
        auto r = infer(guard, engine);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::ContextRecovery);
        REQUIRE(engine.free_calls == 1);
    }

    SECTION("DestructorFreesContext") {
        {
            ContextGuard guard(engine, "/models/ggml-base.bin");
            REQUIRE(guard.open().has_value());
        }
        REQUIRE(engine.free_calls == 1);
    }
}
