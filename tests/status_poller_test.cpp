#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

#include "errors/errors.hpp"
#include "polling/status_poller.hpp"

using namespace scalebox::polling;
using std::chrono::milliseconds;

namespace {

StatusSnapshot Snapshot(const std::string& status) {
    return StatusSnapshot{"sbx-1", status, std::nullopt, std::nullopt, "2024-01-01T00:00:00Z"};
}

}  // namespace

TEST_CASE("PollUntil returns a terminal status without sleeping", "[poller]") {
    int calls = 0;
    PollOptions options;
    options.interval = milliseconds(5000);

    const auto started = std::chrono::steady_clock::now();
    const auto result = PollUntil(
        [&calls] {
            ++calls;
            return Snapshot("running");
        },
        IsStatusIn({"running", "failed"}),
        options);

    CHECK(result.status == "running");
    CHECK(calls == 1);
    CHECK(std::chrono::steady_clock::now() - started < milliseconds(1000));
}

TEST_CASE("PollUntil keeps polling until the status is terminal", "[poller]") {
    int calls = 0;
    PollOptions options;
    options.interval = milliseconds(20);
    options.timeout = milliseconds(5000);

    const auto result = PollUntil(
        [&calls] { return Snapshot(++calls < 3 ? "pausing" : "PAUSED"); },
        IsStatusIn({"paused", "failed"}),
        options);

    CHECK(result.status == "PAUSED");
    CHECK(calls == 3);
}

TEST_CASE("PollUntil times out with the last observed status", "[poller]") {
    PollOptions options;
    options.timeout = milliseconds(200);
    options.interval = milliseconds(100);

    const auto started = std::chrono::steady_clock::now();
    try {
        PollUntil([] { return Snapshot("pausing"); }, IsStatusIn({"paused"}), options);
        FAIL("expected a timeout");
    } catch (const scalebox::errors::PollTimeoutError& ex) {
        CHECK_THAT(std::string(ex.what()), Catch::Contains("timed out") && Catch::Contains("pausing"));
        CHECK(ex.last_status() == "pausing");
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    CHECK(elapsed >= milliseconds(200));
    CHECK(elapsed < milliseconds(200 + 100 + 100));
}

TEST_CASE("PollUntil aborts before the first poll when cancelled", "[poller]") {
    CancellationToken token;
    token.Cancel();
    int calls = 0;
    PollOptions options;
    options.cancel = token;

    CHECK_THROWS_AS(
        PollUntil([&calls] { ++calls; return Snapshot("pausing"); }, IsStatusIn({"paused"}), options),
        scalebox::errors::PollAbortedError);
    CHECK(calls == 0);

    try {
        PollUntil([] { return Snapshot("pausing"); }, IsStatusIn({"paused"}), options);
        FAIL("expected an abort");
    } catch (const scalebox::errors::TimeoutError&) {
        FAIL("cancellation must not look like a timeout");
    } catch (const scalebox::errors::AbortedError& ex) {
        CHECK_THAT(std::string(ex.what()), Catch::Contains("aborted"));
    }
}

TEST_CASE("Cancelling wakes a sleeping poller", "[poller]") {
    CancellationToken token;
    PollOptions options;
    options.timeout = milliseconds(10000);
    options.interval = milliseconds(5000);
    options.cancel = token;

    std::atomic<int> calls{0};
    std::thread canceller([&] {
        while (calls.load() == 0) {
            std::this_thread::sleep_for(milliseconds(1));
        }
        token.Cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(
        PollUntil([&calls] { ++calls; return Snapshot("pausing"); }, IsStatusIn({"paused"}), options),
        scalebox::errors::PollAbortedError);
    canceller.join();
    CHECK(std::chrono::steady_clock::now() - started < milliseconds(2000));
}

TEST_CASE("PollUntil propagates fetch errors", "[poller]") {
    CHECK_THROWS_AS(
        PollUntil([]() -> StatusSnapshot { throw scalebox::errors::NotFoundError("sandbox gone"); },
                  IsStatusIn({"running"})),
        scalebox::errors::NotFoundError);
}

TEST_CASE("ComputeJitter stays within its bound", "[poller]") {
    std::mt19937 rng(7);
    for (int i = 0; i < 200; ++i) {
        const auto small = ComputeJitter(milliseconds(1000), rng);
        CHECK(small >= milliseconds(0));
        CHECK(small < milliseconds(100));

        const auto capped = ComputeJitter(milliseconds(60000), rng);
        CHECK(capped < milliseconds(500));
    }
    CHECK(ComputeJitter(milliseconds(5), rng) == milliseconds(0));
}

TEST_CASE("IsStatusIn ignores case", "[poller]") {
    const auto terminal = IsStatusIn({"Completed", "failed", "cancelled"});
    CHECK(terminal("completed"));
    CHECK(terminal("FAILED"));
    CHECK_FALSE(terminal("running"));
}

TEST_CASE("PollOptionsFromConfig copies the configured timing", "[poller]") {
    scalebox::config::PollingConfig polling;
    polling.interval_ms = 250;
    polling.timeout_ms = 4000;
    const auto options = scalebox::polling::PollOptionsFromConfig(polling);
    CHECK(options.interval == std::chrono::milliseconds(250));
    CHECK(options.timeout == std::chrono::milliseconds(4000));
    CHECK_FALSE(options.cancel.has_value());

    const scalebox::polling::PollOptions defaults;
    CHECK(defaults.interval == std::chrono::milliseconds(1000));
    CHECK(defaults.timeout == std::chrono::milliseconds(300000));
}
