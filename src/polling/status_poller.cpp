#include "polling/status_poller.hpp"

#include <algorithm>
#include <thread>

#include "errors/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scalebox::polling {

namespace {

constexpr std::chrono::milliseconds kMaxJitter{500};

void ThrowIfCancelled(const PollOptions& options) {
    if (options.cancel.has_value() && options.cancel->IsCancelled()) {
        throw errors::PollAbortedError("Polling " + options.subject + " aborted");
    }
}

}  // namespace

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

PollOptions PollOptionsFromConfig(const config::PollingConfig& polling) {
    PollOptions options;
    options.timeout = std::chrono::milliseconds(polling.timeout_ms);
    options.interval = std::chrono::milliseconds(polling.interval_ms);
    return options;
}

std::chrono::milliseconds ComputeJitter(std::chrono::milliseconds interval, std::mt19937& rng) {
    const auto bound = std::min(kMaxJitter, interval / 10);
    if (bound.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    std::uniform_int_distribution<long long> dist(0, bound.count() - 1);
    return std::chrono::milliseconds(dist(rng));
}

IsTerminal IsStatusIn(const std::set<std::string>& targets) {
    std::set<std::string> lowered;
    for (const auto& target : targets) {
        lowered.insert(utils::ToLower(target));
    }
    return [lowered](const std::string& status) {
        return lowered.count(utils::ToLower(status)) > 0;
    };
}

StatusSnapshot PollUntil(const FetchStatus& fetch, const IsTerminal& is_terminal, const PollOptions& options) {
    if (!fetch || !is_terminal) {
        throw errors::InvalidArgumentError("PollUntil needs a fetch function and a terminal predicate");
    }
    std::mt19937 rng(std::random_device{}());
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    ThrowIfCancelled(options);

    std::string last_status = "unknown";
    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            try {
                last_status = fetch().status;
            } catch (const std::exception& ex) {
                utils::LogWarn("poller", std::string("final status check failed: ") + ex.what());
            }
            throw errors::PollTimeoutError(
                "Polling " + options.subject + " timed out after " + std::to_string(options.timeout.count()) +
                    " ms, last status: " + last_status,
                last_status);
        }

        auto snapshot = fetch();
        last_status = snapshot.status;
        if (is_terminal(snapshot.status)) {
            return snapshot;
        }
        utils::LogDebug("poller", options.subject + " is " + snapshot.status + ", waiting");

        auto delay = options.interval + ComputeJitter(options.interval, rng);
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        delay = std::max(std::chrono::milliseconds(0), std::min(delay, remaining));
        if (!options.cancel.has_value()) {
            std::this_thread::sleep_for(delay);
        } else if (options.cancel->WaitFor(delay)) {
            ThrowIfCancelled(options);
        }
    }
}

}  // namespace scalebox::polling
