#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>

#include "config/config_schema.hpp"

namespace scalebox::polling {

struct StatusSnapshot {
    std::string id;
    std::string status;
    std::optional<std::string> substatus;
    std::optional<std::string> reason;
    std::string updated_at;
};

// Shared cancellation flag. Copies observe the same state, so the caller
// keeps one copy and hands another to the poller.
class CancellationToken {
public:
    CancellationToken();

    void Cancel();
    bool IsCancelled() const;

    // Sleeps up to timeout. Returns true as soon as the token is cancelled.
    bool WaitFor(std::chrono::milliseconds timeout) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;
};

struct PollOptions {
    std::chrono::milliseconds timeout{config::kDefaultSandboxTimeoutMs};
    std::chrono::milliseconds interval{config::kDefaultPollIntervalMs};
    std::optional<CancellationToken> cancel;
    // Used in error messages, e.g. "sandbox sbx-1".
    std::string subject = "status";
};

// Timing taken from the loaded configuration; no cancellation token.
PollOptions PollOptionsFromConfig(const config::PollingConfig& polling);

using FetchStatus = std::function<StatusSnapshot()>;
using IsTerminal = std::function<bool(const std::string& status)>;

// Uniform in [0, min(500 ms, interval / 10)).
std::chrono::milliseconds ComputeJitter(std::chrono::milliseconds interval, std::mt19937& rng);

// Case-insensitive membership test over target statuses.
IsTerminal IsStatusIn(const std::set<std::string>& targets);

// Polls fetch until is_terminal accepts the status. Throws
// errors::PollAbortedError when cancelled, errors::PollTimeoutError once the
// deadline passes; errors from fetch propagate unchanged.
StatusSnapshot PollUntil(const FetchStatus& fetch, const IsTerminal& is_terminal, const PollOptions& options = {});

}  // namespace scalebox::polling
