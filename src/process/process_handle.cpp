#include "process/process_handle.hpp"

#include <variant>

#include "errors/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scalebox::process {

const char* ToString(ProcessHandle::State state) {
    switch (state) {
        case ProcessHandle::State::kCreated: return "created";
        case ProcessHandle::State::kStarted: return "started";
        case ProcessHandle::State::kTerminated: return "terminated";
        case ProcessHandle::State::kFailed: return "failed";
    }
    return "unknown";
}

ProcessHandle::ProcessHandle(std::string log_tag,
                             std::shared_ptr<ProcessEventStream> events,
                             KillHandler on_kill,
                             StartHandler on_start)
    : log_tag_(std::move(log_tag))
    , events_(std::move(events))
    , on_kill_(std::move(on_kill))
    , on_start_(std::move(on_start)) {
    if (!events_) {
        throw errors::InvalidArgumentError("process handle needs an event stream");
    }
}

ProcessHandle::~ProcessHandle() {
    events_->Cancel();
    if (!worker_.joinable()) {
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        // Destroyed by the worker's own pin; it only touches its stream copy from here on.
        worker_.detach();
        return;
    }
    worker_.join();
}

void ProcessHandle::StartConsuming() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread(&ProcessHandle::Consume, weak_from_this(), events_, log_tag_);
}

std::uint32_t ProcessHandle::Pid() const {
    return RequirePid("read pid");
}

std::optional<std::uint32_t> ProcessHandle::TryPid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

ProcessHandle::State ProcessHandle::GetState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ProcessHandle::IsDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

std::exception_ptr ProcessHandle::IterationError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return iteration_error_;
}

bool ProcessHandle::WaitUntilDone(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return done_; });
}

void ProcessHandle::WaitUntilDone() const {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return done_; });
}

bool ProcessHandle::Kill() {
    const auto pid = RequirePid("kill");
    if (!on_kill_) {
        throw errors::SandboxError("kill is not supported by this handle");
    }
    utils::LogDebug(log_tag_, "killing pid " + std::to_string(pid));
    return on_kill_(pid);
}

std::uint32_t ProcessHandle::RequirePid(const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pid_.has_value()) {
        throw errors::ProcessNotStartedError(
            "Cannot " + action + " - PID not available yet, wait for the process to start",
            "not_started");
    }
    return *pid_;
}

void ProcessHandle::InvokeCallback(const char* name, const std::function<void()>& callback) const {
    try {
        callback();
    } catch (const std::exception& ex) {
        utils::LogError(log_tag_, std::string("error in ") + name + " callback: " + ex.what());
    } catch (...) {
        utils::LogError(log_tag_, std::string("error in ") + name + " callback: unknown exception");
    }
}

void ProcessHandle::Consume(std::weak_ptr<ProcessHandle> weak,
                            std::shared_ptr<ProcessEventStream> events,
                            std::string log_tag) {
    try {
        ProcessEvent event;
        while (events->Next(event)) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (self->Dispatch(event)) {
                self->Finish(State::kTerminated, nullptr);
                return;
            }
        }
    } catch (const std::exception& ex) {
        utils::LogWarn(log_tag, std::string("event stream failed: ") + ex.what());
        if (auto self = weak.lock()) {
            self->Finish(State::kFailed, std::current_exception());
        }
        return;
    } catch (...) {
        utils::LogWarn(log_tag, "event stream failed: unknown exception");
        if (auto self = weak.lock()) {
            self->Finish(State::kFailed, std::current_exception());
        }
        return;
    }

    if (auto self = weak.lock()) {
        utils::LogDebug(log_tag, "event stream closed without an end event");
        self->Finish(State::kFailed, nullptr);
    }
}

bool ProcessHandle::Dispatch(const ProcessEvent& event) {
    return std::visit(utils::Overloaded{
        [this](const StartEvent& start) {
            HandleStart(start);
            return false;
        },
        [this](const DataEvent& data) {
            HandleData(data);
            return false;
        },
        [this](const EndEvent& end) {
            HandleEnd(end);
            return true;
        },
        [](const KeepaliveEvent&) { return false; }
    }, event);
}

void ProcessHandle::HandleStart(const StartEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_.has_value()) {
            utils::LogWarn(log_tag_, "ignoring duplicate start event for pid " + std::to_string(event.pid));
            return;
        }
        pid_ = event.pid;
        state_ = State::kStarted;
    }
    utils::LogDebug(log_tag_, "started pid " + std::to_string(event.pid));
    if (on_start_) {
        on_start_(event.pid, weak_from_this());
    }
}

void ProcessHandle::Finish(State state, std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        iteration_error_ = std::move(error);
        done_ = true;
    }
    done_cv_.notify_all();
}

}  // namespace scalebox::process
