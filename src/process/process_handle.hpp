#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "process/process_event.hpp"

namespace scalebox::process {

class ProcessHandle;

using KillHandler = std::function<bool(std::uint32_t pid)>;
using StartHandler = std::function<void(std::uint32_t pid, std::weak_ptr<ProcessHandle> handle)>;

// Local view of one remote process, fed by its event stream on a dedicated
// consumption thread. Subclasses decide what Data and End mean.
//
// State machine: kCreated -> kStarted -> kTerminated, kCreated -> kFailed,
// kStarted -> kFailed. kTerminated and kFailed are final.
class ProcessHandle : public std::enable_shared_from_this<ProcessHandle> {
public:
    enum class State {
        kCreated,
        kStarted,
        kTerminated,
        kFailed
    };

    virtual ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // Throws ProcessNotStartedError until the Start event was consumed.
    std::uint32_t Pid() const;
    std::optional<std::uint32_t> TryPid() const;

    State GetState() const;
    bool IsDone() const;
    std::exception_ptr IterationError() const;

    // Returns false when the loop is still running after timeout.
    bool WaitUntilDone(std::chrono::milliseconds timeout) const;

    // SIGKILL out of band. false means the process was already gone.
    bool Kill();

protected:
    ProcessHandle(std::string log_tag,
                  std::shared_ptr<ProcessEventStream> events,
                  KillHandler on_kill,
                  StartHandler on_start);

    // Called by the owning factory once the handle is held by a shared_ptr.
    void StartConsuming();
    void WaitUntilDone() const;

    std::uint32_t RequirePid(const std::string& action) const;
    void InvokeCallback(const char* name, const std::function<void()>& callback) const;
    const std::string& log_tag() const { return log_tag_; }

    virtual void HandleData(const DataEvent& event) = 0;
    virtual void HandleEnd(const EndEvent& event) = 0;

private:
    // The worker owns its own reference to the stream and pins the handle
    // only while one event is dispatched, so the last shared_ptr may be
    // released from inside a callback.
    static void Consume(std::weak_ptr<ProcessHandle> weak,
                        std::shared_ptr<ProcessEventStream> events,
                        std::string log_tag);
    // Returns true once the end event was handled.
    bool Dispatch(const ProcessEvent& event);
    void HandleStart(const StartEvent& event);
    void Finish(State state, std::exception_ptr error);

    std::string log_tag_;
    std::shared_ptr<ProcessEventStream> events_;
    KillHandler on_kill_;
    StartHandler on_start_;

    mutable std::mutex mutex_;
    mutable std::condition_variable done_cv_;
    std::optional<std::uint32_t> pid_;
    State state_ = State::kCreated;
    bool done_ = false;
    std::exception_ptr iteration_error_;
    std::thread worker_;
};

const char* ToString(ProcessHandle::State state);

}  // namespace scalebox::process
