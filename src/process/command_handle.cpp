#include "process/command_handle.hpp"

#include "errors/errors.hpp"
#include "utils/logging.hpp"

namespace scalebox::process {

std::shared_ptr<CommandHandle> CommandHandle::Create(
    std::shared_ptr<ProcessEventStream> events,
    KillHandler on_kill,
    StartHandler on_start,
    OutputCallback on_stdout,
    OutputCallback on_stderr) {
    auto handle = std::make_shared<CommandHandle>(
        Passkey{},
        std::move(events),
        std::move(on_kill),
        std::move(on_start),
        std::move(on_stdout),
        std::move(on_stderr));
    handle->StartConsuming();
    return handle;
}

CommandHandle::CommandHandle(Passkey,
                             std::shared_ptr<ProcessEventStream> events,
                             KillHandler on_kill,
                             StartHandler on_start,
                             OutputCallback on_stdout,
                             OutputCallback on_stderr)
    : ProcessHandle("process", std::move(events), std::move(on_kill), std::move(on_start))
    , on_stdout_(std::move(on_stdout))
    , on_stderr_(std::move(on_stderr)) {}

std::optional<std::int32_t> CommandHandle::ExitCode() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    if (!result_.has_value()) {
        return std::nullopt;
    }
    return result_->exit_code;
}

std::optional<std::string> CommandHandle::Error() const {
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        if (result_.has_value() && result_->error.has_value()) {
            return result_->error;
        }
    }
    if (const auto failure = IterationError()) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& ex) {
            return std::string(ex.what());
        } catch (...) {
            return std::string("unknown error");
        }
    }
    return std::nullopt;
}

CommandResult CommandHandle::Wait() const {
    WaitUntilDone();
    if (const auto failure = IterationError()) {
        std::rethrow_exception(failure);
    }
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        if (result_.has_value()) {
            return *result_;
        }
    }
    const auto pid = TryPid();
    throw errors::ScaleboxError(
        "Command execution failed: no result received (PID: " +
            (pid.has_value() ? std::to_string(*pid) : std::string("unknown")) + ")",
        "no_result");
}

void CommandHandle::HandleData(const DataEvent& event) {
    switch (event.stream) {
        case OutputStream::kStdout:
            stdout_.Append(event.bytes);
            if (on_stdout_) {
                InvokeCallback("stdout", [&]() { on_stdout_(event.bytes); });
            }
            break;
        case OutputStream::kStderr:
            stderr_.Append(event.bytes);
            if (on_stderr_) {
                InvokeCallback("stderr", [&]() { on_stderr_(event.bytes); });
            }
            break;
        case OutputStream::kPty:
            utils::LogDebug(log_tag(), "ignoring pty output on a command stream");
            break;
    }
}

void CommandHandle::HandleEnd(const EndEvent& event) {
    CommandResult result{};
    result.exit_code = event.exit_code;
    result.stdout_text = stdout_.Snapshot();
    result.stderr_text = stderr_.Snapshot();
    result.error = event.error;
    std::lock_guard<std::mutex> lock(result_mutex_);
    result_ = std::move(result);
}

}  // namespace scalebox::process
