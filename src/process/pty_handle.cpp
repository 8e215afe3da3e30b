#include "process/pty_handle.hpp"

#include "errors/errors.hpp"
#include "utils/logging.hpp"

namespace scalebox::process {

std::shared_ptr<PtyHandle> PtyHandle::Create(
    std::shared_ptr<ProcessEventStream> events,
    KillHandler on_kill,
    SendHandler on_send,
    ResizeHandler on_resize,
    StartHandler on_start,
    PtyDataCallback on_data) {
    auto handle = std::make_shared<PtyHandle>(
        Passkey{},
        std::move(events),
        std::move(on_kill),
        std::move(on_send),
        std::move(on_resize),
        std::move(on_start),
        std::move(on_data));
    handle->StartConsuming();
    return handle;
}

PtyHandle::PtyHandle(Passkey,
                     std::shared_ptr<ProcessEventStream> events,
                     KillHandler on_kill,
                     SendHandler on_send,
                     ResizeHandler on_resize,
                     StartHandler on_start,
                     PtyDataCallback on_data)
    : ProcessHandle("pty", std::move(events), std::move(on_kill), std::move(on_start))
    , on_send_(std::move(on_send))
    , on_resize_(std::move(on_resize))
    , on_data_(std::move(on_data)) {}

std::optional<std::int32_t> PtyHandle::ExitCode() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    if (!result_.has_value()) {
        return std::nullopt;
    }
    return result_->exit_code;
}

void PtyHandle::Send(const std::string& bytes) {
    const auto pid = RequirePid("send data");
    on_send_(pid, bytes);
}

void PtyHandle::Resize(const PtySize& size) {
    const auto pid = RequirePid("resize");
    on_resize_(pid, size);
}

PtyResult PtyHandle::Wait() const {
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
    throw errors::ScaleboxError("Pseudo-terminal failed: no result received", "no_result");
}

void PtyHandle::HandleData(const DataEvent& event) {
    if (event.stream != OutputStream::kPty) {
        utils::LogDebug(log_tag(), std::string("ignoring ") + ToString(event.stream) + " output on a pty stream");
        return;
    }
    data_.Append(event.bytes);
    if (on_data_) {
        InvokeCallback("data", [&]() { on_data_(event.bytes); });
    }
}

void PtyHandle::HandleEnd(const EndEvent& event) {
    PtyResult result{};
    result.exit_code = event.exit_code;
    result.data = data_.Snapshot();
    result.error = event.error;
    std::lock_guard<std::mutex> lock(result_mutex_);
    result_ = std::move(result);
}

}  // namespace scalebox::process
