#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "process/output_accumulator.hpp"
#include "process/process_handle.hpp"

namespace scalebox::process {

struct PtyResult {
    std::int32_t exit_code = 0;
    std::string data;
    std::optional<std::string> error;
};

using PtyDataCallback = std::function<void(const std::string& bytes)>;
using SendHandler = std::function<void(std::uint32_t pid, const std::string& bytes)>;
using ResizeHandler = std::function<void(std::uint32_t pid, const PtySize& size)>;

class PtyHandle : public ProcessHandle {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    PtyHandle(Passkey,
              std::shared_ptr<ProcessEventStream> events,
              KillHandler on_kill,
              SendHandler on_send,
              ResizeHandler on_resize,
              StartHandler on_start,
              PtyDataCallback on_data);

    static std::shared_ptr<PtyHandle> Create(
        std::shared_ptr<ProcessEventStream> events,
        KillHandler on_kill,
        SendHandler on_send,
        ResizeHandler on_resize,
        StartHandler on_start = {},
        PtyDataCallback on_data = {});

    // Raw terminal output received so far.
    std::string Data() const { return data_.Snapshot(); }
    std::optional<std::int32_t> ExitCode() const;

    // Writes to the terminal input. Fails fast before the Start event.
    void Send(const std::string& bytes);
    void Resize(const PtySize& size);

    PtyResult Wait() const;

protected:
    void HandleData(const DataEvent& event) override;
    void HandleEnd(const EndEvent& event) override;

private:
    OutputAccumulator data_;
    SendHandler on_send_;
    ResizeHandler on_resize_;
    PtyDataCallback on_data_;

    mutable std::mutex result_mutex_;
    std::optional<PtyResult> result_;
};

}  // namespace scalebox::process
