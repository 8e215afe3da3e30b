#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "process/output_accumulator.hpp"
#include "process/process_handle.hpp"

namespace scalebox::process {

struct CommandResult {
    std::int32_t exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> error;
};

using OutputCallback = std::function<void(const std::string& chunk)>;

// Handle of a command started or connected through Commands.
class CommandHandle : public ProcessHandle {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    CommandHandle(Passkey,
                  std::shared_ptr<ProcessEventStream> events,
                  KillHandler on_kill,
                  StartHandler on_start,
                  OutputCallback on_stdout,
                  OutputCallback on_stderr);

    static std::shared_ptr<CommandHandle> Create(
        std::shared_ptr<ProcessEventStream> events,
        KillHandler on_kill,
        StartHandler on_start = {},
        OutputCallback on_stdout = {},
        OutputCallback on_stderr = {});

    std::string Stdout() const { return stdout_.Snapshot(); }
    std::string Stderr() const { return stderr_.Snapshot(); }

    // Unset while the command is still running.
    std::optional<std::int32_t> ExitCode() const;
    // Error reported by the end event, else the stream failure message.
    std::optional<std::string> Error() const;

    // Blocks until the stream stops. Rethrows a stream failure; throws
    // ScaleboxError when the stream ended without an end event.
    CommandResult Wait() const;

protected:
    void HandleData(const DataEvent& event) override;
    void HandleEnd(const EndEvent& event) override;

private:
    OutputAccumulator stdout_;
    OutputAccumulator stderr_;
    OutputCallback on_stdout_;
    OutputCallback on_stderr_;

    mutable std::mutex result_mutex_;
    std::optional<CommandResult> result_;
};

}  // namespace scalebox::process
