#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "process/command_handle.hpp"
#include "process/handle_registry.hpp"
#include "process/process_service.hpp"

namespace scalebox::process {

struct CommandStartOptions {
    std::map<std::string, std::string> envs;
    std::optional<std::string> cwd;
    std::optional<std::string> tag;
    OutputCallback on_stdout;
    OutputCallback on_stderr;
    std::chrono::milliseconds timeout{config::kDefaultCommandTimeoutMs};
};

struct CommandConnectOptions {
    OutputCallback on_stdout;
    OutputCallback on_stderr;
    std::chrono::milliseconds timeout{config::kDefaultCommandTimeoutMs};
};

// Runs shell commands in the sandbox. Handles call back into the manager for
// Kill(), so the manager must outlive every handle it returned.
class Commands {
public:
    explicit Commands(ProcessService& service);

    Commands(const Commands&) = delete;
    Commands& operator=(const Commands&) = delete;

    std::vector<ProcessInfo> List();

    // Starts `/bin/bash -l -c <cmd>` and returns without waiting for output.
    std::shared_ptr<CommandHandle> Start(const std::string& cmd, const CommandStartOptions& options = {});
    // Start followed by Wait().
    CommandResult Run(const std::string& cmd, const CommandStartOptions& options = {});
    std::shared_ptr<CommandHandle> Connect(std::uint32_t pid, const CommandConnectOptions& options = {});

    // false when the process no longer exists.
    bool Kill(std::uint32_t pid);
    void SendStdin(std::uint32_t pid, const std::string& data);

    std::shared_ptr<CommandHandle> Find(std::uint32_t pid) const;
    std::vector<std::uint32_t> Running() const;

private:
    std::shared_ptr<CommandHandle> Track(std::shared_ptr<ProcessEventStream> events,
                                         const OutputCallback& on_stdout,
                                         const OutputCallback& on_stderr);

    ProcessService& service_;
    HandleRegistry<CommandHandle> handles_;
};

}  // namespace scalebox::process
