#include "process/commands.hpp"

#include "errors/errors.hpp"
#include "utils/logging.hpp"

namespace scalebox::process {

Commands::Commands(ProcessService& service)
    : service_(service) {}

std::vector<ProcessInfo> Commands::List() {
    return service_.List();
}

std::shared_ptr<CommandHandle> Commands::Start(const std::string& cmd, const CommandStartOptions& options) {
    if (cmd.empty()) {
        throw errors::InvalidArgumentError("command must not be empty");
    }
    StartRequest request{
        .process = ProcessConfig{
            .cmd = "/bin/bash",
            .args = {"-l", "-c", cmd},
            .envs = options.envs,
            .cwd = options.cwd,
        },
        .pty = std::nullopt,
        .tag = options.tag,
        .timeout = options.timeout,
        .keepalive_interval = std::chrono::seconds(config::kKeepalivePingIntervalS),
    };
    utils::LogDebug("commands", "starting: " + cmd);
    return Track(service_.Start(request), options.on_stdout, options.on_stderr);
}

CommandResult Commands::Run(const std::string& cmd, const CommandStartOptions& options) {
    auto handle = Start(cmd, options);
    return handle->Wait();
}

std::shared_ptr<CommandHandle> Commands::Connect(std::uint32_t pid, const CommandConnectOptions& options) {
    utils::LogDebug("commands", "connecting to pid " + std::to_string(pid));
    auto events = service_.Connect(ProcessSelector::ByPid(pid), options.timeout);
    return Track(std::move(events), options.on_stdout, options.on_stderr);
}

bool Commands::Kill(std::uint32_t pid) {
    try {
        service_.SendSignal(ProcessSelector::ByPid(pid), Signal::kSigkill);
    } catch (const std::exception& ex) {
        if (errors::IsNotFoundError(ex)) {
            utils::LogDebug("commands", "kill: pid " + std::to_string(pid) + " not found");
            return false;
        }
        throw errors::SandboxError(
            "Failed to kill process " + std::to_string(pid) + ": " + ex.what(), "kill_failed");
    }
    return true;
}

void Commands::SendStdin(std::uint32_t pid, const std::string& data) {
    service_.SendInput(ProcessSelector::ByPid(pid), ProcessInput{ProcessInput::Kind::kStdin, data});
}

std::shared_ptr<CommandHandle> Commands::Find(std::uint32_t pid) const {
    return handles_.Find(pid);
}

std::vector<std::uint32_t> Commands::Running() const {
    return handles_.Running();
}

std::shared_ptr<CommandHandle> Commands::Track(std::shared_ptr<ProcessEventStream> events,
                                               const OutputCallback& on_stdout,
                                               const OutputCallback& on_stderr) {
    return CommandHandle::Create(
        std::move(events),
        [this](std::uint32_t pid) { return Kill(pid); },
        [this](std::uint32_t pid, std::weak_ptr<ProcessHandle> handle) { handles_.Register(pid, std::move(handle)); },
        on_stdout,
        on_stderr);
}

}  // namespace scalebox::process
