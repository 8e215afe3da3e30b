#include "process/pty.hpp"

#include "errors/errors.hpp"
#include "utils/logging.hpp"

namespace scalebox::process {

namespace {

constexpr const char* kDefaultTerm = "xterm-256color";

}  // namespace

Pty::Pty(ProcessService& service)
    : service_(service) {}

std::shared_ptr<PtyHandle> Pty::Start(const PtyStartOptions& options) {
    if (options.size.cols == 0 || options.size.rows == 0) {
        throw errors::InvalidArgumentError("pty size must be positive");
    }
    auto envs = options.envs;
    envs.emplace("TERM", kDefaultTerm);
    StartRequest request{
        .process = ProcessConfig{
            .cmd = "/bin/bash",
            .args = {"-i", "-l"},
            .envs = std::move(envs),
            .cwd = options.cwd,
        },
        .pty = options.size,
        .tag = std::nullopt,
        .timeout = options.timeout,
        .keepalive_interval = std::chrono::seconds(config::kKeepalivePingIntervalS),
    };
    utils::LogDebug("pty", "starting " + std::to_string(options.size.cols) + "x" +
                               std::to_string(options.size.rows) + " terminal");
    return Track(service_.Start(request), options.on_data);
}

std::shared_ptr<PtyHandle> Pty::Connect(std::uint32_t pid, const PtyConnectOptions& options) {
    auto events = service_.Connect(ProcessSelector::ByPid(pid), options.timeout);
    return Track(std::move(events), options.on_data);
}

bool Pty::Kill(std::uint32_t pid) {
    try {
        service_.SendSignal(ProcessSelector::ByPid(pid), Signal::kSigkill);
    } catch (const std::exception& ex) {
        if (errors::IsNotFoundError(ex)) {
            return false;
        }
        throw errors::SandboxError(
            "Failed to kill pty " + std::to_string(pid) + ": " + ex.what(), "kill_failed");
    }
    return true;
}

void Pty::SendInput(std::uint32_t pid, const std::string& bytes) {
    service_.SendInput(ProcessSelector::ByPid(pid), ProcessInput{ProcessInput::Kind::kPty, bytes});
}

void Pty::Resize(std::uint32_t pid, const PtySize& size) {
    if (size.cols == 0 || size.rows == 0) {
        throw errors::InvalidArgumentError("pty size must be positive");
    }
    service_.Update(ProcessSelector::ByPid(pid), size);
}

std::shared_ptr<PtyHandle> Pty::Find(std::uint32_t pid) const {
    return handles_.Find(pid);
}

std::vector<std::uint32_t> Pty::Running() const {
    return handles_.Running();
}

std::shared_ptr<PtyHandle> Pty::Track(std::shared_ptr<ProcessEventStream> events, const PtyDataCallback& on_data) {
    return PtyHandle::Create(
        std::move(events),
        [this](std::uint32_t pid) { return Kill(pid); },
        [this](std::uint32_t pid, const std::string& bytes) { SendInput(pid, bytes); },
        [this](std::uint32_t pid, const PtySize& size) { Resize(pid, size); },
        [this](std::uint32_t pid, std::weak_ptr<ProcessHandle> handle) { handles_.Register(pid, std::move(handle)); },
        on_data);
}

}  // namespace scalebox::process
