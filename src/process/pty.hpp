#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "process/handle_registry.hpp"
#include "process/process_service.hpp"
#include "process/pty_handle.hpp"

namespace scalebox::process {

struct PtyStartOptions {
    PtySize size;
    std::optional<std::string> cwd;
    std::map<std::string, std::string> envs;
    PtyDataCallback on_data;
    std::chrono::milliseconds timeout{config::kDefaultCommandTimeoutMs};
};

struct PtyConnectOptions {
    PtyDataCallback on_data;
    std::chrono::milliseconds timeout{config::kDefaultCommandTimeoutMs};
};

// Interactive login shells. Like Commands, must outlive its handles.
class Pty {
public:
    explicit Pty(ProcessService& service);

    Pty(const Pty&) = delete;
    Pty& operator=(const Pty&) = delete;

    std::shared_ptr<PtyHandle> Start(const PtyStartOptions& options = {});
    std::shared_ptr<PtyHandle> Connect(std::uint32_t pid, const PtyConnectOptions& options = {});

    bool Kill(std::uint32_t pid);
    void SendInput(std::uint32_t pid, const std::string& bytes);
    void Resize(std::uint32_t pid, const PtySize& size);

    std::shared_ptr<PtyHandle> Find(std::uint32_t pid) const;
    std::vector<std::uint32_t> Running() const;

private:
    std::shared_ptr<PtyHandle> Track(std::shared_ptr<ProcessEventStream> events, const PtyDataCallback& on_data);

    ProcessService& service_;
    HandleRegistry<PtyHandle> handles_;
};

}  // namespace scalebox::process
