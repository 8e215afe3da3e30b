#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "process/process_event.hpp"

namespace scalebox::process {

struct StartRequest {
    ProcessConfig process;
    std::optional<PtySize> pty;
    std::optional<std::string> tag;
    // Zero disables the stream deadline.
    std::chrono::milliseconds timeout{0};
    std::chrono::seconds keepalive_interval{0};
};

// Process RPC surface of a sandbox, implemented by the transport layer.
// Streams returned by Start/Connect deliver events in arrival order and end
// with Close() or Fail(); side-channel calls throw errors::RpcError.
class ProcessService {
public:
    virtual ~ProcessService() = default;

    virtual std::shared_ptr<ProcessEventStream> Start(const StartRequest& request) = 0;
    virtual std::shared_ptr<ProcessEventStream> Connect(
        const ProcessSelector& selector,
        std::chrono::milliseconds timeout) = 0;
    virtual std::vector<ProcessInfo> List() = 0;
    virtual void SendSignal(const ProcessSelector& selector, Signal signal) = 0;
    virtual void SendInput(const ProcessSelector& selector, const ProcessInput& input) = 0;
    virtual void Update(const ProcessSelector& selector, const PtySize& size) = 0;
};

}  // namespace scalebox::process
