#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "code_interpreter/output_parser.hpp"

namespace scalebox::code_interpreter {

struct ExecuteRequest {
    std::string code;
    std::string language = "python";
    std::optional<std::string> context_id;
    std::map<std::string, std::string> env_vars;
    std::chrono::milliseconds timeout{0};
};

// Streaming execution RPC, implemented by the transport layer. The stream
// ends with Close() after the last event or Fail() on transport errors.
class ExecutionService {
public:
    virtual ~ExecutionService() = default;

    virtual std::shared_ptr<ExecutionEventStream> Execute(const ExecuteRequest& request) = 0;
};

struct RunCodeOptions {
    std::string language = "python";
    std::optional<std::string> context_id;
    std::map<std::string, std::string> env_vars;
    std::chrono::milliseconds timeout{0};
    OutputHandlers handlers;
};

class CodeInterpreter {
public:
    explicit CodeInterpreter(ExecutionService& service);

    // Runs one cell and blocks until its stream ends. Transport failures are
    // reported as the execution error, not thrown.
    ExecutionResult RunCode(const std::string& code, const RunCodeOptions& options = {});

    // Lower level: returns the raw aggregate instead of the snapshot.
    Execution Execute(const ExecuteRequest& request, const OutputHandlers& handlers = {});

private:
    ExecutionService& service_;
};

}  // namespace scalebox::code_interpreter
