#include "code_interpreter/code_interpreter.hpp"

#include "errors/errors.hpp"
#include "utils/logging.hpp"

namespace scalebox::code_interpreter {

CodeInterpreter::CodeInterpreter(ExecutionService& service)
    : service_(service) {}

ExecutionResult CodeInterpreter::RunCode(const std::string& code, const RunCodeOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    ExecuteRequest request{
        .code = code,
        .language = options.language,
        .context_id = options.context_id,
        .env_vars = options.env_vars,
        .timeout = options.timeout,
    };
    const auto execution = Execute(request, options.handlers);
    auto result = ExecutionToResult(execution, options.language, options.context_id);
    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    utils::LogDebug("execution", "finished in " + std::to_string(result.execution_time.count()) +
                                     " ms, success=" + (result.success ? "true" : "false"));
    return result;
}

Execution CodeInterpreter::Execute(const ExecuteRequest& request, const OutputHandlers& handlers) {
    if (request.code.empty()) {
        throw errors::InvalidArgumentError("code must not be empty");
    }
    Execution execution;
    auto events = service_.Execute(request);
    if (!events) {
        throw errors::SandboxError("execution service returned no stream");
    }
    try {
        ExecutionEvent event;
        while (events->Next(event)) {
            ParseOutput(execution, event, handlers);
        }
    } catch (const std::exception& ex) {
        utils::LogWarn("execution", std::string("execution stream failed: ") + ex.what());
        ParseOutput(execution, ErrorEvent{"ExecutionError", ex.what(), std::nullopt}, handlers);
    }
    return execution;
}

}  // namespace scalebox::code_interpreter
