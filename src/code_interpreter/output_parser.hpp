#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "bus/event_stream.hpp"
#include "code_interpreter/execution.hpp"
#include "nlohmann/json.hpp"

namespace scalebox::code_interpreter {

struct StdoutEvent {
    std::string content;
};

struct StderrEvent {
    std::string content;
};

// Raw result payload. Interpreted by ParseOutput so a malformed payload
// fails the execution instead of the transport.
struct ResultEvent {
    nlohmann::json payload;
};

struct ErrorEvent {
    std::string name;
    std::string value;
    std::optional<std::string> traceback;
};

using ExecutionEvent = std::variant<StdoutEvent, StderrEvent, ResultEvent, ErrorEvent>;
using ExecutionEventStream = bus::EventStream<ExecutionEvent>;

// Decodes {"stdout":{"content":..}}, {"result":{..}} and friends, with or
// without an "event" wrapper. Returns nullopt for unknown cases.
std::optional<ExecutionEvent> DecodeExecutionEvent(const nlohmann::json& message);

struct OutputHandlers {
    std::function<void(const OutputMessage&)> on_stdout;
    std::function<void(const OutputMessage&)> on_stderr;
    std::function<void(const Result&)> on_result;
    std::function<void(const ExecutionError&)> on_error;
};

// Folds one event into the execution and notifies the matching handler.
// Never throws for payload problems: they become a ParseError on
// execution.error. Handler exceptions are logged and dropped.
void ParseOutput(Execution& execution, const ExecutionEvent& event, const OutputHandlers& handlers = {});

// Builds a Result from a result payload. Throws nlohmann::json::exception
// on fields of the wrong type.
Result ParseResult(const nlohmann::json& payload);

ExecutionResult ExecutionToResult(const Execution& execution,
                                  const std::string& language,
                                  const std::optional<std::string>& context_id = std::nullopt);

}  // namespace scalebox::code_interpreter
