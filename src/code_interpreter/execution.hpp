#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "code_interpreter/charts.hpp"
#include "nlohmann/json.hpp"

namespace scalebox::code_interpreter {

// One rich output of a cell. Every representation is optional; a plot
// usually carries png plus a text fallback.
struct Result {
    std::optional<std::string> text;
    std::optional<std::string> html;
    std::optional<std::string> markdown;
    std::optional<std::string> svg;
    std::optional<std::string> png;
    std::optional<std::string> jpeg;
    std::optional<std::string> pdf;
    std::optional<std::string> latex;
    std::optional<nlohmann::json> json_data;
    std::optional<std::string> javascript;
    std::optional<nlohmann::json> data;
    std::optional<Chart> chart;
    std::optional<int> execution_count;
    bool is_main_result = false;
    nlohmann::json extra = nlohmann::json::object();

    bool HasMedia() const { return png || svg || html || jpeg; }
    nlohmann::json ToJson() const;
};

struct ExecutionError {
    std::string name;
    std::string value;
    std::string message;
    std::optional<std::string> traceback;

    nlohmann::json ToJson() const;
};

enum class OutputType {
    kStdout,
    kStderr
};

const char* ToString(OutputType type);

struct OutputMessage {
    std::string content;
    std::chrono::system_clock::time_point timestamp;
    OutputType type = OutputType::kStdout;
    bool error = false;
};

struct Logs {
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;

    nlohmann::json ToJson() const;
};

// Aggregate of one code execution, grown in place by ParseOutput.
struct Execution {
    std::vector<Result> results;
    Logs logs;
    std::optional<ExecutionError> error;
    std::optional<int> execution_count;

    // Text of the first main result, if any.
    std::optional<std::string> Text() const;
    nlohmann::json ToJson() const;
};

struct ExecutionLogs {
    std::string stdout_text;
    std::string stderr_text;
    std::vector<OutputMessage> output;
    std::vector<ExecutionError> errors;
};

// Terminal snapshot handed to callers of RunCode.
struct ExecutionResult {
    std::string text;
    std::optional<std::string> png;
    std::optional<std::string> svg;
    std::optional<std::string> html;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool success = false;
    std::optional<Result> result;
    std::vector<Result> results;
    std::optional<ExecutionError> error;
    ExecutionLogs logs;
    std::chrono::milliseconds execution_time{0};
    std::string language;
    std::optional<std::string> context_id;
};

}  // namespace scalebox::code_interpreter
