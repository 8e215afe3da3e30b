#include "code_interpreter/output_parser.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scalebox::code_interpreter {

namespace {

using nlohmann::json;

const json* FindField(const json& data, const char* snake, const char* camel = nullptr) {
    auto it = data.find(snake);
    if (it != data.end() && !it->is_null()) {
        return &*it;
    }
    if (camel != nullptr) {
        it = data.find(camel);
        if (it != data.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<std::string> OptionalString(const json& data, const char* snake, const char* camel = nullptr) {
    if (const auto* value = FindField(data, snake, camel)) {
        return value->get<std::string>();
    }
    return std::nullopt;
}

// Tracebacks come either as one string or as a list of frames.
std::optional<std::string> ReadTraceback(const json& data) {
    const auto* value = FindField(data, "traceback");
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_array()) {
        return utils::Join(value->get<std::vector<std::string>>(), "\n");
    }
    return value->get<std::string>();
}

std::optional<Chart> ReadChart(const json& data) {
    const auto* value = FindField(data, "chart");
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const auto parsed = json::parse(value->get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) {
            utils::LogDebug("execution", "chart payload is not valid JSON");
            return std::nullopt;
        }
        return DeserializeChart(parsed);
    }
    return DeserializeChart(*value);
}

std::string JoinLines(const std::vector<std::string>& lines) {
    return utils::Join(lines, "");
}

template <typename T>
void Notify(const std::function<void(const T&)>& handler, const T& value, const char* name) {
    if (!handler) {
        return;
    }
    try {
        handler(value);
    } catch (const std::exception& ex) {
        utils::LogError("execution", std::string("error in ") + name + " handler: " + ex.what());
    } catch (...) {
        utils::LogError("execution", std::string("error in ") + name + " handler: unknown exception");
    }
}

OutputMessage MakeMessage(const std::string& content, OutputType type) {
    return OutputMessage{
        .content = content,
        .timestamp = utils::Now(),
        .type = type,
        .error = type == OutputType::kStderr,
    };
}

const Result* SelectMainResult(const std::vector<Result>& results) {
    const auto first_media = std::find_if(results.begin(), results.end(),
                                          [](const Result& r) { return r.HasMedia(); });
    const auto main = std::find_if(results.begin(), results.end(),
                                   [](const Result& r) { return r.is_main_result; });
    if (main != results.end()) {
        const bool has_text = main->text.has_value() && !main->text->empty();
        if (has_text || main->HasMedia() || first_media == results.end()) {
            return &*main;
        }
        return &*first_media;
    }
    return first_media == results.end() ? nullptr : &*first_media;
}

}  // namespace

std::optional<ExecutionEvent> DecodeExecutionEvent(const json& message) {
    const json& body = message.contains("event") && message.at("event").is_object() ? message.at("event") : message;
    if (const auto* stdout_event = FindField(body, "stdout")) {
        return StdoutEvent{stdout_event->value("content", std::string())};
    }
    if (const auto* stderr_event = FindField(body, "stderr")) {
        return StderrEvent{stderr_event->value("content", std::string())};
    }
    if (const auto* result = FindField(body, "result")) {
        return ResultEvent{*result};
    }
    if (const auto* error = FindField(body, "error")) {
        return ErrorEvent{
            .name = error->value("name", std::string()),
            .value = error->value("value", std::string()),
            .traceback = ReadTraceback(*error),
        };
    }
    return std::nullopt;
}

Result ParseResult(const json& payload) {
    if (!payload.is_object()) {
        throw std::invalid_argument("result payload must be an object, got " + std::string(payload.type_name()));
    }
    Result result{};
    result.text = OptionalString(payload, "text");
    result.html = OptionalString(payload, "html");
    result.markdown = OptionalString(payload, "markdown");
    result.svg = OptionalString(payload, "svg");
    result.png = OptionalString(payload, "png");
    result.jpeg = OptionalString(payload, "jpeg");
    result.pdf = OptionalString(payload, "pdf");
    result.latex = OptionalString(payload, "latex");
    if (const auto* value = FindField(payload, "json")) {
        result.json_data = *value;
    }
    result.javascript = OptionalString(payload, "javascript");
    if (const auto* value = FindField(payload, "data")) {
        result.data = *value;
    }
    result.chart = ReadChart(payload);
    if (const auto* value = FindField(payload, "execution_count", "executionCount")) {
        result.execution_count = value->get<int>();
    }
    if (const auto* value = FindField(payload, "is_main_result", "isMainResult")) {
        result.is_main_result = value->get<bool>();
    }
    if (const auto* value = FindField(payload, "extra")) {
        result.extra = *value;
    }
    return result;
}

void ParseOutput(Execution& execution, const ExecutionEvent& event, const OutputHandlers& handlers) {
    try {
        std::visit(utils::Overloaded{
            [&](const StdoutEvent& out) {
                if (out.content.empty()) {
                    return;
                }
                execution.logs.stdout_lines.push_back(out.content);
                Notify(handlers.on_stdout, MakeMessage(out.content, OutputType::kStdout), "stdout");
            },
            [&](const StderrEvent& err) {
                if (err.content.empty()) {
                    return;
                }
                execution.logs.stderr_lines.push_back(err.content);
                Notify(handlers.on_stderr, MakeMessage(err.content, OutputType::kStderr), "stderr");
            },
            [&](const ResultEvent& raw) {
                auto result = ParseResult(raw.payload);
                execution.results.push_back(result);
                Notify(handlers.on_result, result, "result");
                if (result.is_main_result && result.execution_count.has_value()) {
                    execution.execution_count = result.execution_count;
                }
            },
            [&](const ErrorEvent& failure) {
                execution.error = ExecutionError{
                    .name = failure.name,
                    .value = failure.value,
                    .message = failure.value,
                    .traceback = failure.traceback,
                };
                Notify(handlers.on_error, *execution.error, "error");
            }
        }, event);
    } catch (const std::exception& ex) {
        utils::LogError("execution", std::string("error parsing execution output: ") + ex.what());
        const std::string message = std::string("Failed to parse execution output: ") + ex.what();
        execution.error = ExecutionError{
            .name = "ParseError",
            .value = message,
            .message = message,
            .traceback = std::nullopt,
        };
        Notify(handlers.on_error, *execution.error, "error");
    }
}

ExecutionResult ExecutionToResult(const Execution& execution,
                                  const std::string& language,
                                  const std::optional<std::string>& context_id) {
    const Result* selected = SelectMainResult(execution.results);
    const bool has_error = execution.error.has_value();
    const std::string joined_stdout = JoinLines(execution.logs.stdout_lines);
    const std::string joined_stderr = JoinLines(execution.logs.stderr_lines);

    ExecutionResult out{};
    if (selected != nullptr && selected->text.has_value() && !selected->text->empty()) {
        out.text = *selected->text;
    } else {
        out.text = joined_stdout;
    }
    if (selected != nullptr) {
        out.png = selected->png;
        out.svg = selected->svg;
        out.html = selected->html;
        out.result = *selected;
    }
    out.stdout_text = joined_stdout;
    out.stderr_text = joined_stderr;
    out.exit_code = has_error ? 1 : 0;
    out.success = !has_error && std::any_of(execution.results.begin(), execution.results.end(), [](const Result& r) {
        return r.is_main_result || (r.text.has_value() && !r.text->empty());
    });
    out.results = execution.results;
    out.error = execution.error;

    out.logs.stdout_text = joined_stdout;
    out.logs.stderr_text = joined_stderr;
    const auto now = utils::Now();
    for (const auto& line : execution.logs.stdout_lines) {
        out.logs.output.push_back(OutputMessage{line, now, OutputType::kStdout, false});
    }
    for (const auto& line : execution.logs.stderr_lines) {
        out.logs.output.push_back(OutputMessage{line, now, OutputType::kStderr, true});
    }
    if (has_error) {
        out.logs.errors.push_back(*execution.error);
    }
    out.language = language;
    out.context_id = context_id;
    return out;
}

}  // namespace scalebox::code_interpreter
