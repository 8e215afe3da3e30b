#include <catch2/catch.hpp>

#include <stdexcept>

#include "code_interpreter/output_parser.hpp"

using namespace scalebox::code_interpreter;
using nlohmann::json;

namespace {

ResultEvent MakeResult(const char* payload) {
    return ResultEvent{json::parse(payload)};
}

}  // namespace

TEST_CASE("ParseOutput appends logs and notifies handlers", "[output_parser]") {
    Execution execution;
    std::vector<OutputMessage> messages;
    OutputHandlers handlers;
    handlers.on_stdout = [&](const OutputMessage& message) { messages.push_back(message); };
    handlers.on_stderr = [&](const OutputMessage& message) { messages.push_back(message); };

    ParseOutput(execution, StdoutEvent{"hello\n"}, handlers);
    ParseOutput(execution, StderrEvent{"warning\n"}, handlers);
    ParseOutput(execution, StdoutEvent{""}, handlers);

    CHECK(execution.logs.stdout_lines == std::vector<std::string>{"hello\n"});
    CHECK(execution.logs.stderr_lines == std::vector<std::string>{"warning\n"});
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].type == OutputType::kStdout);
    CHECK_FALSE(messages[0].error);
    CHECK(messages[1].type == OutputType::kStderr);
    CHECK(messages[1].error);
}

TEST_CASE("ParseOutput records results and the main execution count", "[output_parser]") {
    Execution execution;
    int results_seen = 0;
    OutputHandlers handlers;
    handlers.on_result = [&](const Result&) { ++results_seen; };

    ParseOutput(execution, MakeResult(R"({"png": "iVBOR", "executionCount": 2})"), handlers);
    ParseOutput(execution, MakeResult(R"({"text": "42", "isMainResult": true, "executionCount": 3})"), handlers);

    CHECK(results_seen == 2);
    REQUIRE(execution.results.size() == 2);
    CHECK(execution.execution_count == std::optional<int>(3));
    CHECK(execution.Text() == std::optional<std::string>("42"));
    CHECK_FALSE(execution.error.has_value());
}

TEST_CASE("ParseOutput decodes a chart carried by a result", "[output_parser]") {
    Execution execution;
    ParseOutput(execution, MakeResult(R"({
        "text": "<Figure>",
        "chart": {"type": "pie", "title": "p", "elements": [{"label": "a", "angle": 180, "radius": 1}]}
    })"));
    REQUIRE(execution.results.size() == 1);
    REQUIRE(execution.results[0].chart.has_value());
    CHECK(GetChartType(*execution.results[0].chart) == ChartType::kPie);
}

TEST_CASE("ParseOutput turns an error event into the execution error", "[output_parser]") {
    Execution execution;
    std::optional<ExecutionError> reported;
    OutputHandlers handlers;
    handlers.on_error = [&](const ExecutionError& error) { reported = error; };

    ParseOutput(execution, ErrorEvent{"NameError", "name 'x' is not defined", std::string("Traceback...")}, handlers);

    REQUIRE(execution.error.has_value());
    CHECK(execution.error->name == "NameError");
    CHECK(execution.error->message == "name 'x' is not defined");
    REQUIRE(reported.has_value());
    CHECK(reported->traceback == std::optional<std::string>("Traceback..."));
}

TEST_CASE("ParseOutput converts malformed results into a ParseError", "[output_parser]") {
    Execution execution;
    std::optional<ExecutionError> reported;
    OutputHandlers handlers;
    handlers.on_error = [&](const ExecutionError& error) { reported = error; };

    ParseOutput(execution, MakeResult(R"({"text": 12})"), handlers);
    ParseOutput(execution, MakeResult(R"("not an object")"), handlers);

    CHECK(execution.results.empty());
    REQUIRE(execution.error.has_value());
    CHECK(execution.error->name == "ParseError");
    CHECK_THAT(execution.error->message, Catch::StartsWith("Failed to parse execution output:"));
    REQUIRE(reported.has_value());
    CHECK(reported->name == "ParseError");
}

TEST_CASE("ParseOutput swallows handler exceptions", "[output_parser]") {
    Execution execution;
    OutputHandlers handlers;
    handlers.on_stdout = [](const OutputMessage&) { throw std::runtime_error("handler broke"); };

    ParseOutput(execution, StdoutEvent{"a"}, handlers);
    ParseOutput(execution, StdoutEvent{"b"}, handlers);

    CHECK(execution.logs.stdout_lines.size() == 2);
    CHECK_FALSE(execution.error.has_value());
}

TEST_CASE("ParseOutput swallows non-standard handler exceptions", "[output_parser]") {
    Execution execution;
    OutputHandlers handlers;
    handlers.on_stdout = [](const OutputMessage&) { throw 7; };

    CHECK_NOTHROW(ParseOutput(execution, StdoutEvent{"a"}, handlers));
    CHECK_NOTHROW(ParseOutput(execution, StdoutEvent{"b"}, handlers));
    CHECK(execution.logs.stdout_lines == std::vector<std::string>{"a", "b"});
    CHECK_FALSE(execution.error.has_value());
}

TEST_CASE("ExecutionToResult keeps a text-only main result", "[output_parser]") {
    Execution execution;
    ParseOutput(execution, MakeResult(R"({"text": "42", "isMainResult": true})"));
    ParseOutput(execution, MakeResult(R"({"png": "iVBOR"})"));

    const auto result = ExecutionToResult(execution, "python");
    CHECK(result.text == "42");
    CHECK_FALSE(result.png.has_value());
    CHECK(result.success);
    CHECK(result.exit_code == 0);
}

TEST_CASE("ExecutionToResult falls back past an empty main result", "[output_parser]") {
    Execution execution;
    ParseOutput(execution, MakeResult(R"({"isMainResult": true, "markdown": "**x**"})"));
    ParseOutput(execution, MakeResult(R"({"png": "iVBOR", "text": "<Figure>"})"));

    const auto result = ExecutionToResult(execution, "python");
    CHECK(result.png == std::optional<std::string>("iVBOR"));
    CHECK(result.text == "<Figure>");
    REQUIRE(result.result.has_value());
    CHECK_FALSE(result.result->is_main_result);
}

TEST_CASE("ExecutionToResult falls back to media when nothing is main", "[output_parser]") {
    Execution execution;
    ParseOutput(execution, StdoutEvent{"plotting\n"});
    ParseOutput(execution, MakeResult(R"({"markdown": "# title"})"));
    ParseOutput(execution, MakeResult(R"({"svg": "<svg/>"})"));

    const auto result = ExecutionToResult(execution, "python", std::string("ctx-1"));
    CHECK(result.svg == std::optional<std::string>("<svg/>"));
    CHECK(result.text == "plotting\n");
    CHECK_FALSE(result.success);
    CHECK(result.context_id == std::optional<std::string>("ctx-1"));
    CHECK(result.language == "python");
}

TEST_CASE("ExecutionToResult without media or main keeps stdout as text", "[output_parser]") {
    Execution execution;
    ParseOutput(execution, StdoutEvent{"a"});
    ParseOutput(execution, StdoutEvent{"b"});
    ParseOutput(execution, StderrEvent{"c"});
    ParseOutput(execution, MakeResult(R"({"json": {"k": 1}})"));

    const auto result = ExecutionToResult(execution, "python");
    CHECK_FALSE(result.result.has_value());
    CHECK(result.text == "ab");
    CHECK(result.stdout_text == "ab");
    CHECK(result.stderr_text == "c");
    REQUIRE(result.logs.output.size() == 3);
    CHECK(result.logs.output[0].content == "a");
    CHECK(result.logs.output[2].type == OutputType::kStderr);
    CHECK(result.logs.output[2].error);
}

TEST_CASE("ExecutionToResult marks errors as failed runs", "[output_parser]") {
    Execution execution;
    ParseOutput(execution, MakeResult(R"({"text": "partial", "isMainResult": true})"));
    ParseOutput(execution, ErrorEvent{"ZeroDivisionError", "division by zero", std::nullopt});

    const auto result = ExecutionToResult(execution, "python");
    CHECK(result.exit_code == 1);
    CHECK_FALSE(result.success);
    REQUIRE(result.logs.errors.size() == 1);
    CHECK(result.logs.errors[0].name == "ZeroDivisionError");
}

TEST_CASE("DecodeExecutionEvent maps each event case", "[output_parser]") {
    auto out = DecodeExecutionEvent(json::parse(R"({"event": {"stdout": {"content": "hi"}}})"));
    REQUIRE(out.has_value());
    CHECK(std::get<StdoutEvent>(*out).content == "hi");

    auto err = DecodeExecutionEvent(json::parse(R"({"stderr": {"content": "warn"}})"));
    REQUIRE(err.has_value());
    CHECK(std::get<StderrEvent>(*err).content == "warn");

    auto result = DecodeExecutionEvent(json::parse(R"({"result": {"text": "1"}})"));
    REQUIRE(result.has_value());
    CHECK(std::get<ResultEvent>(*result).payload.at("text") == "1");

    auto error = DecodeExecutionEvent(json::parse(
        R"({"error": {"name": "E", "value": "v", "traceback": ["line 1", "line 2"]}})"));
    REQUIRE(error.has_value());
    CHECK(std::get<ErrorEvent>(*error).traceback == std::optional<std::string>("line 1\nline 2"));

    CHECK_FALSE(DecodeExecutionEvent(json::parse(R"({"heartbeat": {}})")).has_value());
}

TEST_CASE("Execution serializes results and logs", "[output_parser]") {
    Execution execution;
    ParseOutput(execution, StdoutEvent{"x"});
    ParseOutput(execution, MakeResult(R"({"text": "1", "isMainResult": true, "executionCount": 1})"));

    const auto data = execution.ToJson();
    CHECK(data.at("logs").at("stdout") == json::array({"x"}));
    CHECK(data.at("results").size() == 1);
    CHECK(data.at("results")[0].at("is_main_result") == true);
    CHECK(data.at("execution_count") == 1);
    CHECK_FALSE(data.contains("error"));
}
