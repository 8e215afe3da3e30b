#include "code_interpreter/execution.hpp"

namespace scalebox::code_interpreter {

namespace {

template <typename T>
void SetIfPresent(nlohmann::json& out, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        out[key] = *value;
    }
}

}  // namespace

nlohmann::json Result::ToJson() const {
    nlohmann::json out = nlohmann::json::object();
    SetIfPresent(out, "text", text);
    SetIfPresent(out, "html", html);
    SetIfPresent(out, "markdown", markdown);
    SetIfPresent(out, "svg", svg);
    SetIfPresent(out, "png", png);
    SetIfPresent(out, "jpeg", jpeg);
    SetIfPresent(out, "pdf", pdf);
    SetIfPresent(out, "latex", latex);
    SetIfPresent(out, "json", json_data);
    SetIfPresent(out, "javascript", javascript);
    SetIfPresent(out, "data", data);
    if (chart.has_value()) {
        out["chart"] = SerializeChart(*chart);
    }
    SetIfPresent(out, "execution_count", execution_count);
    out["is_main_result"] = is_main_result;
    out["extra"] = extra;
    return out;
}

nlohmann::json ExecutionError::ToJson() const {
    nlohmann::json out = {
        {"name", name},
        {"value", value},
        {"message", message}
    };
    SetIfPresent(out, "traceback", traceback);
    return out;
}

const char* ToString(OutputType type) {
    switch (type) {
        case OutputType::kStdout: return "stdout";
        case OutputType::kStderr: return "stderr";
    }
    return "unknown";
}

nlohmann::json Logs::ToJson() const {
    return nlohmann::json{
        {"stdout", stdout_lines},
        {"stderr", stderr_lines}
    };
}

std::optional<std::string> Execution::Text() const {
    for (const auto& result : results) {
        if (result.is_main_result) {
            return result.text;
        }
    }
    return std::nullopt;
}

nlohmann::json Execution::ToJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& result : results) {
        items.push_back(result.ToJson());
    }
    nlohmann::json out = {
        {"results", items},
        {"logs", logs.ToJson()}
    };
    if (error.has_value()) {
        out["error"] = error->ToJson();
    }
    SetIfPresent(out, "execution_count", execution_count);
    return out;
}

}  // namespace scalebox::code_interpreter
