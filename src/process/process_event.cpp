#include "process/process_event.hpp"

#include "errors/errors.hpp"
#include "utils/common.hpp"

namespace scalebox::process {
namespace {

std::optional<std::string> OptionalString(const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || source[key].is_null()) {
        return std::nullopt;
    }
    auto value = source[key].get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<ProcessEvent> DecodeData(const nlohmann::json& data) {
    // Connect nests the stream case under "output"; flattened payloads are accepted too.
    const auto& output = data.contains("output") && data["output"].is_object() ? data["output"] : data;
    static const std::pair<const char*, OutputStream> kCases[] = {
        {"stdout", OutputStream::kStdout},
        {"stderr", OutputStream::kStderr},
        {"pty", OutputStream::kPty}
    };
    for (const auto& [key, stream] : kCases) {
        if (output.contains(key) && !output[key].is_null()) {
            DataEvent event{};
            event.stream = stream;
            event.bytes = utils::Base64Decode(output[key].get<std::string>());
            return event;
        }
    }
    return std::nullopt;
}

}  // namespace

const char* ToString(OutputStream stream) {
    switch (stream) {
        case OutputStream::kStdout: return "stdout";
        case OutputStream::kStderr: return "stderr";
        case OutputStream::kPty: return "pty";
    }
    return "unknown";
}

std::optional<ProcessEvent> DecodeProcessEvent(const nlohmann::json& message) {
    if (!message.is_object()) {
        return std::nullopt;
    }
    const auto& event = message.contains("event") && message["event"].is_object() ? message["event"] : message;

    if (event.contains("start") && event["start"].is_object()) {
        StartEvent start{};
        start.pid = event["start"].value("pid", 0u);
        return start;
    }
    if (event.contains("data") && event["data"].is_object()) {
        return DecodeData(event["data"]);
    }
    if (event.contains("end") && event["end"].is_object()) {
        const auto& end_json = event["end"];
        EndEvent end{};
        end.exit_code = end_json.value("exitCode", 0);
        end.exited = end_json.value("exited", false);
        end.status = OptionalString(end_json, "status");
        end.error = OptionalString(end_json, "error");
        return end;
    }
    if (event.contains("keepalive")) {
        return KeepaliveEvent{};
    }
    return std::nullopt;
}

ProcessSelector ProcessSelector::ByPid(std::uint32_t pid) {
    return ProcessSelector(pid);
}

ProcessSelector ProcessSelector::ByTag(std::string tag) {
    if (tag.empty()) {
        throw errors::InvalidArgumentError("ProcessSelector must have either pid or tag");
    }
    return ProcessSelector(std::move(tag));
}

std::uint32_t ProcessSelector::Pid() const {
    if (!HasPid()) {
        throw errors::InvalidArgumentError("ProcessSelector selects by tag, not pid");
    }
    return std::get<std::uint32_t>(value_);
}

const std::string& ProcessSelector::Tag() const {
    if (HasPid()) {
        throw errors::InvalidArgumentError("ProcessSelector selects by pid, not tag");
    }
    return std::get<std::string>(value_);
}

std::string ProcessSelector::Describe() const {
    if (HasPid()) {
        return "pid=" + std::to_string(std::get<std::uint32_t>(value_));
    }
    return "tag=" + std::get<std::string>(value_);
}

}  // namespace scalebox::process
