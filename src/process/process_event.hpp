#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "bus/event_stream.hpp"
#include "nlohmann/json.hpp"

namespace scalebox::process {

enum class OutputStream {
    kStdout,
    kStderr,
    kPty
};

const char* ToString(OutputStream stream);

struct StartEvent {
    std::uint32_t pid = 0;
};

struct DataEvent {
    OutputStream stream = OutputStream::kStdout;
    std::string bytes;
};

struct EndEvent {
    std::int32_t exit_code = 0;
    bool exited = false;
    std::optional<std::string> status;
    std::optional<std::string> error;
};

struct KeepaliveEvent {};

using ProcessEvent = std::variant<StartEvent, DataEvent, EndEvent, KeepaliveEvent>;
using ProcessEventStream = bus::EventStream<ProcessEvent>;

// Decodes one JSON message of the process service stream, e.g.
// {"event":{"data":{"stdout":"aGk="}}}. Byte fields are base64 as in the
// protobuf JSON mapping. Returns nullopt for messages without a known event
// case; throws nlohmann::json::exception on malformed known cases.
std::optional<ProcessEvent> DecodeProcessEvent(const nlohmann::json& message);

enum class Signal {
    kSigterm = 15,
    kSigkill = 9
};

// Identifies a remote process by pid or by tag, never both.
class ProcessSelector {
public:
    static ProcessSelector ByPid(std::uint32_t pid);
    static ProcessSelector ByTag(std::string tag);

    bool HasPid() const { return std::holds_alternative<std::uint32_t>(value_); }
    std::uint32_t Pid() const;
    const std::string& Tag() const;
    std::string Describe() const;

private:
    explicit ProcessSelector(std::variant<std::uint32_t, std::string> value)
        : value_(std::move(value)) {}

    std::variant<std::uint32_t, std::string> value_;
};

struct ProcessConfig {
    std::string cmd;
    std::vector<std::string> args;
    std::map<std::string, std::string> envs;
    std::optional<std::string> cwd;
};

struct PtySize {
    std::uint32_t cols = 80;
    std::uint32_t rows = 24;
};

struct ProcessInfo {
    std::uint32_t pid = 0;
    ProcessConfig config;
    std::optional<std::string> tag;
};

struct ProcessInput {
    enum class Kind {
        kStdin,
        kPty
    };
    Kind kind = Kind::kStdin;
    std::string bytes;
};

}  // namespace scalebox::process
