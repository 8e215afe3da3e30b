#include <catch2/catch.hpp>

#include "errors/errors.hpp"
#include "process/process_event.hpp"

using namespace scalebox::process;
using nlohmann::json;

TEST_CASE("DecodeProcessEvent reads a start event", "[process_event]") {
    auto event = DecodeProcessEvent(json::parse(R"({"event":{"start":{"pid":42}}})"));
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<StartEvent>(*event));
    CHECK(std::get<StartEvent>(*event).pid == 42);
}

TEST_CASE("DecodeProcessEvent decodes base64 output", "[process_event]") {
    SECTION("nested under output") {
        auto event = DecodeProcessEvent(json::parse(R"({"event":{"data":{"output":{"stdout":"aGVsbG8="}}}})"));
        REQUIRE(event.has_value());
        const auto& data = std::get<DataEvent>(*event);
        CHECK(data.stream == OutputStream::kStdout);
        CHECK(data.bytes == "hello");
    }
    SECTION("flattened stderr") {
        auto event = DecodeProcessEvent(json::parse(R"({"data":{"stderr":"b29wcw=="}})"));
        REQUIRE(event.has_value());
        const auto& data = std::get<DataEvent>(*event);
        CHECK(data.stream == OutputStream::kStderr);
        CHECK(data.bytes == "oops");
    }
    SECTION("pty") {
        auto event = DecodeProcessEvent(json::parse(R"({"event":{"data":{"pty":"JCA="}}})"));
        REQUIRE(event.has_value());
        CHECK(std::get<DataEvent>(*event).stream == OutputStream::kPty);
        CHECK(std::get<DataEvent>(*event).bytes == "$ ");
    }
}

TEST_CASE("DecodeProcessEvent reads an end event", "[process_event]") {
    auto event = DecodeProcessEvent(json::parse(
        R"({"event":{"end":{"exitCode":2,"exited":true,"status":"exit status 2","error":""}}})"));
    REQUIRE(event.has_value());
    const auto& end = std::get<EndEvent>(*event);
    CHECK(end.exit_code == 2);
    CHECK(end.exited);
    CHECK(end.status == std::optional<std::string>("exit status 2"));
    CHECK_FALSE(end.error.has_value());
}

TEST_CASE("DecodeProcessEvent maps keepalive and skips unknown cases", "[process_event]") {
    auto keepalive = DecodeProcessEvent(json::parse(R"({"event":{"keepalive":{}}})"));
    REQUIRE(keepalive.has_value());
    CHECK(std::holds_alternative<KeepaliveEvent>(*keepalive));

    CHECK_FALSE(DecodeProcessEvent(json::parse(R"({"event":{"telemetry":{}}})")).has_value());
    CHECK_FALSE(DecodeProcessEvent(json::parse(R"([1,2,3])")).has_value());
}

TEST_CASE("ProcessSelector holds exactly one of pid or tag", "[process_event]") {
    auto by_pid = ProcessSelector::ByPid(7);
    CHECK(by_pid.HasPid());
    CHECK(by_pid.Pid() == 7);
    CHECK(by_pid.Describe() == "pid=7");
    CHECK_THROWS_AS(by_pid.Tag(), scalebox::errors::InvalidArgumentError);

    auto by_tag = ProcessSelector::ByTag("web");
    CHECK_FALSE(by_tag.HasPid());
    CHECK(by_tag.Tag() == "web");
    CHECK_THROWS_AS(ProcessSelector::ByTag(""), scalebox::errors::InvalidArgumentError);
}
