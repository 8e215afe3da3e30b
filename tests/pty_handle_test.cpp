#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

#include "errors/errors.hpp"
#include "fake_services.hpp"
#include "process/pty_handle.hpp"

using namespace scalebox::process;
using scalebox::testing::Eventually;

namespace {

struct SideChannel {
    std::vector<std::pair<std::uint32_t, std::string>> sent;
    std::vector<std::pair<std::uint32_t, PtySize>> resized;
};

std::shared_ptr<PtyHandle> MakePty(std::shared_ptr<ProcessEventStream> events,
                                   SideChannel& channel,
                                   PtyDataCallback on_data = {}) {
    return PtyHandle::Create(
        std::move(events),
        [](std::uint32_t) { return true; },
        [&channel](std::uint32_t pid, const std::string& bytes) { channel.sent.emplace_back(pid, bytes); },
        [&channel](std::uint32_t pid, const PtySize& size) { channel.resized.emplace_back(pid, size); },
        {},
        std::move(on_data));
}

}  // namespace

TEST_CASE("PtyHandle accumulates terminal output", "[pty_handle]") {
    auto events = std::make_shared<ProcessEventStream>();
    SideChannel channel;
    std::string streamed;
    auto handle = MakePty(events, channel, [&streamed](const std::string& bytes) { streamed += bytes; });

    events->Push(StartEvent{21});
    events->Push(DataEvent{OutputStream::kPty, "$ "});
    events->Push(DataEvent{OutputStream::kPty, "ls\r\n"});
    events->Push(EndEvent{0, true, std::nullopt, std::nullopt});
    events->Close();

    const auto result = handle->Wait();
    CHECK(result.exit_code == 0);
    CHECK(result.data == "$ ls\r\n");
    CHECK(streamed == "$ ls\r\n");
    CHECK(handle->Data() == "$ ls\r\n");
}

TEST_CASE("PtyHandle keeps the End error as data", "[pty_handle]") {
    auto events = std::make_shared<ProcessEventStream>();
    SideChannel channel;
    auto handle = MakePty(events, channel);

    events->Push(StartEvent{21});
    events->Push(EndEvent{1, false, std::nullopt, std::string("terminal closed")});
    events->Close();

    const auto result = handle->Wait();
    CHECK(result.exit_code == 1);
    CHECK(result.error == std::optional<std::string>("terminal closed"));
}

TEST_CASE("PtyHandle side channels need the pid", "[pty_handle]") {
    auto events = std::make_shared<ProcessEventStream>();
    SideChannel channel;
    auto handle = MakePty(events, channel);

    CHECK_THROWS_AS(handle->Send("echo hi\n"), scalebox::errors::ProcessNotStartedError);
    CHECK_THROWS_AS(handle->Resize(PtySize{100, 40}), scalebox::errors::ProcessNotStartedError);
    CHECK(channel.sent.empty());

    events->Push(StartEvent{9});
    REQUIRE(Eventually([&] { return handle->TryPid().has_value(); }));

    handle->Send("echo hi\n");
    handle->Resize(PtySize{100, 40});
    REQUIRE(channel.sent.size() == 1);
    CHECK(channel.sent[0].first == 9);
    CHECK(channel.sent[0].second == "echo hi\n");
    REQUIRE(channel.resized.size() == 1);
    CHECK(channel.resized[0].second.cols == 100);
    CHECK(channel.resized[0].second.rows == 40);

    events->Close();
}

TEST_CASE("PtyHandle rethrows a stream failure from Wait", "[pty_handle]") {
    auto events = std::make_shared<ProcessEventStream>();
    SideChannel channel;
    events->Push(StartEvent{30});
    events->Push(DataEvent{OutputStream::kPty, "$ "});
    events->Fail(std::make_exception_ptr(std::runtime_error("connection reset")));

    auto handle = MakePty(events, channel);
    CHECK_THROWS_WITH(handle->Wait(), "connection reset");
    CHECK(handle->GetState() == ProcessHandle::State::kFailed);
    CHECK(handle->Data() == "$ ");
    CHECK(handle->Pid() == 30);
}

TEST_CASE("PtyHandle reports a stream that closes without End", "[pty_handle]") {
    auto events = std::make_shared<ProcessEventStream>();
    SideChannel channel;
    events->Push(StartEvent{31});
    events->Push(DataEvent{OutputStream::kPty, "bye"});
    events->Close();

    auto handle = MakePty(events, channel);
    CHECK_THROWS_WITH(handle->Wait(), Catch::Contains("no result received"));
    CHECK(handle->GetState() == ProcessHandle::State::kFailed);
    CHECK_FALSE(handle->ExitCode().has_value());
}

TEST_CASE("PtyHandle fails before start when the stream errors first", "[pty_handle]") {
    auto events = std::make_shared<ProcessEventStream>();
    SideChannel channel;
    events->Fail(std::make_exception_ptr(std::runtime_error("sandbox gone")));

    auto handle = MakePty(events, channel);
    CHECK_THROWS_WITH(handle->Wait(), "sandbox gone");
    CHECK(handle->GetState() == ProcessHandle::State::kFailed);
    CHECK_THROWS_AS(handle->Send("ls\n"), scalebox::errors::ProcessNotStartedError);
    CHECK(channel.sent.empty());
}
