#pragma once

#include <stdexcept>
#include <string>

namespace scalebox::errors {

class ScaleboxError : public std::runtime_error {
public:
    explicit ScaleboxError(const std::string& message, std::string code = {})
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

class SandboxError : public ScaleboxError {
public:
    using ScaleboxError::ScaleboxError;
};

class InvalidArgumentError : public ScaleboxError {
public:
    using ScaleboxError::ScaleboxError;
};

class NotFoundError : public ScaleboxError {
public:
    using ScaleboxError::ScaleboxError;
};

class AuthenticationError : public ScaleboxError {
public:
    using ScaleboxError::ScaleboxError;
};

class TimeoutError : public ScaleboxError {
public:
    using ScaleboxError::ScaleboxError;
};

class AbortedError : public ScaleboxError {
public:
    using ScaleboxError::ScaleboxError;
};

// Thrown when a handle operation needs a pid before the Start event arrived.
class ProcessNotStartedError : public ScaleboxError {
public:
    using ScaleboxError::ScaleboxError;
};

class PollTimeoutError : public TimeoutError {
public:
    PollTimeoutError(const std::string& message, std::string last_status)
        : TimeoutError(message, "timeout"), last_status_(std::move(last_status)) {}

    const std::string& last_status() const { return last_status_; }

private:
    std::string last_status_;
};

class PollAbortedError : public AbortedError {
public:
    explicit PollAbortedError(const std::string& message)
        : AbortedError(message, "aborted") {}
};

// Status codes of the RPC transport, numbered like gRPC.
enum class RpcCode {
    kOk = 0,
    kCanceled = 1,
    kUnknown = 2,
    kInvalidArgument = 3,
    kDeadlineExceeded = 4,
    kNotFound = 5,
    kAlreadyExists = 6,
    kPermissionDenied = 7,
    kResourceExhausted = 8,
    kFailedPrecondition = 9,
    kAborted = 10,
    kOutOfRange = 11,
    kUnimplemented = 12,
    kInternal = 13,
    kUnavailable = 14,
    kDataLoss = 15,
    kUnauthenticated = 16
};

const char* ToString(RpcCode code);
RpcCode RpcCodeFromString(const std::string& name);

class RpcError : public ScaleboxError {
public:
    RpcError(RpcCode code, const std::string& message);

    RpcCode rpc_code() const { return rpc_code_; }
    bool IsRetryable() const;

private:
    RpcCode rpc_code_;
};

bool IsNotFoundError(const std::exception& error);

}  // namespace scalebox::errors
