#include "errors/errors.hpp"

#include "utils/common.hpp"

namespace scalebox::errors {

const char* ToString(RpcCode code) {
    switch (code) {
        case RpcCode::kOk: return "ok";
        case RpcCode::kCanceled: return "canceled";
        case RpcCode::kUnknown: return "unknown";
        case RpcCode::kInvalidArgument: return "invalid_argument";
        case RpcCode::kDeadlineExceeded: return "deadline_exceeded";
        case RpcCode::kNotFound: return "not_found";
        case RpcCode::kAlreadyExists: return "already_exists";
        case RpcCode::kPermissionDenied: return "permission_denied";
        case RpcCode::kResourceExhausted: return "resource_exhausted";
        case RpcCode::kFailedPrecondition: return "failed_precondition";
        case RpcCode::kAborted: return "aborted";
        case RpcCode::kOutOfRange: return "out_of_range";
        case RpcCode::kUnimplemented: return "unimplemented";
        case RpcCode::kInternal: return "internal";
        case RpcCode::kUnavailable: return "unavailable";
        case RpcCode::kDataLoss: return "data_loss";
        case RpcCode::kUnauthenticated: return "unauthenticated";
    }
    return "unknown";
}

RpcCode RpcCodeFromString(const std::string& name) {
    const auto lowered = utils::ToLower(name);
    for (int value = 0; value <= static_cast<int>(RpcCode::kUnauthenticated); ++value) {
        const auto code = static_cast<RpcCode>(value);
        if (lowered == ToString(code)) {
            return code;
        }
    }
    if (lowered == "cancelled") {
        return RpcCode::kCanceled;
    }
    return RpcCode::kUnknown;
}

RpcError::RpcError(RpcCode code, const std::string& message)
    : ScaleboxError(std::string("rpc ") + ToString(code) + ": " + message, ToString(code))
    , rpc_code_(code) {}

bool RpcError::IsRetryable() const {
    return rpc_code_ == RpcCode::kUnavailable ||
        rpc_code_ == RpcCode::kResourceExhausted ||
        rpc_code_ == RpcCode::kAborted;
}

bool IsNotFoundError(const std::exception& error) {
    if (const auto* rpc = dynamic_cast<const RpcError*>(&error)) {
        if (rpc->rpc_code() == RpcCode::kNotFound) {
            return true;
        }
    }
    if (dynamic_cast<const NotFoundError*>(&error) != nullptr) {
        return true;
    }
    return utils::ToLower(error.what()).find("not found") != std::string::npos;
}

}  // namespace scalebox::errors
