// ============================================================================
// File: shared/common/result.h
// Description: Result / Error handling structure shared by every topicbus module
// ============================================================================

#pragma once
#include <string>
#include <utility>
#include <optional>
#include <cstdint>
#include <type_traits>


// NOTE: int-based. Extendable by appending new codes.
enum class ResultCode : int32_t {
    OK                  = 0,
    Fail                = 1,
    Cancelled           = 2,

    // input & state error
    InvalidArgument     = 100,
    AlreadyExists       = 101,
    NotFound            = 103,
    OutOfRange          = 104,

    // system & resource error
    Timeout             = 201,
    ResourceBusy        = 203,
    InvalidState        = 204,

    // internal error
    InternalError       = 300,
    NotSupported        = 301,
    SocketError         = 302,

    // network error
    NetworkError        = 400,
    ConnectionFail      = 402,
    ConnectionLost      = 403,
    ProtocolError       = 404,

    // topic bus error
    InvalidPattern          = 500,
    DuplicateLabel          = 501,
    UnknownLabel            = 502,
    ParameterCountMismatch  = 503,
    MissingParameter        = 504,
    InvalidParameter        = 505,
    AlreadySubscribed       = 506,
    NotSubscribed           = 507,
    AlreadyAvailable        = 508,
    NotAvailable            = 509,

    Unknown
};

inline constexpr bool isSuccess(ResultCode code) noexcept {
    return code == ResultCode::OK;
}

inline constexpr bool isFailure(ResultCode code) noexcept {
    return !isSuccess(code);
}

template <typename T, typename E = std::optional<std::string>>
class Result;

// ----------------------------------------------------------------------------
// Result<T, E>
// ----------------------------------------------------------------------------

template <typename T, typename E>
class Result {
public:
    // Default constructor: success by default
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}

    // Error propagation from Result<void> (RETURN_IF_ERR, Error(...))
    template <typename U, typename = std::enable_if_t<std::is_void_v<U>>>
    Result(const Result<U, E>& other) : code_(other.code()), error_(other.error()) {}

    // Factory methods
    static Result OK(T value) { return Result(std::move(value)); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    // Query
    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] ResultCode code() const noexcept { return code_; }
    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] T& value() noexcept  { return value_; }
    [[nodiscard]] const E& error() const noexcept  { return error_; }

private:
    ResultCode code_;
    T value_{};
    E error_;

    // Success constructor
    explicit Result(T val)
        : code_(ResultCode::OK), value_(std::move(val)), error_(std::nullopt) {}

    // Error constructor
    Result(ResultCode code, E err)
        : code_(code), error_(std::move(err)) {}
};

// ----------------------------------------------------------------------------
// Partial specialization for void
// ----------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}
    static Result OK() { return Result(ResultCode::OK, std::nullopt); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] const E& error() const noexcept  { return error_; }
    [[nodiscard]] ResultCode code() const noexcept  { return code_; }

    [[nodiscard]] const char* c_str() const noexcept  {
        return error_.has_value() ? error_->c_str() : "";
    }

private:
    ResultCode code_;
    E error_;

    Result(ResultCode code, E e)
        : code_(code), error_(std::move(e)) {}
};

// ----------------------------------------------------------------------------
// String conversion (for logging / debugging)
// ----------------------------------------------------------------------------

constexpr const char* to_string(ResultCode code) {
    switch (code) {
        case ResultCode::OK:                     return "OK";
        case ResultCode::Fail:                   return "Fail";
        case ResultCode::Cancelled:              return "Cancelled";
        case ResultCode::InvalidArgument:        return "InvalidArgument";
        case ResultCode::AlreadyExists:          return "AlreadyExists";
        case ResultCode::NotFound:               return "NotFound";
        case ResultCode::OutOfRange:             return "OutOfRange";
        case ResultCode::Timeout:                return "Timeout";
        case ResultCode::ResourceBusy:           return "ResourceBusy";
        case ResultCode::InvalidState:           return "InvalidState";
        case ResultCode::InternalError:          return "InternalError";
        case ResultCode::NotSupported:           return "NotSupported";
        case ResultCode::SocketError:            return "SocketError";
        case ResultCode::NetworkError:           return "NetworkError";
        case ResultCode::ConnectionFail:         return "ConnectionFail";
        case ResultCode::ConnectionLost:         return "ConnectionLost";
        case ResultCode::ProtocolError:          return "ProtocolError";
        case ResultCode::InvalidPattern:         return "InvalidPattern";
        case ResultCode::DuplicateLabel:         return "DuplicateLabel";
        case ResultCode::UnknownLabel:           return "UnknownLabel";
        case ResultCode::ParameterCountMismatch: return "ParameterCountMismatch";
        case ResultCode::MissingParameter:       return "MissingParameter";
        case ResultCode::InvalidParameter:       return "InvalidParameter";
        case ResultCode::AlreadySubscribed:      return "AlreadySubscribed";
        case ResultCode::NotSubscribed:          return "NotSubscribed";
        case ResultCode::AlreadyAvailable:       return "AlreadyAvailable";
        case ResultCode::NotAvailable:           return "NotAvailable";
        default:                                 return "Unknown";
    }
}


// LOGI("subscribe failed: {}", to_string(result));
template <typename T>
inline std::string to_string(const Result<T>& r) {
    return std::string(to_string(r.code())) +
           (r.error().has_value() ? (": " + *r.error()) : "");
}


inline Result<void> OK() noexcept { return Result<void>::OK(); }
inline Result<void> Fail() noexcept { return Result<void>::Fail(); }
inline Result<void> Error(ResultCode code, std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(code, std::move(msg));
}
