#pragma once

#include <string>
#include <variant>

namespace fxrates {

// 에러 코드
enum class ErrorCode {
    Success = 0,

    // 요청/전송 에러 (100-199)
    InvalidRequest = 100,   // 요청 전송 전 실패 (잘못된 URL 등)
    TransportError = 101,   // 송수신 중 I/O 실패

    // 원격 에러 (200-299)
    RemoteError = 200,      // 200 이외의 HTTP 상태

    // 내부 에러 (300-399)
    InternalError = 300,
    ConfigError = 301,
    ParseError = 302,
    IoError = 303,
};

constexpr const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:        return "Success";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::RemoteError:    return "RemoteError";
        case ErrorCode::InternalError:  return "InternalError";
        case ErrorCode::ConfigError:    return "ConfigError";
        case ErrorCode::ParseError:     return "ParseError";
        case ErrorCode::IoError:        return "IoError";
        default:                        return "Unknown";
    }
}

// 에러 구조체
struct Error {
    ErrorCode code;
    std::string message;
    std::string detail;    // 추가 정보 (선택)
    int http_status{0};    // RemoteError 일 때 HTTP 상태 코드

    Error() : code(ErrorCode::Success) {}
    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string det)
        : code(c), message(std::move(msg)), detail(std::move(det)) {}

    bool ok() const { return code == ErrorCode::Success; }
    operator bool() const { return !ok(); }  // 에러가 있으면 true
};

// Result 타입 (std::variant 기반)
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const {
        return std::holds_alternative<T>(data_);
    }

    bool has_error() const {
        return std::holds_alternative<Error>(data_);
    }

    T& value() {
        return std::get<T>(data_);
    }

    const T& value() const {
        return std::get<T>(data_);
    }

    Error& error() {
        return std::get<Error>(data_);
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

    operator bool() const { return has_value(); }

private:
    std::variant<T, Error> data_;
};

// void 특수화
template<>
class Result<void> {
public:
    Result() : error_(ErrorCode::Success, "") {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const {
        return error_.code == ErrorCode::Success;
    }

    bool has_error() const {
        return error_.code != ErrorCode::Success;
    }

    Error& error() {
        return error_;
    }

    const Error& error() const {
        return error_;
    }

    operator bool() const { return has_value(); }

private:
    Error error_;
};

// 성공 반환 헬퍼
template<typename T>
Result<T> Ok(T&& value) {
    return Result<T>(std::forward<T>(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

// 에러 반환 헬퍼
template<typename T>
Result<T> Err(ErrorCode code, const std::string& message) {
    return Result<T>(Error{code, message});
}

template<typename T>
Result<T> Err(const Error& error) {
    return Result<T>(error);
}

// RemoteError 헬퍼 (상태 코드 포함)
template<typename T>
Result<T> RemoteErr(int http_status, const std::string& message) {
    Error error{ErrorCode::RemoteError, message};
    error.http_status = http_status;
    return Result<T>(std::move(error));
}

}  // namespace fxrates
