#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace triplersi {

// 실패 분류: 검증 실패는 재시도 없음, 일시적 실패는 재시도 소진 후 보고,
// 시스템 실패는 엔진 전체 중단 대상
enum class ErrorKind {
    VALIDATION,
    TRANSIENT,
    SYSTEMIC
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "VALIDATION";
        case ErrorKind::TRANSIENT: return "TRANSIENT";
        case ErrorKind::SYSTEMIC: return "SYSTEMIC";
    }
    return "UNKNOWN";
}

struct Error {
    ErrorKind kind = ErrorKind::VALIDATION;
    std::string code;
    std::string message;

    static Error validation(std::string code, std::string message) {
        return Error{ErrorKind::VALIDATION, std::move(code), std::move(message)};
    }
    static Error transient(std::string code, std::string message) {
        return Error{ErrorKind::TRANSIENT, std::move(code), std::move(message)};
    }
    static Error systemic(std::string code, std::string message) {
        return Error{ErrorKind::SYSTEMIC, std::move(code), std::move(message)};
    }

    std::string describe() const {
        return std::string(toString(kind)) + "/" + code + ": " + message;
    }
};

template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result fail(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool isOk() const { return value_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.describe());
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.describe());
        }
        return *value_;
    }

    T valueOr(T fallback) const {
        return value_ ? *value_ : std::move(fallback);
    }

    const Error& error() const { return error_; }

private:
    Result() = default;

    std::optional<T> value_;
    Error error_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.ok_ = true;
        return r;
    }

    static Result fail(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool isOk() const { return ok_; }
    explicit operator bool() const { return ok_; }
    const Error& error() const { return error_; }

private:
    Result() = default;

    bool ok_ = false;
    Error error_;
};

using Status = Result<void>;

} // namespace triplersi
