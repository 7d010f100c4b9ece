#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>

enum class ErrorCode
{
    MalformedStream,
    MalformedHeader,
    UnsupportedInput,
    IoError,
    InvalidArgument
};

inline std::string errorCodeToString(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::MalformedStream: return "MalformedStream";
        case ErrorCode::MalformedHeader: return "MalformedHeader";
        case ErrorCode::UnsupportedInput: return "UnsupportedInput";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

template<typename T>
struct Result
{
    std::optional<T> value;
    std::optional<std::string> error;
    std::optional<ErrorCode> errorCode;
    std::vector<std::string> warnings;

    bool success() const
    {
        return value.has_value() && !error.has_value();
    }

    bool hasError() const
    {
        return error.has_value();
    }

    bool hasWarning() const
    {
        return !warnings.empty();
    }

    void setValue(T val)
    {
        value = std::move(val);
    }

    void setError(ErrorCode code, const std::string& errorMessage)
    {
        errorCode = code;
        error = errorMessage;
    }

    void addWarning(const std::string& warningMessage)
    {
        warnings.push_back(warningMessage);
    }

    std::string getError() const
    {
        return error.value_or("No error");
    }

    ErrorCode getErrorCode() const
    {
        if (errorCode.has_value()) {
            return errorCode.value();
        }
        throw std::runtime_error("No error code set in Result");
    }

    const T& getValue() const
    {
        if (value.has_value()) {
            return value.value();
        }
        else {
            throw std::runtime_error("No value set in Result");
        }
    }

    // Moves the value out; used for move-only payloads such as trees.
    T takeValue()
    {
        if (!value.has_value()) {
            throw std::runtime_error("No value set in Result");
        }
        T taken = std::move(value.value());
        value.reset();
        return taken;
    }

    std::vector<std::string> getWarnings() const
    {
        return warnings;
    }
};

template<typename T>
static Result<T> makeError(ErrorCode code, const std::string& errorMessage)
{
    Result<T> result;
    result.setError(code, errorMessage);
    return result;
}

// Carries the error (and warnings) of another Result over to a new value type.
template<typename T, typename U>
static Result<T> forwardError(const Result<U>& other)
{
    Result<T> result;
    if (other.errorCode.has_value()) {
        result.setError(other.errorCode.value(), other.getError());
    }
    result.warnings = other.warnings;
    return result;
}

template<typename T>
static Result<T> makeResult(T value, Result<T>* result = nullptr)
{
    if (result != nullptr) {
        result->setValue(std::move(value));
        return std::move(*result);
    }
    Result<T> newResult;
    newResult.setValue(std::move(value));
    return newResult;
}
