#pragma once

#include <optional>
#include <string>
#include <utility>

// Failure reported by the phone book: a message meant for the user.
struct StoreError {
    std::string message;
};

// Either a value or a StoreError. Callers check ok() before value().
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(StoreError error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const StoreError& error() const { return *error_; }

private:
    std::optional<T> value_;
    std::optional<StoreError> error_;
};

// Result of an operation that yields nothing on success.
class Status {
public:
    Status() = default;
    Status(StoreError error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    const StoreError& error() const { return *error_; }

private:
    std::optional<StoreError> error_;
};
