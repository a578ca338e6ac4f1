#pragma once
// Result.hpp - Value-or-error return type
// Used everywhere an operation can fail without it being exceptional

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace cal {

struct Error {
    std::string message;
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message)});
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<T>(data_);
    }
    const T& value() const& {
        return std::get<T>(data_);
    }
    T&& value() && {
        return std::get<T>(std::move(data_));
    }
    T valueOr(T fallback) const {
        return isOk() ? std::get<T>(data_) : std::move(fallback);
    }

    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {
    }
    explicit Result(Error error) : data_(std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message)});
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return *error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : error_(std::move(error)) {
    }

    std::optional<Error> error_;
};

} // namespace cal
