#pragma once
#include <string>
#include <utility>
#include <variant>

namespace keylightd {

enum class ErrorKind {
    Unreachable,    // connection refused, DNS failure or timeout
    ProtocolError,  // device answered with something we could not parse
    Rejected,       // device answered with an explicit error
    NotFound,       // unknown device id
    Backpressure,   // per-device queue is full
    InvalidRequest, // malformed control request
    ShuttingDown    // daemon is draining and no longer accepts work
};

struct Error {
    ErrorKind kind;
    std::string message;
};

// Value-or-error return used across the engine. Exceptions stay at the
// configuration and RPC boundaries.
template <typename T>
class Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error err) : v_(std::move(err)) {}

    static Result failure(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(v_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(v_); }
    T& value() { return std::get<T>(v_); }
    const Error& error() const { return std::get<Error>(v_); }

private:
    std::variant<T, Error> v_;
};

} // namespace keylightd
