#pragma once

#include <string>
#include <utility>
#include <variant>

// Completion marker of operations that act on the system and yield no value.
struct Done {};

// The backend cannot handle this request; the next backend should try.
struct Deferred {
    std::string reason;
};

// The backend attempted the request and it went wrong.
struct OperationError {
    std::string message;
};

// Outcome of one backend operation: exactly one of a value, a deferral or an
// error. Deferral and failure are ordinary values, not exceptions.
template<typename T>
class OperationResult {
public:
    static OperationResult success(T value) { return OperationResult(State(std::in_place_index<0>, std::move(value))); }
    static OperationResult defer(std::string reason) { return OperationResult(State(Deferred{std::move(reason)})); }
    static OperationResult fail(std::string message) { return OperationResult(State(OperationError{std::move(message)})); }

    bool ok() const { return std::holds_alternative<T>(state_); }
    bool deferred() const { return std::holds_alternative<Deferred>(state_); }
    bool failed() const { return std::holds_alternative<OperationError>(state_); }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }
    const std::string& reason() const { return std::get<Deferred>(state_).reason; }
    const std::string& error() const { return std::get<OperationError>(state_).message; }

    // Rewraps a deferral or failure as a result of another value type.
    template<typename U>
    OperationResult<U> forward() const {
        if (deferred()) return OperationResult<U>::defer(reason());
        return OperationResult<U>::fail(error());
    }

private:
    using State = std::variant<T, Deferred, OperationError>;

    explicit OperationResult(State state) : state_(std::move(state)) {}

    State state_;
};
