#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace dxfer {

/**
 * @brief Failure categories a transfer can end with
 *
 * Every core error is fatal to the stream it happened on and is delivered
 * to whoever is waiting for that stream's outcome.
 */
enum class ErrorKind {
    ProtocolViolation,  ///< Malformed or semantically invalid header/ack/control frame
    IntegrityFailure,   ///< Ack digest differs from the digest of the bytes we sent
    Overflow,           ///< More payload than the header declared
    PrematureClose,     ///< Stream closed before reaching a successful terminal state
    UsageError,         ///< Invalid command-line invocation
    Io                  ///< Filesystem or transport failure
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ProtocolViolation: return "protocol violation";
        case ErrorKind::IntegrityFailure: return "integrity failure";
        case ErrorKind::Overflow: return "overflow";
        case ErrorKind::PrematureClose: return "premature close";
        case ErrorKind::UsageError: return "usage error";
        case ErrorKind::Io: return "i/o error";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

} // namespace dxfer
