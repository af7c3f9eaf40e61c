// =============================================================================
// AutoLink - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that carries either a success value or an error.
// Every recoverable failure of the connection subsystem travels as a Result
// and ends up as a user notification; exceptions are left for the truly
// unexpected.
//
// Usage:
//   Result<int> lease() {
//       if (exhausted) return Err<int>(ErrorCode::NoAvailablePorts, "No available ports found");
//       return Ok(port);
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace autolink {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode {
    Unknown = 0,
    PortLocked,             // explicit candidate already held by the lease cache
    NoAvailablePorts,       // candidates and wildcard fallback exhausted
    BridgeToolUnavailable,  // adb could not be spawned
    ForwardSetupFailed,     // adb rejected a tcp forward
    ConnectionTimeout,      // handshake did not complete in time
    InvalidAddress,         // text failed the dotted-quad pattern
    AmbiguousAddress,       // typed text overlaps a saved record
    NoDeviceConnected,      // action needs at least one session
    UnknownCommand,         // /exec cmd outside the allow-list
    ConnectFailed,          // transport-level connect failure
    Io,
    Config,
};

inline const char* errorCodeName(ErrorCode c) {
    switch (c) {
        case ErrorCode::Unknown:               return "Unknown";
        case ErrorCode::PortLocked:            return "PortLocked";
        case ErrorCode::NoAvailablePorts:      return "NoAvailablePorts";
        case ErrorCode::BridgeToolUnavailable: return "BridgeToolUnavailable";
        case ErrorCode::ForwardSetupFailed:    return "ForwardSetupFailed";
        case ErrorCode::ConnectionTimeout:     return "ConnectionTimeout";
        case ErrorCode::InvalidAddress:        return "InvalidAddress";
        case ErrorCode::AmbiguousAddress:      return "AmbiguousAddress";
        case ErrorCode::NoDeviceConnected:     return "NoDeviceConnected";
        case ErrorCode::UnknownCommand:        return "UnknownCommand";
        case ErrorCode::ConnectFailed:         return "ConnectFailed";
        case ErrorCode::Io:                    return "Io";
        case ErrorCode::Config:                return "Config";
    }
    return "?";
}

struct Error {
    std::string message;
    ErrorCode code = ErrorCode::Unknown;

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Unknown) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, ErrorCode c = ErrorCode::Unknown) : message(msg), code(c) {}
    Error(ErrorCode c, std::string msg) : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E> &&
                                                       !std::is_convertible_v<Err, T>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    // Map success value
    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

using VoidResult = Result<void, Error>;

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(ErrorCode code, std::string message) {
    return Result<T, Error>(Error(code, std::move(message)));
}

template<typename T>
Result<T, Error> Err(Error error) {
    return Result<T, Error>(std::move(error));
}

} // namespace autolink
