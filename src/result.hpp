// =============================================================================
// c64view - Result Type for Fatal Error Reporting
// =============================================================================
// Result<T, E> carries either a success value or an Error. Only fatal stream
// conditions (bind failure, invalid geometry/config) travel through Result;
// recoverable conditions are counted in StreamStats instead.
//
// Usage:
//   Result<PacketReceiver> rx = PacketReceiver::open(...);
//   if (rx.is_err()) {
//       CVLOG_ERROR("rx", "%s", rx.error().message.c_str());
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace c64view {

// =============================================================================
// Error
// =============================================================================

struct Error {
    enum class Kind {
        BindFailed,       // socket()/bind() refused (port in use, permission)
        SocketError,      // other socket setup failure
        InvalidGeometry,  // frame geometry does not match the device raster
        InvalidConfig,    // out-of-range configuration value
        Io,               // file output failure (sinks)
        Other
    };

    Kind kind = Kind::Other;
    std::string message;
    int code = 0;  // errno where one applies

    Error() = default;
    Error(Kind k, std::string msg, int c = 0) : kind(k), message(std::move(msg)), code(c) {}
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

inline const char* errorKindName(Error::Kind k) {
    switch (k) {
        case Error::Kind::BindFailed:      return "bind_failed";
        case Error::Kind::SocketError:     return "socket_error";
        case Error::Kind::InvalidGeometry: return "invalid_geometry";
        case Error::Kind::InvalidConfig:   return "invalid_config";
        case Error::Kind::Io:              return "io";
        case Error::Kind::Other:           return "other";
    }
    return "unknown";
}

// =============================================================================
// Result<T, E>
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Throws std::logic_error on misuse (accessing the wrong alternative)
    T& value() & {
        if (is_err()) throw std::logic_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::logic_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::logic_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    E& error() & {
        if (is_ok()) throw std::logic_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::logic_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E>
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

    const E& error() const& {
        if (is_ok()) throw std::logic_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helpers
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(Error::Kind kind, std::string message, int code = 0) {
    return Result<T, Error>(Error(kind, std::move(message), code));
}

} // namespace c64view
