/**
 * @file result.hpp
 * @brief Monadic error handling type for FleetUsage.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors carry
 * a kind from the fleet error taxonomy (configuration, connection,
 * deserialization, persistence, viewer read, probe) and keep the innermost
 * cause when wrapped with additional context.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace fleet_usage {

// ─────────────────────────────────────────────
// Error Kinds
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Generic,
    Config,           ///< Malformed roster, policy or TOML file
    Connection,       ///< Remote execution failed or timed out
    Deserialization,  ///< Output could not be parsed as a snapshot
    Persistence,      ///< Final cluster snapshot could not be written
    ViewerRead,       ///< Persisted snapshot could not be read during a poll
    Probe             ///< OS introspection failed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic:         return "error";
        case ErrorKind::Config:          return "config";
        case ErrorKind::Connection:      return "connection";
        case ErrorKind::Deserialization: return "deserialization";
        case ErrorKind::Persistence:     return "persistence";
        case ErrorKind::ViewerRead:      return "viewer_read";
        case ErrorKind::Probe:           return "probe";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a descriptive message and its root cause.
 *
 * `message` grows outward as context is added; `root_cause()` always returns
 * the message the error was first created with.
 */
struct Error {
    ErrorKind kind{ErrorKind::Generic};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] const std::string& root_cause() const noexcept {
        return cause_ ? *cause_ : message;
    }

    /// Wrap with a higher-level description: "<outer>: <message>".
    [[nodiscard]] Error context(std::string_view outer) const {
        Error wrapped{kind, std::string{outer} + ": " + message};
        wrapped.cause_ = root_cause();
        return wrapped;
    }

private:
    std::optional<std::string> cause_;
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T>
Result<T> make_error(ErrorKind kind, std::string message) {
    return Result<T>(Error{kind, std::move(message)});
}

}  // namespace fleet_usage
