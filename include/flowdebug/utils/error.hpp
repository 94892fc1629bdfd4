#pragma once

#include <string>
#include <stdexcept>
#include <variant>
#include <optional>
#include <utility>

#if __cplusplus >= 202302L
#include <expected>
#endif
#include <source_location>

namespace flowdebug {

enum class ErrorCode {
    SUCCESS = 0,

    // Configuration errors
    CONFIG_INVALID_FORMAT = 1000,
    CONFIG_INVALID_VALUE = 1002,
    CONFIG_FILE_NOT_FOUND = 1003,

    // Breakpoint errors
    BREAKPOINT_INVALID = 2001,

    // Condition errors
    CONDITION_PARSE_ERROR = 3000,
    CONDITION_EVALUATION_ERROR = 3001,
    TYPE_MISMATCH = 3002,
    DIVISION_BY_ZERO = 3003,
    ARITHMETIC_OVERFLOW = 3004,

    // Variable errors
    VARIABLE_NOT_FOUND = 4000,
    VARIABLE_INVALID_NAME = 4001,
    VARIABLE_INVALID_SCOPE = 4002,

    // I/O errors
    IO_READ_FAILED = 5000,
    IO_WRITE_FAILED = 5001,
    FILE_ERROR = 5002,

    // Session / system errors
    SYSTEM_ALREADY_RUNNING = 6001,
    FLOW_EMPTY = 6003,
    STEP_FAILED = 6004,

    // Generic errors
    INVALID_PARAMETER = 8000,
    OPERATION_FAILED = 8002
};

class Error {
public:
    explicit Error(ErrorCode code,
                   std::source_location location = std::source_location::current())
        : code_(code), message_(), location_(location) {}

    Error(ErrorCode code,
          const std::string& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(message), location_(location) {}

    Error(ErrorCode code,
          std::string&& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(std::move(message)), location_(location) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::source_location& location() const noexcept { return location_; }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }

    bool operator==(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

// Minimal expected/unexpected until std::expected is available
#if __cplusplus < 202302L
template<typename T>
class unexpected {
private:
    T error_;

public:
    constexpr explicit unexpected(T&& error) : error_(std::move(error)) {}
    constexpr explicit unexpected(const T& error) : error_(error) {}

    constexpr const T& value() const& { return error_; }
    constexpr T& value() & { return error_; }
    constexpr T&& value() && { return std::move(error_); }
};

template<typename T>
unexpected(T) -> unexpected<T>;

template<typename T, typename E>
class expected {
private:
    std::variant<T, E> data_;

public:
    constexpr expected() = default;
    constexpr expected(const T& value) : data_(std::in_place_index<0>, value) {}
    constexpr expected(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    constexpr expected(const unexpected<E>& unexp) : data_(std::in_place_index<1>, unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp) : data_(std::in_place_index<1>, std::move(unexp).value()) {}

    constexpr bool has_value() const { return data_.index() == 0; }
    constexpr explicit operator bool() const { return has_value(); }

    constexpr const T& value() const& { return std::get<0>(data_); }
    constexpr T& value() & { return std::get<0>(data_); }
    constexpr T&& value() && { return std::get<0>(std::move(data_)); }

    template<typename U>
    constexpr T value_or(U&& fallback) const& {
        return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

    constexpr const E& error() const& { return std::get<1>(data_); }
    constexpr E& error() & { return std::get<1>(data_); }
    constexpr E&& error() && { return std::get<1>(std::move(data_)); }

    constexpr const T& operator*() const& { return value(); }
    constexpr T& operator*() & { return value(); }
    constexpr T&& operator*() && { return std::move(value()); }

    constexpr const T* operator->() const { return &value(); }
    constexpr T* operator->() { return &value(); }
};

// Specialization for void
template<typename E>
class expected<void, E> {
private:
    std::optional<E> error_;

public:
    constexpr expected() = default;
    constexpr expected(const unexpected<E>& unexp) : error_(unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp) : error_(std::move(unexp).value()) {}

    constexpr bool has_value() const { return !error_.has_value(); }
    constexpr explicit operator bool() const { return has_value(); }

    void value() const {
        if (error_.has_value()) {
            throw std::runtime_error("Expected contains error");
        }
    }

    constexpr const E& error() const& { return error_.value(); }
    constexpr E& error() & { return error_.value(); }
    constexpr E&& error() && { return std::move(error_.value()); }
};
#else
using std::unexpected;
using std::expected;
#endif // __cplusplus < 202302L

template<typename T>
using Result = expected<T, Error>;

using VoidResult = Result<void>;

#define RETURN_IF_ERROR(expr) \
    do { \
        auto result_ = (expr); \
        if (!result_) { \
            return ::flowdebug::unexpected(result_.error()); \
        } \
    } while (0)

#define ASSIGN_OR_RETURN(var, expr) \
    auto var##_result_ = (expr); \
    if (!var##_result_) { \
        return ::flowdebug::unexpected(var##_result_.error()); \
    } \
    var = std::move(var##_result_.value())

#define MAKE_ERROR(code, message) \
    ::flowdebug::Error(::flowdebug::ErrorCode::code, message)

#define MAKE_SIMPLE_ERROR(code) \
    ::flowdebug::Error(::flowdebug::ErrorCode::code)

// Helper function for making errors
inline Error make_error(ErrorCode code, const std::string& message,
                        std::source_location location = std::source_location::current()) {
    return Error(code, message, location);
}

const char* error_code_to_string(ErrorCode code) noexcept;

}  // namespace flowdebug
