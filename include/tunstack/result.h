#ifndef TUNSTACK_RESULT_H
#define TUNSTACK_RESULT_H

#include <tunstack/config.h>
#include <tunstack/error.h>
#include <variant>
#include <functional>
#include <type_traits>
#include <string>
#include <utility>

namespace tunstack {
namespace core {

/**
 * Error payload carried by a failed Result.
 *
 * Besides the error code it keeps an optional human-readable detail and the
 * numeric code reported by the native stack, so that failures such as
 * "tcp_write failed with error code: -6" reach the caller intact.
 */
struct TUNSTACK_API ErrorInfo {
    TunError code = TunError::SUCCESS;
    std::string message;
    int native_code = 0;

    ErrorInfo() = default;
    ErrorInfo(TunError c) : code(c) {}
    ErrorInfo(TunError c, std::string msg, int native = 0)
        : code(c), message(std::move(msg)), native_code(native) {}

    /** Detail message, or the category text when none was attached. */
    std::string describe() const {
        if (!message.empty()) {
            return message;
        }
        return error_message(code);
    }
};

/** Forward declaration for Result template class. */
template<typename T>
class Result;

/**
 * Result type for operations that can fail.
 *
 * A type that represents either a success value of type T or an error.
 * This provides a safe way to handle operations that might fail without
 * using exceptions.
 *
 * @tparam T The type of the success value
 */
template<typename T>
class Result {
public:
    /**
     * Constructs a successful Result with the given value.
     * @param value The success value
     */
    Result(T value) : data_(std::move(value)) {}

    /**
     * Constructs a failed Result with the given error.
     * @param error The error code
     */
    Result(TunError error) : data_(ErrorInfo(error)) {}

    /**
     * Constructs a failed Result with full error details.
     * @param info The error payload
     */
    Result(ErrorInfo info) : data_(std::move(info)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    // Success/error checking
    bool is_success() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    // Alias for is_success() for compatibility
    bool is_ok() const noexcept {
        return is_success();
    }

    bool is_error() const noexcept {
        return std::holds_alternative<ErrorInfo>(data_);
    }

    // Value access (throws if error)
    const T& value() const & {
        if (is_error()) {
            throw_error();
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (is_error()) {
            throw_error();
        }
        return std::get<T>(data_);
    }

    T value() && {
        if (is_error()) {
            throw_error();
        }
        return std::move(std::get<T>(data_));
    }

    // Value access with default
    template<typename U>
    T value_or(U&& default_value) const & {
        if (is_success()) {
            return std::get<T>(data_);
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    // Error access
    TunError error() const {
        if (is_success()) {
            return TunError::SUCCESS;
        }
        return std::get<ErrorInfo>(data_).code;
    }

    ErrorInfo error_info() const {
        if (is_success()) {
            return ErrorInfo();
        }
        return std::get<ErrorInfo>(data_);
    }

    std::string error_message() const {
        return error_info().describe();
    }

    int native_code() const {
        return is_success() ? 0 : std::get<ErrorInfo>(data_).native_code;
    }

    // Operators
    explicit operator bool() const noexcept {
        return is_success();
    }

    const T& operator*() const & {
        return value();
    }

    T& operator*() & {
        return value();
    }

    T operator*() && {
        return std::move(*this).value();
    }

    const T* operator->() const {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    T* operator->() {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    // Monadic operations
    template<typename F>
    auto map(F&& func) const & -> Result<decltype(func(std::declval<const T&>()))> {
        using ReturnType = decltype(func(std::declval<const T&>()));
        if (is_error()) {
            return Result<ReturnType>(error_info());
        }
        return Result<ReturnType>(func(std::get<T>(data_)));
    }

    template<typename F>
    auto and_then(F&& func) const & -> decltype(func(std::declval<const T&>())) {
        if (is_error()) {
            using ReturnType = decltype(func(std::declval<const T&>()));
            return ReturnType(error_info());
        }
        return func(std::get<T>(data_));
    }

    // Transform error
    template<typename F>
    Result<T> map_error(F&& func) const & {
        if (is_success()) {
            return *this;
        }
        return Result<T>(func(error_info()));
    }

private:
    [[noreturn]] void throw_error() const {
        const ErrorInfo& info = std::get<ErrorInfo>(data_);
        if (info.message.empty()) {
            throw TunException(info.code);
        }
        throw TunException(info.code, info.message);
    }

    std::variant<T, ErrorInfo> data_;
};

// Specialization for void type
template<>
class Result<void> {
public:
    Result() = default;
    Result(TunError error) : info_(error) {}
    Result(ErrorInfo info) : info_(std::move(info)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return info_.code == TunError::SUCCESS;
    }

    bool is_ok() const noexcept {
        return is_success();
    }

    bool is_error() const noexcept {
        return info_.code != TunError::SUCCESS;
    }

    TunError error() const noexcept {
        return info_.code;
    }

    const ErrorInfo& error_info() const noexcept {
        return info_;
    }

    std::string error_message() const {
        return info_.describe();
    }

    int native_code() const noexcept {
        return info_.native_code;
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    template<typename F>
    auto and_then(F&& func) const -> decltype(func()) {
        if (is_error()) {
            using ReturnType = decltype(func());
            return ReturnType(info_);
        }
        return func();
    }

    template<typename F>
    Result<void> map_error(F&& func) const {
        if (is_success()) {
            return *this;
        }
        return Result<void>(func(info_));
    }

private:
    ErrorInfo info_;
};

// Helper functions for creating Results
template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(TunError error) {
    return Result<T>(error);
}

template<typename T>
Result<T> make_error(TunError error, const std::string& message, int native_code = 0) {
    return Result<T>(ErrorInfo(error, message, native_code));
}

// Convenience macros
#define TUNSTACK_TRY_VOID(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) { \
            return _result.error_info(); \
        } \
    } while (0)

} // namespace core
} // namespace tunstack

#endif // TUNSTACK_RESULT_H
