#ifndef TUNSTACK_ERROR_H
#define TUNSTACK_ERROR_H

#include <tunstack/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace tunstack {
namespace core {

// tunstack error codes
enum class TunError : int {
    SUCCESS = 0,

    // General errors (1-19)
    INVALID_PARAMETER = 1,
    OUT_OF_MEMORY = 2,
    OPERATION_ABORTED = 3,
    NOT_INITIALIZED = 4,
    ALREADY_INITIALIZED = 5,
    RESOURCE_UNAVAILABLE = 6,
    OPERATION_NOT_SUPPORTED = 7,
    INTERNAL_ERROR = 8,
    RANDOM_GENERATION_FAILED = 9,

    // Configuration errors (20-39)
    NO_HANDLER_REGISTERED = 20,
    INVALID_CONFIGURATION = 21,
    KEY_SPACE_EXHAUSTED = 22,

    // Connection state errors (40-59)
    CONNECTION_CLOSED = 40,
    CONNECTION_LOCAL_CLOSED = 41,
    CONNECTION_ABORTED = 42,
    CONNECTION_NOT_FOUND = 43,
    CONNECTION_REFUSED = 44,
    CONNECTION_RESET = 45,
    DUPLICATE_CONNECTION = 46,

    // Native stack errors (60-79)
    STACK_WRITE_FAILED = 60,
    STACK_CLOSE_FAILED = 61,
    STACK_OUTPUT_FAILED = 62,
    STACK_ERROR = 63,

    // Handler errors (80-99)
    HANDLER_CONNECT_FAILED = 80,
    HANDLER_FORWARD_FAILED = 81,

    // Logging errors (100-109)
    RATE_LIMITED = 100
};

// Error category for tunstack errors
class TunErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "tunstack";
    }

    std::string message(int ev) const override;

    static const TunErrorCategory& instance() {
        static TunErrorCategory instance;
        return instance;
    }
};

// Create error code from tunstack error
inline std::error_code make_error_code(TunError e) {
    return std::error_code(static_cast<int>(e), TunErrorCategory::instance());
}

// Exception class for tunstack errors
class TUNSTACK_API TunException : public std::system_error {
public:
    explicit TunException(TunError error)
        : std::system_error(make_error_code(error)) {}

    TunException(TunError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    TunException(TunError error, const char* what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    TunError tun_error() const noexcept {
        return static_cast<TunError>(code().value());
    }
};

// Utility functions
TUNSTACK_API std::string error_message(TunError error);
TUNSTACK_API bool is_state_error(TunError error);
TUNSTACK_API bool is_stack_error(TunError error);

#define TUNSTACK_THROW_IF_ERROR(error) \
    do { \
        if ((error) != TunError::SUCCESS) { \
            throw TunException((error)); \
        } \
    } while (0)

#define TUNSTACK_RETURN_IF_ERROR(result) \
    do { \
        if (!(result).is_success()) { \
            return (result).error_info(); \
        } \
    } while (0)

} // namespace core
} // namespace tunstack

// Make TunError compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<tunstack::core::TunError> : true_type {};
}

#endif // TUNSTACK_ERROR_H
