#include <tunstack/error.h>
#include <unordered_map>

namespace tunstack {
namespace core {

// Error message mapping
std::string TunErrorCategory::message(int ev) const {
    TunError error = static_cast<TunError>(ev);

    static const std::unordered_map<TunError, std::string> error_messages = {
        // General errors (1-19)
        {TunError::SUCCESS, "Success"},
        {TunError::INVALID_PARAMETER, "Invalid parameter provided"},
        {TunError::OUT_OF_MEMORY, "Memory allocation failed"},
        {TunError::OPERATION_ABORTED, "Operation was aborted"},
        {TunError::NOT_INITIALIZED, "Component not initialized"},
        {TunError::ALREADY_INITIALIZED, "Component already initialized"},
        {TunError::RESOURCE_UNAVAILABLE, "Required resource not available"},
        {TunError::OPERATION_NOT_SUPPORTED, "Operation not supported"},
        {TunError::INTERNAL_ERROR, "Internal implementation error"},
        {TunError::RANDOM_GENERATION_FAILED, "Random number generation failed"},

        // Configuration errors (20-39)
        {TunError::NO_HANDLER_REGISTERED, "No registered connection handler found"},
        {TunError::INVALID_CONFIGURATION, "Invalid configuration"},
        {TunError::KEY_SPACE_EXHAUSTED, "Could not allocate a unique connection key"},

        // Connection state errors (40-59)
        {TunError::CONNECTION_CLOSED, "Connection was closed by remote"},
        {TunError::CONNECTION_LOCAL_CLOSED, "Connection was closed by local"},
        {TunError::CONNECTION_ABORTED, "Connection is aborting"},
        {TunError::CONNECTION_NOT_FOUND, "Connection not found"},
        {TunError::CONNECTION_REFUSED, "Connection refused"},
        {TunError::CONNECTION_RESET, "Connection reset"},
        {TunError::DUPLICATE_CONNECTION, "Duplicate connection key"},

        // Native stack errors (60-79)
        {TunError::STACK_WRITE_FAILED, "Native stack write failed"},
        {TunError::STACK_CLOSE_FAILED, "Native stack close failed"},
        {TunError::STACK_OUTPUT_FAILED, "Native stack output failed"},
        {TunError::STACK_ERROR, "Native stack error"},

        // Handler errors (80-99)
        {TunError::HANDLER_CONNECT_FAILED, "Connection handler rejected the connection"},
        {TunError::HANDLER_FORWARD_FAILED, "Connection handler failed to forward data"},

        // Logging errors (100-109)
        {TunError::RATE_LIMITED, "Rate limit exceeded"}
    };

    auto it = error_messages.find(error);
    if (it != error_messages.end()) {
        return it->second;
    }

    return "Unknown error (" + std::to_string(ev) + ")";
}

std::string error_message(TunError error) {
    return TunErrorCategory::instance().message(static_cast<int>(error));
}

bool is_state_error(TunError error) {
    switch (error) {
        case TunError::CONNECTION_CLOSED:
        case TunError::CONNECTION_LOCAL_CLOSED:
        case TunError::CONNECTION_ABORTED:
            return true;
        default:
            return false;
    }
}

bool is_stack_error(TunError error) {
    int code = static_cast<int>(error);
    return code >= 60 && code < 80;
}

} // namespace core
} // namespace tunstack
