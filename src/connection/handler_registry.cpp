#include <tunstack/connection/handler_registry.h>
#include <tunstack/connection.h>

namespace tunstack {
namespace core {

HandlerRegistry& HandlerRegistry::instance() {
    static HandlerRegistry instance;
    return instance;
}

Result<void> HandlerRegistry::register_handler(const std::string& network,
                                               std::shared_ptr<ConnectionHandler> handler) {
    if (network.empty() || !handler) {
        return make_error<void>(TunError::INVALID_PARAMETER);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.count(network) != 0) {
        return make_error<void>(TunError::ALREADY_INITIALIZED,
                                "handler for " + network + " already registered");
    }
    handlers_.emplace(network, std::move(handler));
    return make_result();
}

std::shared_ptr<ConnectionHandler> HandlerRegistry::find(const std::string& network) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(network);
    return it == handlers_.end() ? nullptr : it->second;
}

Result<std::shared_ptr<ConnectionHandler>> HandlerRegistry::get(const std::string& network) const {
    auto handler = find(network);
    if (!handler) {
        return make_error<std::shared_ptr<ConnectionHandler>>(
            TunError::NO_HANDLER_REGISTERED, "no " + network + " handler registered");
    }
    return make_result(std::move(handler));
}

bool HandlerRegistry::unregister(const std::string& network) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(network) != 0;
}

void HandlerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

} // namespace core
} // namespace tunstack
