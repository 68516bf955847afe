#ifndef TUNSTACK_CONNECTION_HANDLER_REGISTRY_H
#define TUNSTACK_CONNECTION_HANDLER_REGISTRY_H

#include <tunstack/config.h>
#include <tunstack/result.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tunstack {
namespace core {

class ConnectionHandler;

/**
 * Process-wide table of connection handlers, keyed by network type
 * ("tcp", "udp"). Each network can be registered once.
 */
class TUNSTACK_API HandlerRegistry {
public:
    static HandlerRegistry& instance();

    /**
     * @return ALREADY_INITIALIZED if the network already has a handler,
     *         INVALID_PARAMETER for a null handler or empty network name
     */
    Result<void> register_handler(const std::string& network,
                                  std::shared_ptr<ConnectionHandler> handler);

    /** nullptr when nothing is registered for the network. */
    std::shared_ptr<ConnectionHandler> find(const std::string& network) const;

    /** Like find() but reports NO_HANDLER_REGISTERED. */
    Result<std::shared_ptr<ConnectionHandler>> get(const std::string& network) const;

    bool unregister(const std::string& network);
    void clear();

private:
    HandlerRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ConnectionHandler>> handlers_;
};

} // namespace core
} // namespace tunstack

#endif // TUNSTACK_CONNECTION_HANDLER_REGISTRY_H
