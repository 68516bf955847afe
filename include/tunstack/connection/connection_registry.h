#ifndef TUNSTACK_CONNECTION_CONNECTION_REGISTRY_H
#define TUNSTACK_CONNECTION_CONNECTION_REGISTRY_H

#include <tunstack/config.h>
#include <tunstack/types.h>
#include <tunstack/result.h>
#include <memory>
#include <mutex>
#include <functional>
#include <unordered_map>
#include <vector>

namespace tunstack {
namespace core {

class TcpConnection;

/**
 * Argument slot handed to the engine with set_arg(). It carries only the
 * identity key, so a callback can never reach a connection object the
 * registry no longer holds. The slot lives exactly as long as the registry
 * entry that owns it.
 */
struct ConnKeyArg {
    ConnKey key;
};

/**
 * Process-wide map from identity key to live TCP connection.
 *
 * Mutated from engine callbacks and from handler threads, so it carries its
 * own mutex instead of relying on the stack lock.
 */
class TUNSTACK_API ConnectionRegistry {
public:
    using KeyGenerator = std::function<Result<ConnKey>()>;

    static ConnectionRegistry& instance();

    ConnectionRegistry();
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * Allocate a fresh random key and an argument slot for a connection.
     *
     * A key already in use is never overwritten: generation is retried up to
     * max_attempts times before failing with KEY_SPACE_EXHAUSTED.
     *
     * @return the slot to install on the native handle; owned by the registry
     */
    Result<ConnKeyArg*> register_connection(std::shared_ptr<TcpConnection> connection,
                                            uint32_t max_attempts = DEFAULT_KEY_ALLOCATION_ATTEMPTS);

    std::shared_ptr<TcpConnection> find(ConnKey key) const;

    /** Resolve the argument an engine callback was invoked with. */
    std::shared_ptr<TcpConnection> find_by_arg(const void* arg) const;

    /**
     * Remove the entry and free its slot.
     * @return true only for the call that actually removed it
     */
    bool release(ConnKey key);

    size_t size() const;
    std::vector<ConnKey> keys() const;

    /**
     * Request abort on every live connection. Native teardown of each one
     * happens on its next engine callback.
     * @return number of connections asked to abort
     */
    size_t abort_all();

    // Replaces the OpenSSL-backed generator, nullptr restores it
    void set_key_generator(KeyGenerator generator);

    // Drops all entries without touching the connections
    void clear();

private:
    struct Entry {
        std::shared_ptr<TcpConnection> connection;
        std::unique_ptr<ConnKeyArg> slot;
    };

    Result<ConnKey> generate_key() const;

    mutable std::mutex mutex_;
    std::unordered_map<ConnKey, Entry> entries_;
    KeyGenerator key_generator_;
};

/** Random identity key from the OpenSSL CSPRNG. */
TUNSTACK_API Result<ConnKey> generate_random_key();

} // namespace core
} // namespace tunstack

#endif // TUNSTACK_CONNECTION_CONNECTION_REGISTRY_H
