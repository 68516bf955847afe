#include <tunstack/connection/connection_registry.h>
#include <tunstack/connection.h>
#include <openssl/rand.h>
#include <openssl/err.h>

namespace tunstack {
namespace core {

Result<ConnKey> generate_random_key() {
    unsigned char bytes[sizeof(ConnKey)];
    if (RAND_bytes(bytes, static_cast<int>(sizeof(bytes))) != 1) {
        unsigned long openssl_error = ERR_get_error();
        return make_error<ConnKey>(TunError::RANDOM_GENERATION_FAILED,
                                   "RAND_bytes failed",
                                   static_cast<int>(ERR_GET_REASON(openssl_error)));
    }
    ConnKey key = (static_cast<ConnKey>(bytes[0]) << 24) |
                  (static_cast<ConnKey>(bytes[1]) << 16) |
                  (static_cast<ConnKey>(bytes[2]) << 8) |
                  static_cast<ConnKey>(bytes[3]);
    return make_result(key);
}

ConnectionRegistry& ConnectionRegistry::instance() {
    static ConnectionRegistry instance;
    return instance;
}

ConnectionRegistry::ConnectionRegistry() = default;

ConnectionRegistry::~ConnectionRegistry() = default;

Result<ConnKeyArg*> ConnectionRegistry::register_connection(std::shared_ptr<TcpConnection> connection,
                                                            uint32_t max_attempts) {
    if (!connection) {
        return make_error<ConnKeyArg*>(TunError::INVALID_PARAMETER, "null connection");
    }
    if (max_attempts == 0) {
        return make_error<ConnKeyArg*>(TunError::INVALID_CONFIGURATION,
                                       "key allocation attempts must be positive");
    }

    for (uint32_t attempt = 0; attempt < max_attempts; ++attempt) {
        auto key_result = generate_key();
        if (!key_result) {
            return key_result.error_info();
        }
        ConnKey key = *key_result;

        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(key) != 0) {
            continue;
        }

        Entry entry;
        entry.connection = std::move(connection);
        entry.slot = std::make_unique<ConnKeyArg>();
        entry.slot->key = key;
        ConnKeyArg* slot = entry.slot.get();
        entries_.emplace(key, std::move(entry));
        return make_result(slot);
    }

    return make_error<ConnKeyArg*>(TunError::KEY_SPACE_EXHAUSTED,
                                   "no free connection key after " +
                                   std::to_string(max_attempts) + " attempts");
}

std::shared_ptr<TcpConnection> ConnectionRegistry::find(ConnKey key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.connection;
}

std::shared_ptr<TcpConnection> ConnectionRegistry::find_by_arg(const void* arg) const {
    if (arg == nullptr) {
        return nullptr;
    }
    return find(static_cast<const ConnKeyArg*>(arg)->key);
}

bool ConnectionRegistry::release(ConnKey key) {
    Entry removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        removed = std::move(it->second);
        entries_.erase(it);
    }
    // Connection reference dropped outside the registry lock
    return true;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<ConnKey> ConnectionRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnKey> result;
    result.reserve(entries_.size());
    for (const auto& kv : entries_) {
        result.push_back(kv.first);
    }
    return result;
}

size_t ConnectionRegistry::abort_all() {
    std::vector<std::shared_ptr<TcpConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.reserve(entries_.size());
        for (const auto& kv : entries_) {
            connections.push_back(kv.second.connection);
        }
    }

    for (auto& connection : connections) {
        connection->abort();
    }
    return connections.size();
}

void ConnectionRegistry::set_key_generator(KeyGenerator generator) {
    std::lock_guard<std::mutex> lock(mutex_);
    key_generator_ = std::move(generator);
}

void ConnectionRegistry::clear() {
    std::unordered_map<ConnKey, Entry> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(entries_);
    }
}

Result<ConnKey> ConnectionRegistry::generate_key() const {
    KeyGenerator generator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generator = key_generator_;
    }
    if (generator) {
        return generator();
    }
    return generate_random_key();
}

} // namespace core
} // namespace tunstack
