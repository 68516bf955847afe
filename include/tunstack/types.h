#ifndef TUNSTACK_TYPES_H
#define TUNSTACK_TYPES_H

#include <tunstack/config.h>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <chrono>

namespace tunstack {
namespace core {

// Identity key passed across the native callback boundary
using ConnKey = uint32_t;

// Network type names used for handler registration
constexpr const char* NETWORK_TCP = "tcp";
constexpr const char* NETWORK_UDP = "udp";

// Engine coarse-timer ticks between poll callbacks
constexpr uint8_t TCP_POLL_INTERVAL = 8;

// Connection key allocation retries before giving up
constexpr uint32_t DEFAULT_KEY_ALLOCATION_ATTEMPTS = 16;

/**
 * Lifecycle state of a TCP connection.
 *
 * OPEN -> LOCAL_CLOSING -> CLOSED is the graceful path. ABORTING -> ABORTED is
 * reachable from any non-terminal state. CLOSED and ABORTED are terminal.
 */
enum class ConnectionState : uint8_t {
    OPEN = 0,
    LOCAL_CLOSING,     // Peer sent end-of-stream or close() requested, draining
    CLOSED,            // Graceful release done
    ABORTING,          // abort() requested, native teardown pending
    ABORTED            // Forced or engine-driven release done
};

inline bool is_terminal(ConnectionState state) noexcept {
    return state == ConnectionState::CLOSED || state == ConnectionState::ABORTED;
}

struct NetworkAddress {
    enum class Family : uint8_t {
        IPv4 = 4,
        IPv6 = 6
    };

    Family family = Family::IPv4;
    std::array<uint8_t, 16> address{}; // IPv6 size covers IPv4
    uint16_t port{0};

    bool is_ipv4() const noexcept { return family == Family::IPv4; }
    bool is_ipv6() const noexcept { return family == Family::IPv6; }

    // Comparison operators
    bool operator==(const NetworkAddress& other) const noexcept;
    bool operator!=(const NetworkAddress& other) const noexcept;
    bool operator<(const NetworkAddress& other) const noexcept;

    // Factory methods
    static NetworkAddress from_ipv4(uint32_t ipv4_addr, uint16_t port_num);
    static NetworkAddress from_ipv6(const std::array<uint8_t, 16>& ipv6_addr, uint16_t port_num);

    // Conversion methods
    uint32_t to_ipv4() const;
    std::array<uint8_t, 16> to_ipv6() const;
};

// Utility functions
TUNSTACK_API std::string to_string(ConnectionState state);
TUNSTACK_API std::string to_string(const NetworkAddress& addr);

} // namespace core
} // namespace tunstack

#endif // TUNSTACK_TYPES_H
