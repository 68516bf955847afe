#include <tunstack/types.h>
#include <sstream>
#include <tuple>

namespace tunstack {
namespace core {

namespace {

const char* const STATE_NAMES[] = {
    "OPEN",
    "LOCAL_CLOSING",
    "CLOSED",
    "ABORTING",
    "ABORTED",
};

void put_u32(std::array<uint8_t, 16>& bytes, size_t offset, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        bytes[offset + i] = static_cast<uint8_t>(value >> (24 - 8 * i));
    }
}

uint32_t get_u32(const std::array<uint8_t, 16>& bytes, size_t offset) {
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value = (value << 8) | bytes[offset + i];
    }
    return value;
}

// ::ffff:a.b.c.d, what a dual-stack engine reports for IPv4 peers
bool is_v4_mapped(const std::array<uint8_t, 16>& bytes) {
    for (size_t i = 0; i < 10; ++i) {
        if (bytes[i] != 0) {
            return false;
        }
    }
    return bytes[10] == 0xFF && bytes[11] == 0xFF;
}

void write_dotted(std::ostream& os, const std::array<uint8_t, 16>& bytes, size_t offset) {
    os << static_cast<int>(bytes[offset]) << '.'
       << static_cast<int>(bytes[offset + 1]) << '.'
       << static_cast<int>(bytes[offset + 2]) << '.'
       << static_cast<int>(bytes[offset + 3]);
}

} // namespace

std::string to_string(ConnectionState state) {
    auto index = static_cast<size_t>(state);
    if (index < sizeof(STATE_NAMES) / sizeof(STATE_NAMES[0])) {
        return STATE_NAMES[index];
    }
    return "UNKNOWN_STATE(" + std::to_string(index) + ")";
}

std::string to_string(const NetworkAddress& addr) {
    std::ostringstream oss;
    if (addr.is_ipv4()) {
        write_dotted(oss, addr.address, 0);
    } else if (is_v4_mapped(addr.address)) {
        oss << "[::ffff:";
        write_dotted(oss, addr.address, 12);
        oss << ']';
    } else {
        oss << '[' << std::hex;
        for (size_t i = 0; i < addr.address.size(); i += 2) {
            if (i != 0) {
                oss << ':';
            }
            oss << ((addr.address[i] << 8) | addr.address[i + 1]);
        }
        oss << std::dec << ']';
    }
    oss << ':' << addr.port;
    return oss.str();
}

bool NetworkAddress::operator==(const NetworkAddress& other) const noexcept {
    return std::tie(family, port, address) == std::tie(other.family, other.port, other.address);
}

bool NetworkAddress::operator!=(const NetworkAddress& other) const noexcept {
    return !(*this == other);
}

bool NetworkAddress::operator<(const NetworkAddress& other) const noexcept {
    return std::tie(family, port, address) < std::tie(other.family, other.port, other.address);
}

NetworkAddress NetworkAddress::from_ipv4(uint32_t ipv4_addr, uint16_t port_num) {
    NetworkAddress addr;
    addr.family = Family::IPv4;
    addr.port = port_num;
    put_u32(addr.address, 0, ipv4_addr);
    return addr;
}

NetworkAddress NetworkAddress::from_ipv6(const std::array<uint8_t, 16>& ipv6_addr, uint16_t port_num) {
    NetworkAddress addr;
    addr.family = Family::IPv6;
    addr.port = port_num;
    addr.address = ipv6_addr;
    return addr;
}

uint32_t NetworkAddress::to_ipv4() const {
    if (is_ipv4()) {
        return get_u32(address, 0);
    }
    if (is_v4_mapped(address)) {
        return get_u32(address, 12);
    }
    return 0;
}

std::array<uint8_t, 16> NetworkAddress::to_ipv6() const {
    if (!is_ipv4()) {
        return address;
    }
    std::array<uint8_t, 16> mapped{};
    mapped[10] = 0xFF;
    mapped[11] = 0xFF;
    put_u32(mapped, 12, get_u32(address, 0));
    return mapped;
}

} // namespace core
} // namespace tunstack
