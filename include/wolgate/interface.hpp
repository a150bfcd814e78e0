#ifndef WOLGATE_INTERFACE_HPP
#define WOLGATE_INTERFACE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using IPv4 = std::array<uint8_t, 4>;

struct IPv4Subnet {
    IPv4 addr;
    IPv4 mask;
};

std::vector<std::string> interface_names();

std::vector<IPv4Subnet> interface_ipv4_addrs(std::string_view iface);

IPv4 broadcast_of(const IPv4Subnet& subnet) noexcept;

std::string to_string(const IPv4& addr);

// Dotted-quad form only, as inet_pton accepts it.
std::optional<IPv4> parse_ipv4(const std::string& text);

// Directed broadcast address of the first IPv4 subnet on iface.
std::optional<std::string> interface_broadcast(std::string_view iface);

#endif
