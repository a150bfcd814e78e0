#include <wolgate/interface.hpp>
#include <wolgate/utils.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <arpa/inet.h>

#include <cerrno>
#include <cstring>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/types.h>
#include <ifaddrs.h>

std::vector<std::string> interface_names() {
    std::vector<std::string> ret;
    auto ifaces = if_nameindex();
    if (ifaces == nullptr) {
        spdlog::error("failed to list network interfaces: {}", strerror(errno));
        return ret;
    }
    auto guard = finally([ifaces] { if_freenameindex(ifaces); });
    for (auto iface = ifaces; iface->if_index != 0 && iface->if_name != nullptr; ++iface) {
        ret.emplace_back(iface->if_name);
    }
    return ret;
}

std::vector<IPv4Subnet> interface_ipv4_addrs(std::string_view iface) {
    std::vector<IPv4Subnet> ret;
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        spdlog::error("failed to read interface addresses: {}", strerror(errno));
        return ret;
    }
    auto guard = finally([addrs] { freeifaddrs(addrs); });
    for (auto addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr != nullptr && addr->ifa_netmask != nullptr && iface == addr->ifa_name) {
            if (addr->ifa_addr->sa_family == AF_INET) {
                IPv4Subnet val;
                std::memcpy(val.addr.data(), &((struct sockaddr_in *)addr->ifa_addr)->sin_addr.s_addr, 4);
                std::memcpy(val.mask.data(), &((struct sockaddr_in *)addr->ifa_netmask)->sin_addr.s_addr, 4);
                ret.push_back(val);
            }
        }
    }
    return ret;
}

IPv4 broadcast_of(const IPv4Subnet& subnet) noexcept {
    IPv4 ret;
    for (size_t i = 0; i < ret.size(); ++i) {
        ret[i] = static_cast<uint8_t>(subnet.addr[i] | ~subnet.mask[i]);
    }
    return ret;
}

std::string to_string(const IPv4& addr) {
    return fmt::format("{}.{}.{}.{}", addr[0], addr[1], addr[2], addr[3]);
}

std::optional<IPv4> parse_ipv4(const std::string& text) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    IPv4 ret;
    std::memcpy(ret.data(), &addr.s_addr, 4);
    return ret;
}

std::optional<std::string> interface_broadcast(std::string_view iface) {
    auto subnets = interface_ipv4_addrs(iface);
    if (subnets.empty()) {
        spdlog::warn("interface {} has no IPv4 address", iface);
        return std::nullopt;
    }
    return to_string(broadcast_of(subnets.front()));
}
