#include <wolgate/dispatcher.hpp>
#include <wolgate/utils.hpp>

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

UdpTransport::UdpTransport(std::chrono::milliseconds timeout) : timeout_(timeout) {}

std::optional<std::string> UdpTransport::send_datagram(const Destination& dest, const uint8_t* data, size_t len) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);
    if (inet_pton(AF_INET, dest.address.c_str(), &addr.sin_addr) != 1) {
        return fmt::format("'{}' is not an IPv4 address", dest.address);
    }

    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        return fmt::format("failed to create socket: {}", strerror(errno));
    }
    auto guard = finally([fd] { close(fd); });

    const int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) != 0) {
        return fmt::format("failed to enable broadcast: {}", strerror(errno));
    }

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        return fmt::format("failed to set send timeout: {}", strerror(errno));
    }

    auto sent = sendto(fd, data, len, 0, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        return fmt::format("failed to send to {}:{}: {}", dest.address, dest.port, strerror(errno));
    }
    if (static_cast<size_t>(sent) != len) {
        return fmt::format("short send to {}:{}: {} of {} bytes", dest.address, dest.port, sent, len);
    }
    return std::nullopt;
}

Dispatcher::Dispatcher(Transport& transport, DispatchPolicy policy)
    : transport_(&transport), policy_(policy) {
    if (policy_.count < 1) {
        policy_.count = 1;
    }
}

DispatchResult Dispatcher::send(const MagicPacket& packet, const Destination& dest) {
    for (int i = 0; i < policy_.count; ++i) {
        if (i > 0 && policy_.interval.count() > 0) {
            std::this_thread::sleep_for(policy_.interval);
        }
        auto err = transport_->send_datagram(dest, packet.data(), packet.size());
        if (err) {
            spdlog::debug("datagram {} of {} to {}:{} failed", i + 1, policy_.count, dest.address, dest.port);
            return NetworkError{*std::move(err)};
        }
        spdlog::trace("datagram {} of {} sent to {}:{}", i + 1, policy_.count, dest.address, dest.port);
    }
    return Sent{policy_.count};
}

const DispatchPolicy& Dispatcher::policy() const noexcept {
    return policy_;
}
