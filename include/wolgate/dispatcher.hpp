#ifndef WOLGATE_DISPATCHER_HPP
#define WOLGATE_DISPATCHER_HPP

#include <wolgate/magic_packet.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

constexpr uint16_t WOL_PORT = 9;
constexpr const char* LIMITED_BROADCAST = "255.255.255.255";

struct Destination {
    std::string address;
    uint16_t port{WOL_PORT};
};

class Transport {
  public:
    virtual ~Transport() = default;

    // Sends one datagram. Returns an error description on failure.
    virtual std::optional<std::string> send_datagram(const Destination& dest, const uint8_t* data, size_t len) = 0;
};

// IPv4 UDP with SO_BROADCAST. A socket is opened and closed per datagram.
class UdpTransport : public Transport {
  private:
    std::chrono::milliseconds timeout_;

  public:
    explicit UdpTransport(std::chrono::milliseconds timeout);

    std::optional<std::string> send_datagram(const Destination& dest, const uint8_t* data, size_t len) override;
};

struct DispatchPolicy {
    int count{1};
    std::chrono::milliseconds interval{0};
};

// The packet was handed to the network stack. Nothing more is known.
struct Sent {
    int datagrams{0};
};

struct NetworkError {
    std::string detail;
};

using DispatchResult = std::variant<Sent, NetworkError>;

class Dispatcher {
  private:
    Transport* transport_;
    DispatchPolicy policy_;

  public:
    explicit Dispatcher(Transport& transport, DispatchPolicy policy = DispatchPolicy{});

    DispatchResult send(const MagicPacket& packet, const Destination& dest);

    const DispatchPolicy& policy() const noexcept;
};

#endif
