#ifndef WOLGATE_WAKER_HPP
#define WOLGATE_WAKER_HPP

#include <wolgate/dispatcher.hpp>
#include <wolgate/registry.hpp>

#include <cstdint>
#include <string>
#include <string_view>

enum class WakeStatus {
    Success,
    UnknownDevice,
    InvalidAddress,
    SuspiciousAddress,
    NetworkError,
};

struct WakeResult {
    WakeStatus status{WakeStatus::Success};
    std::string key;
    std::string display_name;
    // canonical MAC and destination on success, failure cause otherwise
    std::string mac;
    std::string destination;
    std::string detail;
};

struct WakeDefaults {
    std::string broadcast{LIMITED_BROADCAST};
    uint16_t port{WOL_PORT};
};

// Resolves a device key and sends its magic packet.
class Waker {
  private:
    const RegistryHandle* registry_;
    Dispatcher* dispatcher_;
    WakeDefaults defaults_;

  public:
    Waker(const RegistryHandle& registry, Dispatcher& dispatcher, WakeDefaults defaults);

    WakeResult wake(std::string_view key);

    Destination destination_for(const DeviceEntry& entry) const;
};

std::string describe(const WakeResult& result);

std::string_view to_string(WakeStatus status) noexcept;

int exit_code(WakeStatus status) noexcept;

#endif
