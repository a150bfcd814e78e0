#ifndef WOLGATE_COMMANDS_HPP
#define WOLGATE_COMMANDS_HPP

#include <wolgate/config.hpp>
#include <wolgate/registry.hpp>
#include <wolgate/waker.hpp>

#include <string>
#include <variant>
#include <vector>

struct DeviceRow {
    std::string key;
    std::string display_name;
    // canonical form when valid, the configured text and the reason otherwise
    std::string mac;
    bool mac_ok{false};
    std::string destination;
};

struct CheckReport {
    size_t devices{0};
    std::vector<std::string> problems;

    bool ok() const noexcept { return problems.empty(); }
};

// Default destination for devices without their own broadcast address.
// Fails when the configured address is not IPv4 or the interface has none.
std::variant<WakeDefaults, std::string> resolve_defaults(const Config& config);

std::vector<DeviceRow> list_devices(const Registry& registry, const WakeDefaults& defaults);

CheckReport check_devices(const Registry& registry, const Config& config);

#endif
