#include <wolgate/commands.hpp>
#include <wolgate/interface.hpp>
#include <wolgate/mac.hpp>

#include <spdlog/spdlog.h>

std::variant<WakeDefaults, std::string> resolve_defaults(const Config& config) {
    WakeDefaults defaults;
    defaults.port = static_cast<uint16_t>(config.port);
    if (!config.iface.empty()) {
        auto bcast = interface_broadcast(config.iface);
        if (!bcast) {
            std::string names;
            for (const auto& name : interface_names()) {
                names += names.empty() ? name : ", " + name;
            }
            return fmt::format("interface {} has no usable IPv4 broadcast address (available: {})", config.iface, names);
        }
        spdlog::debug("using broadcast address {} of interface {}", *bcast, config.iface);
        defaults.broadcast = *bcast;
    } else {
        if (!parse_ipv4(config.broadcast)) {
            return fmt::format("default broadcast address '{}' is not an IPv4 address", config.broadcast);
        }
        defaults.broadcast = config.broadcast;
    }
    return defaults;
}

std::vector<DeviceRow> list_devices(const Registry& registry, const WakeDefaults& defaults) {
    std::vector<DeviceRow> rows;
    rows.reserve(registry.size());
    for (const auto& entry : registry.entries()) {
        DeviceRow row;
        row.key = entry.key;
        row.display_name = entry.display_name;
        auto normalized = normalize(entry.hardware_address);
        if (auto addr = std::get_if<MAC>(&normalized)) {
            row.mac = to_string(*addr);
            row.mac_ok = true;
        } else {
            row.mac = fmt::format("{} ({})", entry.hardware_address, to_string(std::get<AddressError>(normalized)));
        }
        row.destination = fmt::format("{}:{}", entry.broadcast_address.value_or(defaults.broadcast), defaults.port);
        rows.push_back(std::move(row));
    }
    return rows;
}

CheckReport check_devices(const Registry& registry, const Config& config) {
    CheckReport report;
    report.devices = registry.size();
    for (const auto& entry : registry.entries()) {
        auto normalized = normalize(entry.hardware_address);
        if (auto err = std::get_if<AddressError>(&normalized)) {
            report.problems.push_back(fmt::format("device '{}': {} '{}'", entry.key, to_string(*err), entry.hardware_address));
        }
    }
    auto defaults = resolve_defaults(config);
    if (auto err = std::get_if<std::string>(&defaults)) {
        report.problems.push_back(*err);
    }
    return report;
}
