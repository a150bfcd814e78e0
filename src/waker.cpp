#include <wolgate/waker.hpp>
#include <wolgate/mac.hpp>
#include <wolgate/magic_packet.hpp>
#include <wolgate/utils.hpp>

#include <spdlog/spdlog.h>

Waker::Waker(const RegistryHandle& registry, Dispatcher& dispatcher, WakeDefaults defaults)
    : registry_(&registry), dispatcher_(&dispatcher), defaults_(std::move(defaults)) {}

Destination Waker::destination_for(const DeviceEntry& entry) const {
    return Destination{entry.broadcast_address.value_or(defaults_.broadcast), defaults_.port};
}

WakeResult Waker::wake(std::string_view key) {
    WakeResult result;
    result.key = std::string(key);

    // one snapshot for the whole request, a concurrent reload does not affect it
    auto registry = registry_->current();
    auto entry = registry->lookup(key);
    if (entry == nullptr) {
        result.status = WakeStatus::UnknownDevice;
        spdlog::warn("wake requested for unknown device '{}'", escape(key));
        return result;
    }
    result.display_name = entry->display_name;

    auto normalized = normalize(entry->hardware_address);
    if (auto err = std::get_if<AddressError>(&normalized)) {
        result.status = *err == AddressError::Suspicious ? WakeStatus::SuspiciousAddress : WakeStatus::InvalidAddress;
        result.detail = entry->hardware_address;
        spdlog::warn("device '{}' has {} '{}'", entry->key, to_string(*err), entry->hardware_address);
        return result;
    }
    const auto& mac = std::get<MAC>(normalized);
    result.mac = to_string(mac);

    auto dest = destination_for(*entry);
    result.destination = fmt::format("{}:{}", dest.address, dest.port);

    auto packet = build_magic_packet(mac);
    auto sent = dispatcher_->send(packet, dest);
    if (auto err = std::get_if<NetworkError>(&sent)) {
        result.status = WakeStatus::NetworkError;
        result.detail = err->detail;
        spdlog::error("failed to wake '{}' ({} via {}): {}", entry->key, result.mac, result.destination, err->detail);
        return result;
    }

    result.status = WakeStatus::Success;
    spdlog::info("woke device '{}' (MAC {}, broadcast {}, {} packet(s))",
                 entry->key, result.mac, result.destination, std::get<Sent>(sent).datagrams);
    return result;
}

std::string describe(const WakeResult& result) {
    switch (result.status) {
        case WakeStatus::Success:
            return fmt::format("Sent wake packet to '{}' ({} via {}); delivery is not confirmed",
                               result.display_name, result.mac, result.destination);
        case WakeStatus::UnknownDevice:
            return fmt::format("Unknown device key: {}", escape(result.key));
        case WakeStatus::InvalidAddress:
            return fmt::format("Device '{}' has an invalid hardware address '{}'; fix the device list",
                               result.key, result.detail);
        case WakeStatus::SuspiciousAddress:
            return fmt::format("Device '{}' has an all-zero or broadcast hardware address '{}'; fix the device list",
                               result.key, result.detail);
        case WakeStatus::NetworkError:
            return fmt::format("Failed to send wake packet to '{}': {}", result.display_name, result.detail);
    }
    return "unknown result";
}

std::string_view to_string(WakeStatus status) noexcept {
    switch (status) {
        case WakeStatus::Success:
            return "Success";
        case WakeStatus::UnknownDevice:
            return "UnknownDevice";
        case WakeStatus::InvalidAddress:
            return "InvalidAddress";
        case WakeStatus::SuspiciousAddress:
            return "SuspiciousAddress";
        case WakeStatus::NetworkError:
            return "NetworkError";
    }
    return "Unknown";
}

int exit_code(WakeStatus status) noexcept {
    switch (status) {
        case WakeStatus::Success:
            return 0;
        case WakeStatus::NetworkError:
            return 1;
        case WakeStatus::InvalidAddress:
        case WakeStatus::SuspiciousAddress:
            return 2;
        case WakeStatus::UnknownDevice:
            return 3;
    }
    return 1;
}
