#ifndef WOLGATE_REGISTRY_HPP
#define WOLGATE_REGISTRY_HPP

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

struct DeviceEntry {
    std::string key;
    std::string display_name;
    // as configured, validated per request
    std::string hardware_address;
    std::optional<std::string> broadcast_address;
};

struct ConfigLoadError {
    std::string origin;
    size_t line{0};
    std::string message;
};

std::string to_string(const ConfigLoadError& err);

class Registry;

using RegistryOrError = std::variant<Registry, ConfigLoadError>;

// Device list read from "key,display_name,hardware_address[,broadcast_address]"
// records. Immutable once built.
class Registry {
  private:
    std::vector<DeviceEntry> entries_;
    std::unordered_map<std::string, size_t> index_;

    Registry() = default;

  public:
    static RegistryOrError parse(std::istream& in, std::string_view origin);
    static RegistryOrError load(const std::string& path);

    // nullptr when key is not registered. Matches are exact.
    const DeviceEntry* lookup(std::string_view key) const;

    const std::vector<DeviceEntry>& entries() const noexcept;
    size_t size() const noexcept;
};

// Holds the active registry. Readers take a snapshot with current() and keep
// using it for the whole request; reload() swaps in a complete new registry.
class RegistryHandle {
  private:
    std::shared_ptr<const Registry> active_;

  public:
    explicit RegistryHandle(Registry registry);
    RegistryHandle(const RegistryHandle&) = delete;
    RegistryHandle(RegistryHandle&&) = delete;
    ~RegistryHandle() = default;
    RegistryHandle& operator=(const RegistryHandle&) = delete;
    RegistryHandle& operator=(RegistryHandle&&) = delete;

    std::shared_ptr<const Registry> current() const;

    void replace(Registry registry);

    // Keeps the active registry when the new file fails to load.
    std::optional<ConfigLoadError> reload(const std::string& path);
};

#endif
