#include <wolgate/registry.hpp>
#include <wolgate/interface.hpp>
#include <wolgate/utils.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>

std::string to_string(const ConfigLoadError& err) {
    if (err.line == 0) {
        return fmt::format("{}: {}", err.origin, err.message);
    }
    return fmt::format("{}:{}: {}", err.origin, err.line, err.message);
}

static bool valid_key(std::string_view key) noexcept {
    if (key.empty()) {
        return false;
    }
    for (auto c : key) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
            || c == '_' || c == '-' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return true;
}

RegistryOrError Registry::parse(std::istream& in, std::string_view origin) {
    Registry reg;
    std::string line;
    size_t lineno = 0;

    auto fail = [&](std::string message) -> RegistryOrError {
        return ConfigLoadError{std::string(origin), lineno, std::move(message)};
    };

    while (std::getline(in, line)) {
        ++lineno;
        auto text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }

        auto fields = split_all(text, ',');
        if (fields.size() < 3) {
            return fail(fmt::format("expected key,display_name,hardware_address[,broadcast_address] but found {} field(s)", fields.size()));
        }
        if (fields.size() > 4) {
            return fail(fmt::format("too many fields ({})", fields.size()));
        }

        DeviceEntry entry;
        entry.key = std::string(trim(fields[0]));
        entry.display_name = std::string(trim(fields[1]));
        entry.hardware_address = std::string(trim(fields[2]));
        if (fields.size() == 4 && !trim(fields[3]).empty()) {
            entry.broadcast_address = std::string(trim(fields[3]));
        }

        if (entry.key.empty()) {
            return fail("missing device key");
        }
        if (!valid_key(entry.key)) {
            return fail(fmt::format("device key '{}' may only contain letters, digits, '_', '-' and '.'", entry.key));
        }
        if (entry.hardware_address.empty()) {
            return fail(fmt::format("missing hardware address for '{}'", entry.key));
        }
        if (entry.broadcast_address && !parse_ipv4(*entry.broadcast_address)) {
            return fail(fmt::format("broadcast address '{}' for '{}' is not an IPv4 address", *entry.broadcast_address, entry.key));
        }
        if (entry.display_name.empty()) {
            entry.display_name = entry.key;
        }

        auto [it, inserted] = reg.index_.emplace(entry.key, reg.entries_.size());
        if (!inserted) {
            return fail(fmt::format("duplicate device key '{}'", entry.key));
        }
        reg.entries_.push_back(std::move(entry));
    }

    if (in.bad()) {
        lineno = 0;
        return fail("read error");
    }

    spdlog::debug("loaded {} device(s) from {}", reg.entries_.size(), origin);
    return reg;
}

RegistryOrError Registry::load(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        return ConfigLoadError{path, 0, fmt::format("cannot open device list: {}", strerror(errno))};
    }
    return parse(file, path);
}

const DeviceEntry* Registry::lookup(std::string_view key) const {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

const std::vector<DeviceEntry>& Registry::entries() const noexcept {
    return entries_;
}

size_t Registry::size() const noexcept {
    return entries_.size();
}

RegistryHandle::RegistryHandle(Registry registry)
    : active_(std::make_shared<const Registry>(std::move(registry))) {}

std::shared_ptr<const Registry> RegistryHandle::current() const {
    return std::atomic_load(&active_);
}

void RegistryHandle::replace(Registry registry) {
    std::atomic_store(&active_, std::shared_ptr<const Registry>(std::make_shared<const Registry>(std::move(registry))));
}

std::optional<ConfigLoadError> RegistryHandle::reload(const std::string& path) {
    auto loaded = Registry::load(path);
    if (auto err = std::get_if<ConfigLoadError>(&loaded)) {
        spdlog::error("reload failed, keeping {} device(s): {}", current()->size(), to_string(*err));
        return *err;
    }
    auto& reg = std::get<Registry>(loaded);
    spdlog::info("reloaded {} device(s) from {}", reg.size(), path);
    replace(std::move(reg));
    return std::nullopt;
}
