#include <wolgate/mac.hpp>
#include <wolgate/utils.hpp>

#include <spdlog/fmt/fmt.h>

static int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::variant<MAC, AddressError> normalize(std::string_view raw) {
    raw = trim(raw);

    std::string digits;
    digits.reserve(12);
    for (auto c : raw) {
        if (c == ':' || c == '-') {
            continue;
        }
        if (hex_value(c) < 0) {
            return AddressError::Invalid;
        }
        digits.push_back(c);
    }
    if (digits.size() != 12) {
        return AddressError::Invalid;
    }

    MAC mac;
    for (size_t i = 0; i < mac.size(); ++i) {
        mac[i] = static_cast<uint8_t>((hex_value(digits[2 * i]) << 4) | hex_value(digits[2 * i + 1]));
    }

    bool all_zero = true;
    bool all_ones = true;
    for (auto byte : mac) {
        all_zero = all_zero && byte == 0x00;
        all_ones = all_ones && byte == 0xff;
    }
    if (all_zero || all_ones) {
        return AddressError::Suspicious;
    }
    return mac;
}

std::string to_string(const MAC& mac) {
    return fmt::format("{:02X}:{:02X}:{:02X}:{:02X}:{:02X}:{:02X}",
                       mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
}

std::string_view to_string(AddressError err) noexcept {
    switch (err) {
        case AddressError::Invalid:
            return "invalid hardware address";
        case AddressError::Suspicious:
            return "all-zero or broadcast hardware address";
    }
    return "unknown address error";
}
