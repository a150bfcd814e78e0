#ifndef WOLGATE_MAC_HPP
#define WOLGATE_MAC_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

using MAC = std::array<uint8_t, 6>;

enum class AddressError {
    // wrong length or a non-hex character after stripping separators
    Invalid,
    // well-formed, but all-zero or the broadcast address
    Suspicious,
};

// 12 hex digits in any case, optionally separated by ':' or '-'
std::variant<MAC, AddressError> normalize(std::string_view raw);

std::string to_string(const MAC& mac);

std::string_view to_string(AddressError err) noexcept;

#endif
