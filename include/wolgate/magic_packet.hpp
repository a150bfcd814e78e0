#ifndef WOLGATE_MAGIC_PACKET_HPP
#define WOLGATE_MAGIC_PACKET_HPP

#include <wolgate/mac.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

constexpr size_t MAGIC_SYNC_SIZE = 6;
constexpr size_t MAGIC_REPEAT_COUNT = 16;
constexpr size_t MAGIC_PACKET_SIZE = MAGIC_SYNC_SIZE + MAGIC_REPEAT_COUNT * std::tuple_size<MAC>::value;

using MagicPacket = std::array<uint8_t, MAGIC_PACKET_SIZE>;

// six 0xFF bytes followed by the address sixteen times
MagicPacket build_magic_packet(const MAC& mac);

#endif
