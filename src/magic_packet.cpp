#include <wolgate/magic_packet.hpp>

#include <algorithm>

MagicPacket build_magic_packet(const MAC& mac) {
    MagicPacket packet;
    auto out = std::fill_n(packet.begin(), MAGIC_SYNC_SIZE, uint8_t{0xff});
    for (size_t i = 0; i < MAGIC_REPEAT_COUNT; ++i) {
        out = std::copy(mac.begin(), mac.end(), out);
    }
    return packet;
}
