#include "common/crc32c.hpp"

#include <array>

namespace tfscope {

namespace {

constexpr uint32_t kCastagnoliPolynomial = 0x82F63B78u;
constexpr uint32_t kMaskDelta = 0xa282ead8u;

constexpr std::array<uint32_t, 256> makeTable()
{
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1u) ? (crc >> 1) ^ kCastagnoliPolynomial : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr std::array<uint32_t, 256> kTable = makeTable();

} // namespace

uint32_t crc32c(const char *data, size_t size)
{
    uint32_t crc = 0xFFFFFFFFu;
    const auto *bytes = reinterpret_cast<const unsigned char *>(data);
    for (size_t i = 0; i < size; ++i) {
        crc = kTable[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

uint32_t maskCrc(uint32_t crc)
{
    return ((crc >> 15) | (crc << 17)) + kMaskDelta;
}

uint32_t unmaskCrc(uint32_t masked)
{
    const uint32_t rot = masked - kMaskDelta;
    return (rot >> 17) | (rot << 15);
}

} // namespace tfscope
