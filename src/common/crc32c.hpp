#pragma once

#include <cstddef>
#include <cstdint>

namespace tfscope {

// CRC-32C (Castagnoli), as used by the record framing.
uint32_t crc32c(const char *data, size_t size);

// Record checksums are stored masked so that a CRC over data containing
// embedded CRCs stays well distributed.
uint32_t maskCrc(uint32_t crc);
uint32_t unmaskCrc(uint32_t masked);

inline uint32_t maskedCrc32c(const char *data, size_t size)
{
    return maskCrc(crc32c(data, size));
}

} // namespace tfscope
