#ifndef CHUNKSEAL_CRC32C_HPP
#define CHUNKSEAL_CRC32C_HPP

#include <cstddef>
#include <cstdint>

namespace chunkseal {

/**
 * @brief CRC32C (Castagnoli) checksum.
 *
 * Table driven software implementation of the reflected polynomial
 * 0x82F63B78. Incremental use:
 * @code
 * uint32_t crc = CRC32C_INIT;
 * crc = crc32c_update(crc, buf1, len1);
 * crc = crc32c_update(crc, buf2, len2);
 * uint32_t value = crc32c_finalize(crc);
 * @endcode
 */
inline constexpr uint32_t CRC32C_INIT = 0xFFFFFFFFu;

uint32_t crc32c_update(uint32_t crc, const uint8_t *data, size_t size);

inline uint32_t crc32c_finalize(uint32_t crc) { return crc ^ 0xFFFFFFFFu; }

/** One-shot CRC32C of a buffer. */
uint32_t crc32c(const uint8_t *data, size_t size);

} // namespace chunkseal

#endif // CHUNKSEAL_CRC32C_HPP
