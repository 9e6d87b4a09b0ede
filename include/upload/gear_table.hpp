#ifndef CHUNKSEAL_GEAR_TABLE_HPP
#define CHUNKSEAL_GEAR_TABLE_HPP

#include <array>
#include <cstdint>
#include <string_view>

namespace chunkseal {

using GearTable = std::array<uint64_t, 256>;

/**
 * @brief The process-wide gear table.
 *
 * Built on first use from the fixed seed and shared read-only afterwards.
 * Entry i is the little-endian value of the first 8 bytes of
 * SHA-256(SHA-256(seed) || uint8(i)), which makes the table identical on
 * every platform.
 */
const GearTable &gearTable();

/**
 * @brief Derive a gear table from an arbitrary seed.
 */
GearTable deriveGearTable(std::string_view seed);

} // namespace chunkseal

#endif // CHUNKSEAL_GEAR_TABLE_HPP
