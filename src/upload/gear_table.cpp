#include "upload/gear_table.hpp"
#include "upload/upload_constants.hpp"
#include "utilities/digest.hpp"

namespace chunkseal {

GearTable deriveGearTable(std::string_view seed) {
  Sha256Builder seedHasher;
  seedHasher.update(seed);
  const Digest seedDigest = seedHasher.finalize();

  GearTable table{};
  for (unsigned i = 0; i < table.size(); ++i) {
    Sha256Builder b;
    b.update(seedDigest).updateByte(static_cast<uint8_t>(i));
    const Digest d = b.finalize();
    uint64_t value = 0;
    for (int byte = 7; byte >= 0; --byte) {
      value = (value << 8) | d[byte];
    }
    table[i] = value;
  }
  return table;
}

const GearTable &gearTable() {
  static const GearTable table =
      deriveGearTable(constants::CDC_GEAR_TABLE_SEED);
  return table;
}

} // namespace chunkseal
