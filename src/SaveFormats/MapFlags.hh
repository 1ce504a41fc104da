#pragma once

#include <stdint.h>

#include <string>

namespace FalloutDASM {

// In-memory map flags. This is a plain bit set: a flag is present when its bit
// is 1. Bits without a name are carried through unchanged.
struct MapFlags {
  enum Flag : uint32_t {
    IS_MAP_SAVE = 0x00000001,
    HAS_ELEVATION_AT_LEVEL_0 = 0x00000002,
    HAS_ELEVATION_AT_LEVEL_1 = 0x00000004,
    HAS_ELEVATION_AT_LEVEL_2 = 0x00000008,
  };
  static constexpr uint32_t NAMED_FLAGS_MASK = 0x0000000F;

  uint32_t bits = 0;

  MapFlags() = default;
  explicit MapFlags(uint32_t bits) : bits(bits) { }

  inline bool contains(Flag flag) const {
    return (this->bits & flag) == flag;
  }
  inline void set(Flag flag, bool present = true) {
    if (present) {
      this->bits |= flag;
    } else {
      this->bits &= ~static_cast<uint32_t>(flag);
    }
  }
  inline uint32_t unnamed_bits() const {
    return this->bits & ~NAMED_FLAGS_MASK;
  }
  bool has_elevation(size_t level) const;

  bool operator==(const MapFlags& other) const = default;

  // e.g. "IsMapSave|HasElevationAtLevel0|00000100"
  std::string str() const;
};

// The map file stores the elevation flags inverted (a set bit means the level
// is absent), so the codec XORs them on the way in and out. Both directions
// use the same mask, so encode(decode(x)) == x for every 32-bit word.
constexpr uint32_t MAP_FLAGS_WIRE_INVERSION_MASK = 0x0000000E;

MapFlags decode_map_flags(uint32_t word);
uint32_t encode_map_flags(const MapFlags& flags);

} // namespace FalloutDASM
