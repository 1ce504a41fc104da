#include "MapFlags.hh"

#include <format>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

namespace FalloutDASM {

static const vector<pair<MapFlags::Flag, const char*>> flag_names = {
    {MapFlags::IS_MAP_SAVE, "IsMapSave"},
    {MapFlags::HAS_ELEVATION_AT_LEVEL_0, "HasElevationAtLevel0"},
    {MapFlags::HAS_ELEVATION_AT_LEVEL_1, "HasElevationAtLevel1"},
    {MapFlags::HAS_ELEVATION_AT_LEVEL_2, "HasElevationAtLevel2"},
};

bool MapFlags::has_elevation(size_t level) const {
  switch (level) {
    case 0:
      return this->contains(HAS_ELEVATION_AT_LEVEL_0);
    case 1:
      return this->contains(HAS_ELEVATION_AT_LEVEL_1);
    case 2:
      return this->contains(HAS_ELEVATION_AT_LEVEL_2);
    default:
      throw out_of_range("invalid elevation level");
  }
}

string MapFlags::str() const {
  string ret;
  for (const auto& [flag, name] : flag_names) {
    if (this->contains(flag)) {
      if (!ret.empty()) {
        ret += '|';
      }
      ret += name;
    }
  }
  uint32_t unnamed = this->unnamed_bits();
  if (unnamed) {
    if (!ret.empty()) {
      ret += '|';
    }
    ret += std::format("{:08X}", unnamed);
  }
  return ret.empty() ? "none" : ret;
}

MapFlags decode_map_flags(uint32_t word) {
  return MapFlags(word ^ MAP_FLAGS_WIRE_INVERSION_MASK);
}

uint32_t encode_map_flags(const MapFlags& flags) {
  return flags.bits ^ MAP_FLAGS_WIRE_INVERSION_MASK;
}

} // namespace FalloutDASM
