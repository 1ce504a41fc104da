#include <stdexcept>
#include <string>

#include "Expect.hh"
#include "SaveFormats/Errors.hh"
#include "SaveFormats/MapFlags.hh"

using namespace std;
using namespace FalloutDASM;

static void TestDecodeInvertsElevationBits() {
  // All elevation bits clear on disk means all elevations are present
  MapFlags all = decode_map_flags(0x00000000);
  EXPECT_TRUE(all.has_elevation(0));
  EXPECT_TRUE(all.has_elevation(1));
  EXPECT_TRUE(all.has_elevation(2));
  EXPECT_FALSE(all.contains(MapFlags::IS_MAP_SAVE));

  MapFlags none = decode_map_flags(0x0000000E);
  EXPECT_FALSE(none.has_elevation(0));
  EXPECT_FALSE(none.has_elevation(1));
  EXPECT_FALSE(none.has_elevation(2));

  // The save bit is not inverted
  MapFlags save = decode_map_flags(0x0000000D);
  EXPECT_TRUE(save.contains(MapFlags::IS_MAP_SAVE));
  EXPECT_TRUE(save.has_elevation(0));
  EXPECT_FALSE(save.has_elevation(1));
  EXPECT_FALSE(save.has_elevation(2));
}

static void TestUnnamedBitsArePreserved() {
  MapFlags f = decode_map_flags(0x80000100);
  EXPECT_EQ(f.unnamed_bits(), 0x80000100u);
  EXPECT_EQ(encode_map_flags(f), 0x80000100u);
}

static void TestEncodeOfDecodeIsIdentity() {
  static const uint32_t words[] = {
      0x00000000, 0x00000001, 0x0000000E, 0x0000000F, 0x00000005,
      0x12345678, 0xFFFFFFFF, 0xFFFFFFF0, 0x7FFFFFFE};
  for (uint32_t word : words) {
    EXPECT_EQ(encode_map_flags(decode_map_flags(word)), word);
  }
}

static void TestSetAndClear() {
  MapFlags f;
  f.set(MapFlags::HAS_ELEVATION_AT_LEVEL_2);
  f.set(MapFlags::IS_MAP_SAVE);
  EXPECT_EQ(f.bits, 0x00000009u);
  EXPECT_EQ(encode_map_flags(f), 0x00000007u);
  f.set(MapFlags::IS_MAP_SAVE, false);
  EXPECT_EQ(f.bits, 0x00000008u);
  EXPECT_THROWS(out_of_range, f.has_elevation(3));
}

static void TestStr() {
  EXPECT_EQ(MapFlags().str(), string("none"));
  EXPECT_EQ(MapFlags(0x00000103).str(), string("IsMapSave|HasElevationAtLevel0|00000100"));
  EXPECT_EQ(decode_map_flags(0x0000000E).str(), string("none"));
}

static void TestEveryWordDecodes() {
  // No flags word is invalid; a header with all bits set decodes and encodes
  // back unchanged
  for (uint32_t word : {0x00000000u, 0x0000000Eu, 0x80000001u, 0xFFFFFFF0u, 0xFFFFFFFFu}) {
    MapFlags f = decode_map_flags(word);
    EXPECT_EQ(encode_map_flags(f), word);
  }
  EXPECT_EQ(decode_map_flags(0xFFFFFFFF).str(), string("IsMapSave|FFFFFFF0"));
}

int main() {
  TestDecodeInvertsElevationBits();
  TestUnnamedBitsArePreserved();
  TestEncodeOfDecodeIsIdentity();
  TestSetAndClear();
  TestStr();
  TestEveryWordDecodes();
  return report_test_results("MapFlagsTests");
}
