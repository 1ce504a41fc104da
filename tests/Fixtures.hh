#pragma once

#include <stdint.h>

#include <algorithm>
#include <phosg/Strings.hh>
#include <string>
#include <vector>

#include "SaveFormats/MapFile.hh"
#include "SaveFormats/SaveHeader.hh"
#include "SaveFormats/Scripts.hh"

// Builders for synthetic map and save files. These write the on-disk layouts
// directly with StringWriter instead of going through the encoders, so decoder
// tests don't depend on the code they're checking.

namespace Fixtures {

// On-disk flag words. The elevation bits are inverted on disk, so 0 means all
// three elevations are present.
constexpr uint32_t WIRE_FLAGS_ALL_ELEVATIONS = 0x00000000;
constexpr uint32_t WIRE_FLAGS_ELEVATION_0_ONLY = 0x0000000C;
constexpr uint32_t WIRE_FLAGS_NO_ELEVATIONS = 0x0000000E;

struct MapHeaderFields {
  uint32_t version = 20;
  std::string filename = "ARCAVES.MAP";
  // If not empty, written as the whole 16-byte field instead of filename
  std::string filename_field;
  int32_t default_player_position = 0x4E5A;
  int32_t default_player_elevation = 0;
  int32_t default_player_orientation = 2;
  int32_t local_variable_count = 0;
  int32_t script_id = 0x33;
  uint32_t flags_word = WIRE_FLAGS_ELEVATION_0_ONLY;
  int32_t darkness = 1;
  int32_t global_variable_count = 0;
  int32_t id = 0x0C;
  uint32_t ticks = 0x0001E240;
};

inline std::string map_header_bytes(const MapHeaderFields& fields) {
  phosg::StringWriter w;
  w.put_u32b(fields.version);
  if (fields.filename_field.empty()) {
    w.write(fields.filename);
    w.write(std::string(FalloutDASM::MAP_FILENAME_SIZE - fields.filename.size(), '\0'));
  } else {
    w.write(fields.filename_field);
  }
  w.put_u32b(fields.default_player_position);
  w.put_u32b(fields.default_player_elevation);
  w.put_u32b(fields.default_player_orientation);
  w.put_u32b(fields.local_variable_count);
  w.put_u32b(fields.script_id);
  w.put_u32b(fields.flags_word);
  w.put_u32b(fields.darkness);
  w.put_u32b(fields.global_variable_count);
  w.put_u32b(fields.id);
  w.put_u32b(fields.ticks);
  for (size_t z = 0; z < FalloutDASM::MAP_MYSTERY_BYTES_SIZE; z++) {
    w.put_u8(z & 0xFF);
  }
  return std::move(w.str());
}

inline std::string variable_bytes(const std::vector<int32_t>& values) {
  phosg::StringWriter w;
  for (int32_t v : values) {
    w.put_u32b(v);
  }
  return std::move(w.str());
}

inline std::vector<int32_t> sequential_values(size_t count, int32_t base) {
  std::vector<int32_t> ret;
  for (size_t z = 0; z < count; z++) {
    ret.emplace_back(base + static_cast<int32_t>(z));
  }
  return ret;
}

// Tile bytes for however many elevations the on-disk flag word says are
// present. The contents are a repeating pattern so opaque handling is visible.
inline std::string tile_bytes(uint32_t flags_word) {
  size_t size = FalloutDASM::tile_block_size(FalloutDASM::decode_map_flags(flags_word));
  std::string ret(size, '\0');
  for (size_t z = 0; z < size; z++) {
    ret[z] = static_cast<char>((z * 7) & 0xFF);
  }
  return ret;
}

// A real script record of the size implied by its type. The opaque regions are
// filled with distinct bytes: 0xA0 before the id, 0xB1 between the id and the
// variable offset, 0xC2 after the variable count.
inline std::string script_record_bytes(uint8_t type, int32_t id,
    int32_t local_variable_offset = -1, int32_t local_variable_count = 0,
    uint32_t tag_low_bits = 0) {
  size_t record_size;
  switch (type) {
    case 1:
      record_size = 72;
      break;
    case 2:
      record_size = 68;
      break;
    default:
      record_size = 64;
      break;
  }
  phosg::StringWriter w;
  w.put_u32b((static_cast<uint32_t>(type) << 24) | (tag_low_bits & 0x00FFFFFF));
  w.write(std::string(record_size - 0x38, '\xA0'));
  w.put_u32b(id);
  w.write(std::string(8, '\xB1'));
  w.put_u32b(local_variable_offset);
  w.put_u32b(local_variable_count);
  w.write(std::string(0x20, '\xC2'));
  return std::move(w.str());
}

inline std::string footer_bytes(uint32_t batch_index, uint32_t batch_count) {
  phosg::StringWriter w;
  w.put_u32b(batch_count);
  w.put_u32b(0xF0F00000 | batch_index);
  return std::move(w.str());
}

// An unused slot after the last partial batch. Its size is determined by its
// tag in the same way as the game does it: 72 for spatial, 68 for items, 64
// for everything else.
inline std::string padding_slot_bytes(uint8_t tag_type) {
  size_t size = (tag_type == 1) ? 72 : (tag_type == 2) ? 68 : 64;
  phosg::StringWriter w;
  w.put_u32b(static_cast<uint32_t>(tag_type) << 24);
  w.write(std::string(size - 4, '\xEE'));
  return std::move(w.str());
}

// A complete group: count, batches of 16 with footers, and padding slots (all
// with tag type padding_tag) filling out the last batch.
inline std::string script_group_bytes(const std::vector<std::string>& records,
    uint8_t padding_tag = 0) {
  phosg::StringWriter w;
  w.put_u32b(records.size());
  size_t batch_index = 0;
  for (size_t start = 0; start < records.size(); start += 16) {
    size_t end = std::min<size_t>(start + 16, records.size());
    for (size_t z = start; z < end; z++) {
      w.write(records[z]);
    }
    for (size_t z = end - start; z < 16; z++) {
      w.write(padding_slot_bytes(padding_tag));
    }
    w.write(footer_bytes(batch_index++, end - start));
  }
  return std::move(w.str());
}

inline std::vector<std::string> script_records(uint8_t type, size_t count, int32_t first_id,
    int32_t first_variable_offset = -1, int32_t variables_per_script = 0) {
  std::vector<std::string> ret;
  for (size_t z = 0; z < count; z++) {
    int32_t offset = (first_variable_offset < 0)
        ? -1
        : (first_variable_offset + static_cast<int32_t>(z) * variables_per_script);
    ret.emplace_back(script_record_bytes(type, first_id + static_cast<int32_t>(z), offset,
        (first_variable_offset < 0) ? 0 : variables_per_script));
  }
  return ret;
}

// Bytes that follow the script groups (objects, etc.), not interpreted by the
// decoder
inline std::string trailing_bytes() {
  return std::string("\x00\x00\x00\x05OBJECTS", 11);
}

// 4 globals, 739 locals, and 85 scripts: none in the system group, 3 spatial,
// 2 items, 32 scenery (exactly two full batches) and 48 critters. The items
// and critters scripts have local variables, all inside the local variable
// table.
inline std::string scenario_a_map() {
  MapHeaderFields fields;
  fields.global_variable_count = 4;
  fields.local_variable_count = 739;
  fields.flags_word = WIRE_FLAGS_ELEVATION_0_ONLY;

  std::string ret = map_header_bytes(fields);
  ret += variable_bytes(sequential_values(4, 1000));
  ret += variable_bytes(sequential_values(739, 0));
  ret += tile_bytes(fields.flags_word);
  ret += script_group_bytes({}, 0);
  ret += script_group_bytes(script_records(1, 3, 0x01000000), 1);
  ret += script_group_bytes(script_records(2, 2, 0x02000000, 0, 3), 2);
  ret += script_group_bytes(script_records(3, 32, 0x03000000), 0);
  // 6 + 48 * 15 = 726, so the last critter uses [711, 726) and the remaining
  // variables [726, 739) belong to the map script
  ret += script_group_bytes(script_records(4, 48, 0x04000000, 6, 15), 0);
  ret += trailing_bytes();
  return ret;
}

// 1 global, no locals, no scripts in any group
inline std::string scenario_b_map() {
  MapHeaderFields fields;
  fields.global_variable_count = 1;
  fields.local_variable_count = 0;
  fields.flags_word = WIRE_FLAGS_NO_ELEVATIONS;

  std::string ret = map_header_bytes(fields);
  ret += variable_bytes({0x7FFFFFFF});
  ret += tile_bytes(fields.flags_word);
  for (size_t z = 0; z < FalloutDASM::SCRIPT_GROUP_COUNT; z++) {
    ret += script_group_bytes({});
  }
  ret += trailing_bytes();
  return ret;
}

// 2 globals and 10 locals, but the only script (a critter with id 0x44) claims
// locals [8, 12), past the end of the table
inline std::string map_with_out_of_range_variables() {
  MapHeaderFields fields;
  fields.global_variable_count = 2;
  fields.local_variable_count = 10;
  fields.flags_word = WIRE_FLAGS_NO_ELEVATIONS;
  std::string ret = map_header_bytes(fields);
  ret += variable_bytes(sequential_values(12, 0));
  for (size_t z = 0; z < 4; z++) {
    ret += script_group_bytes({});
  }
  ret += script_group_bytes({script_record_bytes(4, 0x44, 8, 4)});
  return ret;
}

struct SaveHeaderFields {
  std::string player_name = "Chosen One";
  std::string save_name = "Before the Temple";
  uint16_t save_day = 17;
  uint16_t save_month = 10;
  uint16_t save_year = 2026;
  uint32_t ingame_time = 0x0000ABCD;
  uint16_t ingame_month = 7;
  uint16_t ingame_day = 25;
  uint16_t ingame_year = 2241;
  uint32_t ingame_ticks = 0x00123456;
  uint32_t current_map = 0;
  std::string map_name = "ARTEMPLE.SAV";
};

inline std::string save_header_bytes(const SaveHeaderFields& fields) {
  phosg::StringWriter w;
  w.write("FALLOUT SAVE FILE", 17);
  w.put_u8(0);
  w.write(std::string("\x00\x00\x01\x02\x00\x00", 6));
  w.put_u32b(0x00010002);
  w.put_u8('R');
  w.write(fields.player_name);
  w.write(std::string(FalloutDASM::SAVE_PLAYER_NAME_SIZE - fields.player_name.size(), '\0'));
  w.write(fields.save_name);
  w.write(std::string(FalloutDASM::SAVE_NAME_SIZE - fields.save_name.size(), '\0'));
  w.put_u16b(fields.save_day);
  w.put_u16b(fields.save_month);
  w.put_u16b(fields.save_year);
  w.put_u32b(fields.ingame_time);
  w.put_u16b(fields.ingame_month);
  w.put_u16b(fields.ingame_day);
  w.put_u16b(fields.ingame_year);
  w.put_u32b(fields.ingame_ticks);
  w.put_u32b(fields.current_map);
  w.write(fields.map_name);
  w.write(std::string(FalloutDASM::SAVE_MAP_NAME_SIZE - fields.map_name.size(), '\0'));
  for (size_t z = 0; z < FalloutDASM::SAVE_THUMBNAIL_SIZE; z++) {
    w.put_u8((z % 229) & 0xFF);
  }
  w.write(std::string(FalloutDASM::SAVE_VOID_SIZE, '\0'));
  return std::move(w.str());
}

} // namespace Fixtures
