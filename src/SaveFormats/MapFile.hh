#pragma once

#include <stdint.h>
#include <stdio.h>

#include <array>
#include <phosg/Strings.hh>
#include <string>
#include <vector>

#include "MapFlags.hh"
#include "Scripts.hh"

namespace FalloutDASM {

// Per-map state files (maps/*.SAV inside a save slot, and the .MAP files they
// are derived from) contain, in order:
//   MapHeader (0xEC bytes)
//   be_int32_t global_variables[header.global_variable_count]
//   be_int32_t local_variables[header.local_variable_count]
//   Tile block (see tile_block_size)
//   5 script groups (see ScriptGroup)
//   Objects and everything else (not interpreted here)

enum class MapVersion : uint32_t {
  FALLOUT_1 = 19,
  FALLOUT_2 = 20,
};

const char* name_for_map_version(MapVersion version);

constexpr size_t MAP_HEADER_SIZE = 0xEC;
constexpr size_t MAP_FILENAME_SIZE = 0x10;
constexpr size_t MAP_MYSTERY_BYTES_SIZE = 44 * 4;
constexpr size_t MAP_GLOBAL_VARIABLE_TABLE_OFFSET = MAP_HEADER_SIZE;

struct MapHeader {
  /* 0000 */ MapVersion version = MapVersion::FALLOUT_2;
  /* 0004 */ std::string filename; // char[0x10]
  /* 0014 */ int32_t default_player_position = 0;
  /* 0018 */ int32_t default_player_elevation = 0;
  /* 001C */ int32_t default_player_orientation = 0;
  /* 0020 */ int32_t local_variable_count = 0;
  /* 0024 */ int32_t script_id = -1;
  /* 0028 */ MapFlags flags; // Elevation bits are inverted on disk
  /* 002C */ int32_t darkness = 0;
  /* 0030 */ int32_t global_variable_count = 0;
  /* 0034 */ int32_t id = 0;
  /* 0038 */ uint32_t ticks = 0;
  /* 003C */ std::string mystery_bytes; // 0xB0 bytes; not documented anywhere
  /* 00EC */

  // Raw bytes of the filename field as decoded. encode_map_header writes these
  // back if filename hasn't been changed, so padding after the NUL survives.
  std::string filename_field;

  void print(FILE* stream) const;
};

MapHeader decode_map_header(phosg::StringReader& r);
void encode_map_header(phosg::StringWriter& w, const MapHeader& header);

struct MapVariables {
  // Indexes are the in-game variable slots. Scripts refer to ranges of
  // local_variables by offset and count.
  std::vector<int32_t> global_variables;
  std::vector<int32_t> local_variables;

  void print(FILE* stream) const;
};

MapVariables decode_map_variables(phosg::StringReader& r, size_t global_count, size_t local_count);
void encode_map_variables(phosg::StringWriter& w, const MapVariables& variables);

// Each elevation that is present has a 100x100 grid of floor and roof tiles.
// Tiles are documented as 2 bytes each, but real save files only stay aligned
// if they're treated as 4 bytes each.
constexpr size_t MAP_ELEVATION_COUNT = 3;
constexpr size_t TILE_BLOCK_SIZE_PER_ELEVATION = 100 * 100 * 2 * 2;

size_t tile_block_size(const MapFlags& flags);
// Consumes the tile block and returns it uninterpreted
std::string skip_tile_block(phosg::StringReader& r, const MapFlags& flags);

struct DecodeOptions {
  phosg::LogLevel log_level = phosg::LogLevel::L_WARNING;
  // If true, a script whose local variable range extends past the end of the
  // local variable table is an error instead of a warning
  bool strict_local_variable_ranges = false;
};

struct DecodedMap {
  MapHeader header;
  MapVariables variables;
  std::string tile_data;
  std::array<ScriptGroup, SCRIPT_GROUP_COUNT> script_groups;
  // Everything after the last script group
  std::string trailing_data;

  // All scripts from all groups, in group order
  std::vector<Script> scripts() const;
  const Script* find_script(int32_t id) const;
};

DecodedMap decode_map(phosg::StringReader& r, const DecodeOptions& opts = DecodeOptions());
DecodedMap decode_map(const void* data, size_t size, const DecodeOptions& opts = DecodeOptions());
DecodedMap decode_map(const std::string& data, const DecodeOptions& opts = DecodeOptions());

std::string encode_map(const DecodedMap& map);

} // namespace FalloutDASM
