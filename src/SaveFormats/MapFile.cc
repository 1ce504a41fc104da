#include "MapFile.hh"

#include <stdio.h>

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>
#include <string>
#include <vector>

#include "AsciiField.hh"
#include "Cursor.hh"
#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace FalloutDASM {

const char* name_for_map_version(MapVersion version) {
  switch (version) {
    case MapVersion::FALLOUT_1:
      return "Fallout 1";
    case MapVersion::FALLOUT_2:
      return "Fallout 2";
  }
  return "unknown";
}

////////////////////////////////////////////////////////////////////////////////
// Header

static MapVersion decode_map_version(StringReader& r) {
  size_t offset = r.where();
  uint32_t version = read_u32b(r, "map version");
  switch (version) {
    case static_cast<uint32_t>(MapVersion::FALLOUT_1):
    case static_cast<uint32_t>(MapVersion::FALLOUT_2):
      return static_cast<MapVersion>(version);
    default:
      throw DecodeError(DecodeError::Type::INVALID_VERSION, offset,
          std::format("map version {} is not 19 (Fallout 1) or 20 (Fallout 2)", version));
  }
}

MapHeader decode_map_header(StringReader& r) {
  MapHeader ret;
  ret.version = decode_map_version(r);
  ret.filename = decode_ascii(r, MAP_FILENAME_SIZE, &ret.filename_field);
  ret.default_player_position = read_s32b(r, "default player position");
  ret.default_player_elevation = read_s32b(r, "default player elevation");
  ret.default_player_orientation = read_s32b(r, "default player orientation");
  ret.local_variable_count = read_s32b(r, "local variable count");
  ret.script_id = read_s32b(r, "map script id");
  ret.flags = decode_map_flags(read_u32b(r, "map flags"));
  ret.darkness = read_s32b(r, "darkness");
  ret.global_variable_count = read_s32b(r, "global variable count");
  ret.id = read_s32b(r, "map id");
  ret.ticks = read_u32b(r, "ticks");
  ret.mystery_bytes = read_opaque(r, MAP_MYSTERY_BYTES_SIZE, "map header unknown fields");
  return ret;
}

void encode_map_header(StringWriter& w, const MapHeader& header) {
  size_t start_size = w.size();
  w.put_u32b(static_cast<uint32_t>(header.version));
  encode_ascii(w, header.filename, MAP_FILENAME_SIZE, header.filename_field);
  w.put_u32b(header.default_player_position);
  w.put_u32b(header.default_player_elevation);
  w.put_u32b(header.default_player_orientation);
  w.put_u32b(header.local_variable_count);
  w.put_u32b(header.script_id);
  w.put_u32b(encode_map_flags(header.flags));
  w.put_u32b(header.darkness);
  w.put_u32b(header.global_variable_count);
  w.put_u32b(header.id);
  w.put_u32b(header.ticks);
  write_opaque(w, header.mystery_bytes, MAP_MYSTERY_BYTES_SIZE, "map header unknown fields");
  if (w.size() - start_size != MAP_HEADER_SIZE) {
    throw logic_error("map header encoded to incorrect size");
  }
}

void MapHeader::print(FILE* stream) const {
  fwrite_fmt(stream, "Map header\n");
  fwrite_fmt(stream, "  version: {} ({})\n", static_cast<uint32_t>(this->version),
      name_for_map_version(this->version));
  fwrite_fmt(stream, "  filename: {}\n", this->filename);
  fwrite_fmt(stream, "  default player position: {} (elevation {}, orientation {})\n",
      this->default_player_position, this->default_player_elevation,
      this->default_player_orientation);
  fwrite_fmt(stream, "  script id: {}\n", this->script_id);
  fwrite_fmt(stream, "  flags: {}\n", this->flags.str());
  fwrite_fmt(stream, "  darkness: {}\n", this->darkness);
  fwrite_fmt(stream, "  global variables: {}\n", this->global_variable_count);
  fwrite_fmt(stream, "  local variables: {}\n", this->local_variable_count);
  fwrite_fmt(stream, "  map id: {}\n", this->id);
  fwrite_fmt(stream, "  ticks: {}\n", this->ticks);
  string mystery_str = format_data_string(this->mystery_bytes);
  fwrite_fmt(stream, "  unknown_a1: {}\n", mystery_str);
}

////////////////////////////////////////////////////////////////////////////////
// Variables

MapVariables decode_map_variables(StringReader& r, size_t global_count, size_t local_count) {
  if ((global_count > r.remaining() / 4) ||
      (local_count > r.remaining() / 4) ||
      (global_count + local_count > r.remaining() / 4)) {
    throw DecodeError(DecodeError::Type::INSUFFICIENT_DATA, r.where(), std::format(
        "variable tables need {} values, but only {} bytes remain",
        global_count + local_count, r.remaining()));
  }

  MapVariables ret;
  ret.global_variables.reserve(global_count);
  for (size_t z = 0; z < global_count; z++) {
    ret.global_variables.emplace_back(r.get_s32b());
  }
  ret.local_variables.reserve(local_count);
  for (size_t z = 0; z < local_count; z++) {
    ret.local_variables.emplace_back(r.get_s32b());
  }
  return ret;
}

void encode_map_variables(StringWriter& w, const MapVariables& variables) {
  for (int32_t v : variables.global_variables) {
    w.put_u32b(v);
  }
  for (int32_t v : variables.local_variables) {
    w.put_u32b(v);
  }
}

void MapVariables::print(FILE* stream) const {
  fwrite_fmt(stream, "Global variables ({})\n", this->global_variables.size());
  for (size_t z = 0; z < this->global_variables.size(); z++) {
    fwrite_fmt(stream, "  [{:4}] {} ({:08X})\n", z, this->global_variables[z],
        static_cast<uint32_t>(this->global_variables[z]));
  }
  fwrite_fmt(stream, "Local variables ({})\n", this->local_variables.size());
  for (size_t z = 0; z < this->local_variables.size(); z++) {
    fwrite_fmt(stream, "  [{:4}] {} ({:08X})\n", z, this->local_variables[z],
        static_cast<uint32_t>(this->local_variables[z]));
  }
}

////////////////////////////////////////////////////////////////////////////////
// Tiles

size_t tile_block_size(const MapFlags& flags) {
  size_t ret = 0;
  for (size_t level = 0; level < MAP_ELEVATION_COUNT; level++) {
    if (flags.has_elevation(level)) {
      ret += TILE_BLOCK_SIZE_PER_ELEVATION;
    }
  }
  return ret;
}

string skip_tile_block(StringReader& r, const MapFlags& flags) {
  return read_opaque(r, tile_block_size(flags), "tile block");
}

////////////////////////////////////////////////////////////////////////////////
// Whole map

vector<Script> DecodedMap::scripts() const {
  vector<Script> ret;
  for (const auto& group : this->script_groups) {
    ret.insert(ret.end(), group.scripts.begin(), group.scripts.end());
  }
  return ret;
}

const Script* DecodedMap::find_script(int32_t id) const {
  for (const auto& group : this->script_groups) {
    for (const auto& script : group.scripts) {
      if (script.id == id) {
        return &script;
      }
    }
  }
  return nullptr;
}

static void check_local_variable_ranges(const DecodedMap& map, size_t header_offset,
    const DecodeOptions& opts, PrefixedLogger& log) {
  size_t local_count = map.variables.local_variables.size();
  for (const auto& group : map.script_groups) {
    for (const auto& script : group.scripts) {
      if (script.local_variable_offset < 0 || script.local_variable_count <= 0) {
        continue;
      }
      size_t end = static_cast<size_t>(script.local_variable_offset) + script.local_variable_count;
      if (end <= local_count) {
        continue;
      }
      size_t range_offset = header_offset + MAP_GLOBAL_VARIABLE_TABLE_OFFSET +
          map.variables.global_variables.size() * 4 +
          static_cast<size_t>(script.local_variable_offset) * 4;
      string message = std::format(
          "script {:08X} uses local variables [{}, {}), but there are only {}",
          static_cast<uint32_t>(script.id), script.local_variable_offset, end, local_count);
      if (opts.strict_local_variable_ranges) {
        throw DecodeError(DecodeError::Type::INVALID_VARIABLE_RANGE, range_offset, message);
      }
      log.warning_f("{}", message);
    }
  }
}

DecodedMap decode_map(StringReader& r, const DecodeOptions& opts) {
  PrefixedLogger log("[MapDecoder] ", opts.log_level);

  DecodedMap ret;
  size_t header_offset = r.where();
  ret.header = decode_map_header(r);
  log.debug_f("Map {} ({}): flags {}, {} global variables, {} local variables",
      ret.header.filename, name_for_map_version(ret.header.version), ret.header.flags.str(),
      ret.header.global_variable_count, ret.header.local_variable_count);

  size_t global_count = check_count(ret.header.global_variable_count,
      header_offset + 0x30, "global variable count");
  size_t local_count = check_count(ret.header.local_variable_count,
      header_offset + 0x20, "local variable count");
  ret.variables = decode_map_variables(r, global_count, local_count);
  log.debug_f("Variable tables end at {:X}", r.where());

  ret.tile_data = skip_tile_block(r, ret.header.flags);
  log.debug_f("Skipped {} bytes of tiles; scripts begin at {:X}", ret.tile_data.size(), r.where());

  for (size_t z = 0; z < SCRIPT_GROUP_COUNT; z++) {
    ret.script_groups[z] = decode_script_group(r, &log);
  }

  ret.trailing_data = r.read(r.remaining());
  log.debug_f("{} bytes follow the script groups", ret.trailing_data.size());

  check_local_variable_ranges(ret, header_offset, opts, log);
  return ret;
}

DecodedMap decode_map(const void* data, size_t size, const DecodeOptions& opts) {
  StringReader r(data, size);
  return decode_map(r, opts);
}

DecodedMap decode_map(const string& data, const DecodeOptions& opts) {
  return decode_map(data.data(), data.size(), opts);
}

string encode_map(const DecodedMap& map) {
  const auto& header = map.header;
  if (header.global_variable_count < 0 || header.local_variable_count < 0) {
    throw EncodeError(EncodeError::Type::NEGATIVE_COUNT, "map header has a negative variable count");
  }
  if (static_cast<size_t>(header.global_variable_count) != map.variables.global_variables.size()) {
    throw EncodeError(EncodeError::Type::COUNT_MISMATCH, std::format(
        "header declares {} global variables, but there are {}",
        header.global_variable_count, map.variables.global_variables.size()));
  }
  if (static_cast<size_t>(header.local_variable_count) != map.variables.local_variables.size()) {
    throw EncodeError(EncodeError::Type::COUNT_MISMATCH, std::format(
        "header declares {} local variables, but there are {}",
        header.local_variable_count, map.variables.local_variables.size()));
  }

  StringWriter w;
  encode_map_header(w, header);
  encode_map_variables(w, map.variables);
  write_opaque(w, map.tile_data, tile_block_size(header.flags), "tile block");
  for (const auto& group : map.script_groups) {
    encode_script_group(w, group);
  }
  w.write(map.trailing_data);
  return std::move(w.str());
}

} // namespace FalloutDASM
