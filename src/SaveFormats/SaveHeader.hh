#pragma once

#include <stdint.h>
#include <stdio.h>

#include <phosg/Strings.hh>
#include <string>

#include "MapFile.hh"

namespace FalloutDASM {

// SAVE.DAT begins with this 18-byte signature (the NUL is part of it)
extern const std::string SAVE_FILE_SIGNATURE;

constexpr size_t SAVE_SIGNATURE_SIZE = 0x12;
constexpr size_t SAVE_SIGNATURE_PADDING_SIZE = 6;
constexpr size_t SAVE_PLAYER_NAME_SIZE = 0x20;
constexpr size_t SAVE_NAME_SIZE = 0x1E;
constexpr size_t SAVE_MAP_NAME_SIZE = 0x10;
constexpr size_t SAVE_THUMBNAIL_WIDTH = 224;
constexpr size_t SAVE_THUMBNAIL_HEIGHT = 133;
constexpr size_t SAVE_THUMBNAIL_SIZE = SAVE_THUMBNAIL_WIDTH * SAVE_THUMBNAIL_HEIGHT;
constexpr size_t SAVE_VOID_SIZE = 0x80;
constexpr size_t SAVE_HEADER_SIZE = 0x7563;

// The fixed preamble of SAVE.DAT. The rest of the file (function blocks for
// player stats, inventory, etc.) is not handled here; per-map state lives in
// separate gzip-compressed files in the same save slot directory.
struct SaveHeader {
  /* 0000 */ std::string magic; // "FALLOUT SAVE FILE"
  /* 0012 */ std::string signature_padding; // 6 bytes, not interpreted
  /* 0018 */ uint32_t version = 0; // High 16 bits = major, low 16 bits = minor
  /* 001C */ uint8_t release_type = 0; // 'R'
  /* 001D */ std::string name; // char[0x20]
  /* 003D */ std::string save_name; // char[0x1E]
  /* 005B */ uint16_t save_day = 0;
  /* 005D */ uint16_t save_month = 0;
  /* 005F */ uint16_t save_year = 0;
  /* 0061 */ uint32_t ingame_time = 0;
  /* 0065 */ uint16_t ingame_month = 0;
  /* 0067 */ uint16_t ingame_day = 0;
  /* 0069 */ uint16_t ingame_year = 0;
  /* 006B */ uint32_t ingame_ticks = 0;
  /* 006F */ uint32_t current_map = 0;
  /* 0073 */ std::string map_name; // char[0x10], e.g. "NCRENT.sav"
  /* 0083 */ std::string bitmap; // 224x133 8-bit paletted thumbnail
  /* 74E3 */ std::string void_data; // 0x80 bytes, unused
  /* 7563 */

  // Raw bytes of the text fields as decoded (see MapHeader::filename_field)
  std::string name_field;
  std::string save_name_field;
  std::string map_name_field;

  void print(FILE* stream) const;
};

// Checks the signature before consuming anything; on mismatch this raises
// DecodeError(MAGIC_MISMATCH) and leaves the reader where it was.
SaveHeader decode_save_header(phosg::StringReader& r, const DecodeOptions& opts = DecodeOptions());
SaveHeader decode_save_header(const std::string& data, const DecodeOptions& opts = DecodeOptions());

void encode_save_header(phosg::StringWriter& w, const SaveHeader& header);
std::string encode_save_header(const SaveHeader& header);

} // namespace FalloutDASM
