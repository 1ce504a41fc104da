#include "SaveHeader.hh"

#include <stdio.h>

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>
#include <string>

#include "AsciiField.hh"
#include "Cursor.hh"
#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace FalloutDASM {

const string SAVE_FILE_SIGNATURE("FALLOUT SAVE FILE\0", SAVE_SIGNATURE_SIZE);

SaveHeader decode_save_header(StringReader& r, const DecodeOptions& opts) {
  PrefixedLogger log("[SaveHeader] ", opts.log_level);

  size_t start_offset = r.where();
  require_available(r, SAVE_SIGNATURE_SIZE, "save file signature");
  string signature = r.pread(start_offset, SAVE_SIGNATURE_SIZE);
  if (signature != SAVE_FILE_SIGNATURE) {
    throw DecodeError(DecodeError::Type::MAGIC_MISMATCH, start_offset, std::format(
        "expected save file signature, found {}", format_data_string(signature)));
  }

  SaveHeader ret;
  ret.magic = decode_ascii(r, SAVE_SIGNATURE_SIZE);
  ret.signature_padding = read_opaque(r, SAVE_SIGNATURE_PADDING_SIZE, "signature padding");
  ret.version = read_u32b(r, "save version");
  ret.release_type = read_u8(r, "release type");
  ret.name = decode_ascii(r, SAVE_PLAYER_NAME_SIZE, &ret.name_field);
  ret.save_name = decode_ascii(r, SAVE_NAME_SIZE, &ret.save_name_field);
  ret.save_day = read_u16b(r, "save day");
  ret.save_month = read_u16b(r, "save month");
  ret.save_year = read_u16b(r, "save year");
  ret.ingame_time = read_u32b(r, "in-game time");
  ret.ingame_month = read_u16b(r, "in-game month");
  ret.ingame_day = read_u16b(r, "in-game day");
  ret.ingame_year = read_u16b(r, "in-game year");
  ret.ingame_ticks = read_u32b(r, "in-game ticks");
  ret.current_map = read_u32b(r, "current map");
  ret.map_name = decode_ascii(r, SAVE_MAP_NAME_SIZE, &ret.map_name_field);
  ret.bitmap = read_opaque(r, SAVE_THUMBNAIL_SIZE, "thumbnail");
  ret.void_data = read_opaque(r, SAVE_VOID_SIZE, "unused header data");

  log.debug_f("Save \"{}\" by {} on map {} (header ends at {:X})",
      ret.save_name, ret.name, ret.map_name, r.where());
  return ret;
}

SaveHeader decode_save_header(const string& data, const DecodeOptions& opts) {
  StringReader r(data.data(), data.size());
  return decode_save_header(r, opts);
}

void encode_save_header(StringWriter& w, const SaveHeader& header) {
  size_t start_size = w.size();
  w.write(SAVE_FILE_SIGNATURE);
  write_opaque(w, header.signature_padding, SAVE_SIGNATURE_PADDING_SIZE, "signature padding");
  w.put_u32b(header.version);
  w.put_u8(header.release_type);
  encode_ascii(w, header.name, SAVE_PLAYER_NAME_SIZE, header.name_field);
  encode_ascii(w, header.save_name, SAVE_NAME_SIZE, header.save_name_field);
  w.put_u16b(header.save_day);
  w.put_u16b(header.save_month);
  w.put_u16b(header.save_year);
  w.put_u32b(header.ingame_time);
  w.put_u16b(header.ingame_month);
  w.put_u16b(header.ingame_day);
  w.put_u16b(header.ingame_year);
  w.put_u32b(header.ingame_ticks);
  w.put_u32b(header.current_map);
  encode_ascii(w, header.map_name, SAVE_MAP_NAME_SIZE, header.map_name_field);
  write_opaque(w, header.bitmap, SAVE_THUMBNAIL_SIZE, "thumbnail");
  write_opaque(w, header.void_data, SAVE_VOID_SIZE, "unused header data");
  if (w.size() - start_size != SAVE_HEADER_SIZE) {
    throw logic_error("save header encoded to incorrect size");
  }
}

string encode_save_header(const SaveHeader& header) {
  StringWriter w;
  encode_save_header(w, header);
  return std::move(w.str());
}

void SaveHeader::print(FILE* stream) const {
  fwrite_fmt(stream, "Save header\n");
  fwrite_fmt(stream, "  signature: {}\n", this->magic);
  fwrite_fmt(stream, "  version: {}.{}\n", this->version >> 16, this->version & 0xFFFF);
  if (this->release_type >= 0x20 && this->release_type < 0x7F) {
    fwrite_fmt(stream, "  release type: {}\n", static_cast<char>(this->release_type));
  } else {
    fwrite_fmt(stream, "  release type: {:02X}\n", this->release_type);
  }
  fwrite_fmt(stream, "  player name: {}\n", this->name);
  fwrite_fmt(stream, "  save name: {}\n", this->save_name);
  fwrite_fmt(stream, "  saved on: {:04}-{:02}-{:02}\n", this->save_year, this->save_month, this->save_day);
  fwrite_fmt(stream, "  in-game date: {:04}-{:02}-{:02} (time {}, ticks {})\n",
      this->ingame_year, this->ingame_month, this->ingame_day, this->ingame_time, this->ingame_ticks);
  fwrite_fmt(stream, "  current map: {} ({})\n", this->current_map, this->map_name);
}

} // namespace FalloutDASM
