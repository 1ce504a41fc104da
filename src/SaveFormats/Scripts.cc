#include "Scripts.hh"

#include <stdio.h>

#include <algorithm>
#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>
#include <vector>

#include "Cursor.hh"
#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace FalloutDASM {

const char* name_for_script_tag_type(ScriptTagType type) {
  switch (type) {
    case ScriptTagType::SYSTEM:
      return "system";
    case ScriptTagType::SPATIAL:
      return "spatial";
    case ScriptTagType::ITEMS:
      return "items";
    case ScriptTagType::SCENERY:
      return "scenery";
    case ScriptTagType::CRITTERS:
      return "critters";
    default:
      return "unknown";
  }
}

ScriptTagType script_tag_type_for_word(uint32_t tag_word) {
  switch (tag_word >> 24) {
    case 0x00:
      return ScriptTagType::SYSTEM;
    case 0x01:
      return ScriptTagType::SPATIAL;
    case 0x02:
      return ScriptTagType::ITEMS;
    case 0x03:
      return ScriptTagType::SCENERY;
    case 0x04:
      return ScriptTagType::CRITTERS;
    default:
      return ScriptTagType::UNKNOWN;
  }
}

ScriptTagType decode_script_tag(StringReader& r, uint32_t* tag_word) {
  uint32_t word = read_u32b(r, "script tag");
  if (tag_word) {
    *tag_word = word;
  }
  return script_tag_type_for_word(word);
}

bool script_tag_has_known_record_size(ScriptTagType type) {
  switch (type) {
    case ScriptTagType::SPATIAL:
    case ScriptTagType::ITEMS:
    case ScriptTagType::SCENERY:
    case ScriptTagType::CRITTERS:
      return true;
    default:
      return false;
  }
}

uint32_t record_size_for_script_tag(ScriptTagType type, size_t error_offset) {
  switch (type) {
    case ScriptTagType::SPATIAL:
      return 72;
    case ScriptTagType::ITEMS:
      return 68;
    case ScriptTagType::SCENERY:
    case ScriptTagType::CRITTERS:
      return 64;
    default:
      throw DecodeError(DecodeError::Type::UNKNOWN_RECORD_SIZE, error_offset,
          std::format("size is not known for scripts of type {}", name_for_script_tag_type(type)));
  }
}

uint32_t junk_size_for_script_tag(ScriptTagType type) {
  switch (type) {
    case ScriptTagType::SPATIAL:
      return 72;
    case ScriptTagType::ITEMS:
      return 68;
    default:
      return 64;
  }
}

////////////////////////////////////////////////////////////////////////////////
// Script records

Script Script::make(ScriptTagType type, int32_t id, int32_t local_variable_offset,
    int32_t local_variable_count) {
  Script ret;
  ret.tag_word = static_cast<uint32_t>(type) << 24;
  ret.script_type = type;
  ret.prefix_junk.assign(record_size_for_script_tag(type) - SCRIPT_FIELDS_OFFSET_FROM_END, '\0');
  ret.id = id;
  ret.unknown_a1.assign(SCRIPT_UNKNOWN_A1_SIZE, '\0');
  ret.local_variable_offset = local_variable_offset;
  ret.local_variable_count = local_variable_count;
  ret.suffix_junk.assign(SCRIPT_SUFFIX_SIZE, '\0');
  return ret;
}

uint32_t Script::record_size() const {
  return record_size_for_script_tag(this->script_type);
}

bool Script::has_local_variables() const {
  return (this->local_variable_offset >= 0) && (this->local_variable_count > 0);
}

void Script::print(FILE* stream) const {
  fwrite_fmt(stream, "id={:08X} type={} tag={:08X}", static_cast<uint32_t>(this->id),
      name_for_script_tag_type(this->script_type), this->tag_word);
  if (this->local_variable_offset < 0) {
    fwrite_fmt(stream, " vars=none");
  } else {
    fwrite_fmt(stream, " vars=[{}, {})", this->local_variable_offset,
        static_cast<int64_t>(this->local_variable_offset) + this->local_variable_count);
  }
  fputc('\n', stream);
}

Script decode_script(StringReader& r) {
  size_t start_offset = r.where();

  Script ret;
  ret.script_type = decode_script_tag(r, &ret.tag_word);
  uint32_t record_size = record_size_for_script_tag(ret.script_type, start_offset);
  require_available(r, record_size - 4, "script record");

  ret.prefix_junk = r.read(record_size - SCRIPT_FIELDS_OFFSET_FROM_END);
  ret.id = r.get_s32b();
  ret.unknown_a1 = r.read(SCRIPT_UNKNOWN_A1_SIZE);
  ret.local_variable_offset = r.get_s32b();
  ret.local_variable_count = r.get_s32b();
  ret.suffix_junk = r.read(SCRIPT_SUFFIX_SIZE);

  if (r.where() - start_offset != record_size) {
    throw logic_error("script record decoded to incorrect size");
  }
  return ret;
}

void encode_script(StringWriter& w, const Script& script) {
  if (script_tag_type_for_word(script.tag_word) != script.script_type) {
    throw EncodeError(EncodeError::Type::TAG_MISMATCH, std::format(
        "script {:08X} has type {} but its tag word is {:08X}",
        static_cast<uint32_t>(script.id), name_for_script_tag_type(script.script_type), script.tag_word));
  }
  if (!script_tag_has_known_record_size(script.script_type)) {
    throw EncodeError(EncodeError::Type::INVALID_BLOCK_SIZE, std::format(
        "script {:08X} has type {}, which has no known record size",
        static_cast<uint32_t>(script.id), name_for_script_tag_type(script.script_type)));
  }
  uint32_t record_size = record_size_for_script_tag(script.script_type);

  size_t start_size = w.size();
  w.put_u32b(script.tag_word);
  write_opaque(w, script.prefix_junk, record_size - SCRIPT_FIELDS_OFFSET_FROM_END, "script prefix");
  w.put_u32b(static_cast<uint32_t>(script.id));
  write_opaque(w, script.unknown_a1, SCRIPT_UNKNOWN_A1_SIZE, "script unknown_a1");
  w.put_u32b(static_cast<uint32_t>(script.local_variable_offset));
  w.put_u32b(static_cast<uint32_t>(script.local_variable_count));
  write_opaque(w, script.suffix_junk, SCRIPT_SUFFIX_SIZE, "script suffix");

  if (w.size() - start_size != record_size) {
    throw logic_error("script record encoded to incorrect size");
  }
}

void print_scripts(FILE* stream, const vector<Script>& scripts) {
  fwrite_fmt(stream, "{} scripts\n", scripts.size());
  for (size_t z = 0; z < scripts.size(); z++) {
    fwrite_fmt(stream, "  [{:3}] ", z);
    scripts[z].print(stream);
  }
}

////////////////////////////////////////////////////////////////////////////////
// Script groups

size_t batch_footer_count_for_script_count(size_t script_count) {
  return (script_count + SCRIPTS_PER_BATCH - 1) / SCRIPTS_PER_BATCH;
}

size_t padding_slot_count_for_script_count(size_t script_count) {
  size_t tail = script_count % SCRIPTS_PER_BATCH;
  return tail ? (SCRIPTS_PER_BATCH - tail) : 0;
}

ScriptGroup decode_script_group(StringReader& r, PrefixedLogger* log) {
  size_t group_offset = r.where();
  size_t script_count = read_count(r, "script count");
  if (log) {
    log->debug_f("Script group at {:X} declares {} scripts", group_offset, script_count);
  }

  ScriptGroup ret;
  while (script_count > SCRIPTS_PER_BATCH) {
    for (size_t z = 0; z < SCRIPTS_PER_BATCH; z++) {
      ret.scripts.emplace_back(decode_script(r));
    }
    // Footer contents (script check counter and possibly a checksum) aren't
    // interpreted
    ret.batch_footers.emplace_back(read_opaque(r, SCRIPT_BATCH_FOOTER_SIZE, "script batch footer"));
    script_count -= SCRIPTS_PER_BATCH;
  }

  for (size_t z = 0; z < script_count; z++) {
    ret.scripts.emplace_back(decode_script(r));
  }

  if (script_count > 0) {
    size_t padding_count = SCRIPTS_PER_BATCH - script_count;
    for (size_t z = 0; z < padding_count; z++) {
      size_t slot_offset = r.where();
      ScriptTagType type = decode_script_tag(r);
      // The tag word counts toward the junk size and was already read
      skip_opaque(r, junk_size_for_script_tag(type) - 4, "script padding slot");
      ret.padding_slots.emplace_back(r.pread(slot_offset, r.where() - slot_offset));
    }
    ret.batch_footers.emplace_back(read_opaque(r, SCRIPT_BATCH_FOOTER_SIZE, "script batch footer"));
    if (log) {
      log->debug_f("Skipped {} padding slots", padding_count);
    }
  }

  if (log) {
    log->debug_f("Script group ends at {:X} ({} scripts, {} footers)",
        r.where(), ret.scripts.size(), ret.batch_footers.size());
  }
  return ret;
}

static void write_padding_slot(StringWriter& w, const string& slot) {
  if (slot.size() < 4) {
    throw EncodeError(EncodeError::Type::INVALID_BLOCK_SIZE, "script padding slot is too short");
  }
  StringReader slot_r(slot.data(), slot.size());
  uint32_t expected_size = junk_size_for_script_tag(decode_script_tag(slot_r));
  write_opaque(w, slot, expected_size, "script padding slot");
}

void encode_script_group(StringWriter& w, const ScriptGroup& group) {
  size_t script_count = group.scripts.size();
  if (script_count > 0x7FFFFFFF) {
    throw EncodeError(EncodeError::Type::COUNT_MISMATCH, "too many scripts in group");
  }

  size_t footer_count = batch_footer_count_for_script_count(script_count);
  size_t padding_count = padding_slot_count_for_script_count(script_count);
  bool generate_footers = group.batch_footers.empty();
  bool generate_padding = group.padding_slots.empty();
  if (!generate_footers && (group.batch_footers.size() != footer_count)) {
    throw EncodeError(EncodeError::Type::COUNT_MISMATCH, std::format(
        "group of {} scripts needs {} batch footers, but has {}",
        script_count, footer_count, group.batch_footers.size()));
  }
  if (!generate_padding && (group.padding_slots.size() != padding_count)) {
    throw EncodeError(EncodeError::Type::COUNT_MISMATCH, std::format(
        "group of {} scripts needs {} padding slots, but has {}",
        script_count, padding_count, group.padding_slots.size()));
  }

  w.put_u32b(script_count);
  size_t batch_index = 0;
  for (size_t batch_start = 0; batch_start < script_count; batch_start += SCRIPTS_PER_BATCH) {
    size_t batch_end = min<size_t>(batch_start + SCRIPTS_PER_BATCH, script_count);
    for (size_t z = batch_start; z < batch_end; z++) {
      encode_script(w, group.scripts[z]);
    }

    if (batch_end - batch_start < SCRIPTS_PER_BATCH) {
      for (size_t z = 0; z < padding_count; z++) {
        if (generate_padding) {
          w.write(string(junk_size_for_script_tag(ScriptTagType::SYSTEM), '\0'));
        } else {
          write_padding_slot(w, group.padding_slots[z]);
        }
      }
    }

    if (generate_footers) {
      w.put_u32b(batch_end - batch_start);
      w.put_u32b(0);
    } else {
      write_opaque(w, group.batch_footers[batch_index], SCRIPT_BATCH_FOOTER_SIZE, "script batch footer");
    }
    batch_index++;
  }
}

} // namespace FalloutDASM
