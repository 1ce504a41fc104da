#pragma once

#include <stdint.h>
#include <stdio.h>

#include <phosg/Strings.hh>
#include <string>
#include <vector>

namespace FalloutDASM {

// The top byte of a script record's tag word selects the record's variant (and
// thus its size). Decoding a tag never fails: any value without a name becomes
// UNKNOWN.
enum class ScriptTagType : uint8_t {
  SYSTEM = 0x00,
  SPATIAL = 0x01,
  ITEMS = 0x02,
  SCENERY = 0x03,
  CRITTERS = 0x04,
  UNKNOWN = 0xFF,
};

const char* name_for_script_tag_type(ScriptTagType type);
ScriptTagType script_tag_type_for_word(uint32_t tag_word);

// Reads the 4-byte tag word. If tag_word is not null, the raw word is written
// there (the low 24 bits are part of the record and must be preserved).
ScriptTagType decode_script_tag(phosg::StringReader& r, uint32_t* tag_word = nullptr);

// Size of a real script record, tag word included. There is no known size for
// SYSTEM or UNKNOWN records; for those this raises
// DecodeError(UNKNOWN_RECORD_SIZE) reporting error_offset.
uint32_t record_size_for_script_tag(ScriptTagType type, size_t error_offset = 0);
bool script_tag_has_known_record_size(ScriptTagType type);

// Size of an unused padding slot, tag word included. Unlike
// record_size_for_script_tag, this assumes 64 bytes for anything that isn't
// SPATIAL or ITEMS.
uint32_t junk_size_for_script_tag(ScriptTagType type);

constexpr size_t SCRIPT_GROUP_COUNT = 5;
constexpr size_t SCRIPTS_PER_BATCH = 16;
constexpr size_t SCRIPT_BATCH_FOOTER_SIZE = 8;
// The interpreted fields start this many bytes before the end of the record
constexpr size_t SCRIPT_FIELDS_OFFSET_FROM_END = 0x38;
constexpr size_t SCRIPT_UNKNOWN_A1_SIZE = 8;
constexpr size_t SCRIPT_SUFFIX_SIZE = 0x20;

// One script record. Layout (RS = record size: 0x48 for spatial, 0x44 for
// items, 0x40 for scenery and critters):
//   0000          be_uint32_t tag_word
//   0004          uint8_t prefix_junk[RS - 0x38] (pid, next script, trigger
//                 type, radius, etc.; not interpreted)
//   RS-0x34       be_int32_t id
//   RS-0x30       uint8_t unknown_a1[8]
//   RS-0x28       be_int32_t local_variable_offset
//   RS-0x24       be_int32_t local_variable_count
//   RS-0x20       uint8_t suffix_junk[0x20]
//   RS
struct Script {
  uint32_t tag_word = 0;
  ScriptTagType script_type = ScriptTagType::SYSTEM;
  std::string prefix_junk;
  int32_t id = 0;
  std::string unknown_a1;
  // Index into MapVariables::local_variables. -1 in map files (no runtime
  // instance exists yet)
  int32_t local_variable_offset = -1;
  // 0 in map files
  int32_t local_variable_count = 0;
  std::string suffix_junk;

  // Builds a script with zeroed opaque fields of the correct sizes
  static Script make(ScriptTagType type, int32_t id, int32_t local_variable_offset = -1,
      int32_t local_variable_count = 0);

  uint32_t record_size() const;
  bool has_local_variables() const;
  void print(FILE* stream) const;
};

// Consumes exactly record_size_for_script_tag(tag) bytes
Script decode_script(phosg::StringReader& r);
void encode_script(phosg::StringWriter& w, const Script& script);

// Scripts are stored in five groups. Each group is a script count followed by
// batches of 16 records; every full batch is followed by an 8-byte footer. If
// the count isn't a multiple of 16, the last batch is filled out with unused
// (self-describing) padding slots and then gets its own footer. A group with a
// count of zero has no batches, padding or footer at all.
struct ScriptGroup {
  std::vector<Script> scripts;
  // One entry per batch, in file order
  std::vector<std::string> batch_footers;
  // Raw padding slots after the last partial batch, tag words included
  std::vector<std::string> padding_slots;
};

size_t batch_footer_count_for_script_count(size_t script_count);
size_t padding_slot_count_for_script_count(size_t script_count);

ScriptGroup decode_script_group(phosg::StringReader& r, phosg::PrefixedLogger* log = nullptr);

// If the group has no stored footers or padding (e.g. it was built by hand),
// default ones are generated: each footer is the batch's script count followed
// by four zero bytes, and each padding slot is 64 zero bytes.
void encode_script_group(phosg::StringWriter& w, const ScriptGroup& group);

void print_scripts(FILE* stream, const std::vector<Script>& scripts);

} // namespace FalloutDASM
