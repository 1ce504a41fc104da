#include "Patches.hh"

#include <format>
#include <phosg/Encoding.hh>
#include <string>

#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace FalloutDASM {

size_t local_variable_file_offset(const MapHeader& header, const Script& script, size_t field_index) {
  if (header.global_variable_count < 0) {
    throw PatchError("map header has a negative global variable count");
  }
  if (script.local_variable_offset < 0) {
    throw PatchError(std::format("script {:08X} has no local variables",
        static_cast<uint32_t>(script.id)));
  }
  if (script.local_variable_count < 0 ||
      field_index >= static_cast<size_t>(script.local_variable_count)) {
    throw PatchError(std::format("script {:08X} has {} local variables; index {} is out of range",
        static_cast<uint32_t>(script.id), script.local_variable_count, field_index));
  }
  size_t local_index = static_cast<size_t>(script.local_variable_offset) + field_index;
  if (header.local_variable_count < 0 ||
      local_index >= static_cast<size_t>(header.local_variable_count)) {
    throw PatchError(std::format(
        "local variable {} of script {:08X} is outside the map's {} local variables",
        local_index, static_cast<uint32_t>(script.id), header.local_variable_count));
  }
  return MAP_GLOBAL_VARIABLE_TABLE_OFFSET +
      static_cast<size_t>(header.global_variable_count) * 4 +
      local_index * 4;
}

void patch_be_u32(string& data, size_t offset, uint32_t value) {
  if (offset > data.size() || data.size() - offset < 4) {
    throw PatchError(std::format("patch at offset {:X} is beyond the end of the data ({:X} bytes)",
        offset, data.size()));
  }
  *reinterpret_cast<be_uint32_t*>(data.data() + offset) = value;
}

string patch_local_variable(const string& data, const MapHeader& header,
    const Script& script, size_t field_index, int32_t value) {
  string ret = data;
  patch_be_u32(ret, local_variable_file_offset(header, script, field_index), static_cast<uint32_t>(value));
  return ret;
}

} // namespace FalloutDASM
