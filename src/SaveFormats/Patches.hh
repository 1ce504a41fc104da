#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "MapFile.hh"
#include "Scripts.hh"

namespace FalloutDASM {

// Raw patches are applied to the original (decompressed) bytes of a map file
// without re-encoding anything, so opaque regions stay untouched.

// Absolute file offset of one of a script's local variables:
//   MAP_GLOBAL_VARIABLE_TABLE_OFFSET + global_variable_count * 4
//       + (script.local_variable_offset + field_index) * 4
// Raises PatchError if the script has no local variables, if field_index is
// outside its range, or if the variable is past the end of the map's local
// variable table.
size_t local_variable_file_offset(const MapHeader& header, const Script& script, size_t field_index);

// Overwrites 4 bytes at offset with a big-endian value, in place
void patch_be_u32(std::string& data, size_t offset, uint32_t value);

// Returns a copy of data with one local variable of the given script changed
std::string patch_local_variable(const std::string& data, const MapHeader& header,
    const Script& script, size_t field_index, int32_t value);

} // namespace FalloutDASM
