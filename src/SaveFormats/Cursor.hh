#pragma once

#include <stddef.h>
#include <stdint.h>

#include <phosg/Strings.hh>
#include <string>

namespace FalloutDASM {

// Checked reads on a StringReader. Each of these raises
// DecodeError(INSUFFICIENT_DATA) at the reader's current offset instead of
// letting StringReader throw out_of_range, so callers can report where the
// buffer ran out. `what` names the field being read.

void require_available(const phosg::StringReader& r, size_t size, const char* what);

std::string read_opaque(phosg::StringReader& r, size_t size, const char* what);
void skip_opaque(phosg::StringReader& r, size_t size, const char* what);
uint8_t read_u8(phosg::StringReader& r, const char* what);
uint16_t read_u16b(phosg::StringReader& r, const char* what);
uint32_t read_u32b(phosg::StringReader& r, const char* what);
int32_t read_s32b(phosg::StringReader& r, const char* what);

// Reads a signed 32-bit count; negative values raise NEGATIVE_COUNT
size_t read_count(phosg::StringReader& r, const char* what);
size_t check_count(int32_t count, size_t offset, const char* what);

// Writes an opaque block that must be exactly `size` bytes long
void write_opaque(phosg::StringWriter& w, const std::string& data, size_t size, const char* what);

} // namespace FalloutDASM
