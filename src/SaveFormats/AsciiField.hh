#pragma once

#include <stddef.h>

#include <phosg/Strings.hh>
#include <string>

namespace FalloutDASM {

// Fixed-width NUL-terminated ASCII fields. A field of `size` bytes holds at
// most size - 1 characters; everything after the first NUL is padding.

// Always consumes exactly `size` bytes, wherever the NUL is. If there is no
// NUL within the field, all `size` bytes are returned. If raw_field is not
// null, the whole field (terminator and padding included) is copied there.
std::string decode_ascii(phosg::StringReader& r, size_t size, std::string* raw_field = nullptr);

// Writes `s` followed by NUL padding up to `size` bytes
void encode_ascii(phosg::StringWriter& w, const std::string& s, size_t size);
// Writes raw_field unchanged if it is a `size`-byte field that still decodes
// to `s`, so padding after the NUL (or a missing NUL) survives re-encoding.
// Otherwise this behaves like the overload above.
void encode_ascii(phosg::StringWriter& w, const std::string& s, size_t size, const std::string& raw_field);

// The text a raw field decodes to (everything before the first NUL)
std::string ascii_field_text(const std::string& raw_field);

bool is_valid_utf8(const char* data, size_t size);

} // namespace FalloutDASM
