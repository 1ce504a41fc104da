#include "AsciiField.hh"

#include <stdint.h>
#include <string.h>

#include <format>
#include <phosg/Strings.hh>
#include <string>

#include "Cursor.hh"
#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace FalloutDASM {

bool is_valid_utf8(const char* data, size_t size) {
  const uint8_t* p = reinterpret_cast<const uint8_t*>(data);
  size_t z = 0;
  while (z < size) {
    uint8_t ch = p[z];
    size_t extra_bytes;
    uint32_t min_value;
    if (ch < 0x80) {
      z++;
      continue;
    } else if ((ch & 0xE0) == 0xC0) {
      extra_bytes = 1;
      min_value = 0x80;
    } else if ((ch & 0xF0) == 0xE0) {
      extra_bytes = 2;
      min_value = 0x800;
    } else if ((ch & 0xF8) == 0xF0) {
      extra_bytes = 3;
      min_value = 0x10000;
    } else {
      return false;
    }
    if (z + extra_bytes >= size) {
      return false;
    }

    uint32_t value = ch & (0x3F >> extra_bytes);
    for (size_t x = 1; x <= extra_bytes; x++) {
      uint8_t cont = p[z + x];
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      value = (value << 6) | (cont & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF are not valid
    if ((value < min_value) || (value > 0x10FFFF) || ((value >= 0xD800) && (value <= 0xDFFF))) {
      return false;
    }
    z += extra_bytes + 1;
  }
  return true;
}

string ascii_field_text(const string& raw_field) {
  return string(raw_field.data(), strnlen(raw_field.data(), raw_field.size()));
}

string decode_ascii(StringReader& r, size_t size, string* raw_field) {
  size_t offset = r.where();
  string field = read_opaque(r, size, "ASCII field");

  string text = ascii_field_text(field);
  if (!is_valid_utf8(text.data(), text.size())) {
    throw DecodeError(DecodeError::Type::MALFORMED_STRING, offset,
        std::format("field of {} bytes does not contain valid text", size));
  }
  if (raw_field) {
    *raw_field = std::move(field);
  }
  return text;
}

void encode_ascii(StringWriter& w, const string& s, size_t size) {
  // The terminator must fit too
  if (s.size() + 1 > size) {
    throw EncodeError(EncodeError::Type::STRING_TOO_LONG,
        std::format("\"{}\" does not fit in a {}-byte field", s, size));
  }
  w.write(s);
  for (size_t z = s.size(); z < size; z++) {
    w.put_u8(0);
  }
}

void encode_ascii(StringWriter& w, const string& s, size_t size, const string& raw_field) {
  if ((raw_field.size() == size) && (ascii_field_text(raw_field) == s)) {
    w.write(raw_field);
  } else {
    encode_ascii(w, s, size);
  }
}

} // namespace FalloutDASM
