#include "Cursor.hh"

#include <format>
#include <phosg/Strings.hh>
#include <string>

#include "Errors.hh"

using namespace std;
using namespace phosg;

namespace FalloutDASM {

void require_available(const StringReader& r, size_t size, const char* what) {
  if (r.remaining() < size) {
    throw DecodeError(DecodeError::Type::INSUFFICIENT_DATA, r.where(),
        std::format("{} needs {} bytes, but only {} remain", what, size, r.remaining()));
  }
}

string read_opaque(StringReader& r, size_t size, const char* what) {
  require_available(r, size, what);
  return r.read(size);
}

void skip_opaque(StringReader& r, size_t size, const char* what) {
  require_available(r, size, what);
  r.skip(size);
}

uint8_t read_u8(StringReader& r, const char* what) {
  require_available(r, 1, what);
  return r.get_u8();
}

uint16_t read_u16b(StringReader& r, const char* what) {
  require_available(r, 2, what);
  return r.get_u16b();
}

uint32_t read_u32b(StringReader& r, const char* what) {
  require_available(r, 4, what);
  return r.get_u32b();
}

int32_t read_s32b(StringReader& r, const char* what) {
  require_available(r, 4, what);
  return r.get_s32b();
}

size_t check_count(int32_t count, size_t offset, const char* what) {
  if (count < 0) {
    throw DecodeError(DecodeError::Type::NEGATIVE_COUNT, offset,
        std::format("{} is negative ({})", what, count));
  }
  return static_cast<size_t>(count);
}

size_t read_count(StringReader& r, const char* what) {
  size_t offset = r.where();
  return check_count(read_s32b(r, what), offset, what);
}

void write_opaque(StringWriter& w, const string& data, size_t size, const char* what) {
  if (data.size() != size) {
    throw EncodeError(EncodeError::Type::INVALID_BLOCK_SIZE,
        std::format("{} must be {} bytes, but is {} bytes", what, size, data.size()));
  }
  w.write(data);
}

} // namespace FalloutDASM
