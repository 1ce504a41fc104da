#include "Errors.hh"

#include <format>
#include <string>

using namespace std;

namespace FalloutDASM {

DecodeError::DecodeError(Type type, size_t offset, const string& message)
    : FormatError(std::format("{} at offset {:X}: {}",
          name_for_decode_error_type(type), offset, message)),
      type(type),
      offset(offset),
      message(message) {}

EncodeError::EncodeError(Type type, const string& message)
    : FormatError(std::format("{}: {}", name_for_encode_error_type(type), message)),
      type(type) {}

const char* name_for_decode_error_type(DecodeError::Type type) {
  switch (type) {
    case DecodeError::Type::INSUFFICIENT_DATA:
      return "insufficient data";
    case DecodeError::Type::MALFORMED_STRING:
      return "malformed string";
    case DecodeError::Type::INVALID_VERSION:
      return "invalid version";
    case DecodeError::Type::INVALID_FLAGS:
      return "invalid flags";
    case DecodeError::Type::UNKNOWN_RECORD_SIZE:
      return "unknown record size";
    case DecodeError::Type::NEGATIVE_COUNT:
      return "negative count";
    case DecodeError::Type::MAGIC_MISMATCH:
      return "magic mismatch";
    case DecodeError::Type::INVALID_VARIABLE_RANGE:
      return "invalid variable range";
  }
  throw logic_error("invalid decode error type");
}

const char* name_for_encode_error_type(EncodeError::Type type) {
  switch (type) {
    case EncodeError::Type::STRING_TOO_LONG:
      return "string too long";
    case EncodeError::Type::NEGATIVE_COUNT:
      return "negative count";
    case EncodeError::Type::COUNT_MISMATCH:
      return "count mismatch";
    case EncodeError::Type::INVALID_BLOCK_SIZE:
      return "invalid block size";
    case EncodeError::Type::TAG_MISMATCH:
      return "tag mismatch";
  }
  throw logic_error("invalid encode error type");
}

} // namespace FalloutDASM
