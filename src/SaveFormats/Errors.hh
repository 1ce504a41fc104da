#pragma once

#include <stddef.h>

#include <stdexcept>
#include <string>

namespace FalloutDASM {

class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string& what) : runtime_error(what) { }
  ~FormatError() = default;
};

// Thrown by every decode function. offset is the absolute position (from the
// start of the buffer given to the top-level decoder) where the field that
// failed begins.
class DecodeError : public FormatError {
public:
  enum class Type {
    INSUFFICIENT_DATA = 0,
    MALFORMED_STRING,
    INVALID_VERSION,
    // Never raised: every 32-bit flags word decodes, and unnamed bits are kept
    INVALID_FLAGS,
    UNKNOWN_RECORD_SIZE,
    NEGATIVE_COUNT,
    MAGIC_MISMATCH,
    INVALID_VARIABLE_RANGE,
  };

  DecodeError(Type type, size_t offset, const std::string& message);
  ~DecodeError() = default;

  Type type;
  size_t offset;
  std::string message;
};

class EncodeError : public FormatError {
public:
  enum class Type {
    STRING_TOO_LONG = 0,
    NEGATIVE_COUNT,
    COUNT_MISMATCH,
    INVALID_BLOCK_SIZE,
    TAG_MISMATCH,
  };

  EncodeError(Type type, const std::string& message);
  ~EncodeError() = default;

  Type type;
};

class PatchError : public FormatError {
public:
  explicit PatchError(const std::string& message) : FormatError(message) { }
  ~PatchError() = default;
};

const char* name_for_decode_error_type(DecodeError::Type type);
const char* name_for_encode_error_type(EncodeError::Type type);

} // namespace FalloutDASM
