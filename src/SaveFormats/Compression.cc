#include "Compression.hh"

#include <stdint.h>
#include <string.h>
#include <zlib.h>

#include <format>
#include <stdexcept>
#include <string>

using namespace std;

namespace FalloutDASM {

// 16 added to the window bits selects the gzip wrapper instead of zlib's
static constexpr int GZIP_WINDOW_BITS = 16 + MAX_WBITS;

bool is_gzip_compressed(const string& data) {
  return (data.size() >= 2) &&
      (static_cast<uint8_t>(data[0]) == 0x1F) &&
      (static_cast<uint8_t>(data[1]) == 0x8B);
}

string decompress_gzip(const string& data) {
  z_stream s;
  memset(&s, 0, sizeof(s));
  int ret = inflateInit2(&s, GZIP_WINDOW_BITS);
  if (ret != Z_OK) {
    throw runtime_error(std::format("cannot initialize zlib for decompression: {}", ret));
  }

  string out;
  char buf[0x10000];
  s.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  s.avail_in = data.size();
  for (;;) {
    s.next_out = reinterpret_cast<Bytef*>(buf);
    s.avail_out = sizeof(buf);
    ret = inflate(&s, Z_NO_FLUSH);
    out.append(buf, sizeof(buf) - s.avail_out);

    if (ret == Z_STREAM_END) {
      // Concatenated gzip members decompress to the concatenation of their
      // contents
      if (s.avail_in == 0) {
        break;
      }
      ret = inflateReset(&s);
      if (ret != Z_OK) {
        inflateEnd(&s);
        throw runtime_error(std::format("cannot reset zlib stream: {}", ret));
      }
    } else if (ret != Z_OK) {
      string message = s.msg ? s.msg : "unknown error";
      inflateEnd(&s);
      throw runtime_error(std::format("gzip decompression failed ({}): {}", ret, message));
    } else if ((s.avail_in == 0) && (s.avail_out != 0)) {
      inflateEnd(&s);
      throw runtime_error("gzip data is truncated");
    }
  }

  inflateEnd(&s);
  return out;
}

string compress_gzip(const string& data) {
  z_stream s;
  memset(&s, 0, sizeof(s));
  int ret = deflateInit2(&s, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw runtime_error(std::format("cannot initialize zlib for compression: {}", ret));
  }

  string out(deflateBound(&s, data.size()), '\0');
  s.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  s.avail_in = data.size();
  s.next_out = reinterpret_cast<Bytef*>(out.data());
  s.avail_out = out.size();
  ret = deflate(&s, Z_FINISH);
  if (ret != Z_STREAM_END) {
    deflateEnd(&s);
    throw runtime_error(std::format("gzip compression failed: {}", ret));
  }
  out.resize(s.total_out);
  deflateEnd(&s);
  return out;
}

string maybe_decompress_gzip(const string& data) {
  return is_gzip_compressed(data) ? decompress_gzip(data) : data;
}

} // namespace FalloutDASM
