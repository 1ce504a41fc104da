#pragma once

#include <string>

namespace FalloutDASM {

// Per-map state files inside a save slot are gzip-compressed; map files from
// the game's data archives usually aren't. These are applied to whole files
// before decoding and after encoding.

bool is_gzip_compressed(const std::string& data);

std::string decompress_gzip(const std::string& data);
std::string compress_gzip(const std::string& data);

// Inflates data that starts with the gzip magic (1F 8B); returns anything
// else unchanged
std::string maybe_decompress_gzip(const std::string& data);

} // namespace FalloutDASM
