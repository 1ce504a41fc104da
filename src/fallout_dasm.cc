#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <format>
#include <phosg/Arguments.hh>
#include <phosg/Encoding.hh>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>
#include <vector>

#include "SaveFormats/Compression.hh"
#include "SaveFormats/Errors.hh"
#include "SaveFormats/MapFile.hh"
#include "SaveFormats/Patches.hh"
#include "SaveFormats/SaveHeader.hh"

using namespace std;
using namespace phosg;
using namespace FalloutDASM;

void print_usage() {
  fwrite_fmt(stderr, "\
Usage: fallout_dasm [options] INPUT-FILE [OUTPUT-FILE]\n\
\n\
By default, INPUT-FILE is decoded as a map state file (e.g. maps/ARCAVES.SAV\n\
from a save slot, or a .MAP file) and its header and scripts are printed. The\n\
input may be gzip-compressed. When OUTPUT-FILE is written, it is compressed if\n\
the input was.\n\
\n\
Options:\n\
  --save-header\n\
      Decode INPUT-FILE as a SAVE.DAT file and print its header instead.\n\
  --show-variables\n\
      Also print the global and local variable tables.\n\
  --set-local-variable=SID:INDEX:VALUE\n\
      Write a copy of the input to OUTPUT-FILE with local variable INDEX of\n\
      script SID set to VALUE. Only those 4 bytes are changed. SID and VALUE may\n\
      be given in hex with a 0x prefix.\n\
  --reencode\n\
      Decode the map, encode it again, and write the result to OUTPUT-FILE.\n\
  --verify\n\
      Decode the map, encode it again, and check that the result matches the\n\
      input exactly.\n\
  --strict\n\
      Fail if a script's local variable range is outside the local variable\n\
      table, instead of warning.\n\
  --log-level=LEVEL\n\
      Set the log level (debug, info, warning, or error; default warning).\n\
\n");
}

static LogLevel parse_log_level(const string& name) {
  if (name.empty() || name == "warning") {
    return LogLevel::L_WARNING;
  } else if (name == "debug") {
    return LogLevel::L_DEBUG;
  } else if (name == "info") {
    return LogLevel::L_INFO;
  } else if (name == "error") {
    return LogLevel::L_ERROR;
  }
  throw invalid_argument("invalid log level: " + name);
}

static int64_t parse_integer(const string& s, const char* what) {
  char* end = nullptr;
  long long value = strtoll(s.c_str(), &end, 0);
  if (s.empty() || !end || *end != '\0') {
    throw invalid_argument(std::format("invalid {}: {}", what, s));
  }
  return value;
}

struct LocalVariablePatch {
  int32_t script_id;
  size_t index;
  int32_t value;
};

static LocalVariablePatch parse_local_variable_patch(const string& text) {
  auto tokens = split(text, ':');
  if (tokens.size() != 3) {
    throw invalid_argument("--set-local-variable must be of the form SID:INDEX:VALUE");
  }
  int64_t index = parse_integer(tokens[1], "variable index");
  if (index < 0) {
    throw invalid_argument("variable index cannot be negative");
  }
  return LocalVariablePatch{
      static_cast<int32_t>(parse_integer(tokens[0], "script id")),
      static_cast<size_t>(index),
      static_cast<int32_t>(parse_integer(tokens[2], "variable value"))};
}

static void write_output(const string& output_filename, const string& data, bool compress) {
  if (output_filename.empty()) {
    throw invalid_argument("an output filename is required");
  }
  save_file(output_filename, compress ? compress_gzip(data) : data);
  log_info_f("Wrote {} ({} bytes{})", output_filename, data.size(),
      compress ? " before compression" : "");
}

static int run(Arguments& args) {
  string input_filename = args.get<string>(0, true);
  string output_filename = args.get<string>(1, false);
  bool save_header_mode = args.get<bool>("save-header");
  bool show_variables = args.get<bool>("show-variables");
  bool reencode = args.get<bool>("reencode");
  bool verify = args.get<bool>("verify");
  string patch_spec = args.get<string>("set-local-variable", false);

  DecodeOptions opts;
  opts.log_level = parse_log_level(args.get<string>("log-level", false));
  opts.strict_local_variable_ranges = args.get<bool>("strict");

  string raw_data = load_file(input_filename);
  bool was_compressed = is_gzip_compressed(raw_data);
  string data = maybe_decompress_gzip(raw_data);
  if (was_compressed) {
    log_info_f("{} is gzip-compressed ({} bytes -> {} bytes)",
        input_filename, raw_data.size(), data.size());
  }

  if (save_header_mode) {
    decode_save_header(data, opts).print(stdout);
    return 0;
  }

  DecodedMap map = decode_map(data, opts);
  map.header.print(stdout);
  if (show_variables) {
    map.variables.print(stdout);
  }
  print_scripts(stdout, map.scripts());

  if (!patch_spec.empty()) {
    auto patch = parse_local_variable_patch(patch_spec);
    const Script* script = map.find_script(patch.script_id);
    if (!script) {
      throw PatchError(std::format("there is no script with id {:08X}",
          static_cast<uint32_t>(patch.script_id)));
    }
    size_t offset = local_variable_file_offset(map.header, *script, patch.index);
    log_info_f("Script {:08X} local variable {} at offset {:X}: {} -> {}",
        static_cast<uint32_t>(script->id), patch.index, offset,
        map.variables.local_variables.at(script->local_variable_offset + patch.index), patch.value);
    write_output(output_filename,
        patch_local_variable(data, map.header, *script, patch.index, patch.value), was_compressed);
  }

  if (reencode || verify) {
    string encoded = encode_map(map);
    if (verify) {
      if (encoded != data) {
        size_t offset = 0;
        while (offset < encoded.size() && offset < data.size() && encoded[offset] == data[offset]) {
          offset++;
        }
        fwrite_fmt(stderr, "Re-encoded map differs from the input at offset {:X}\n", offset);
        return 1;
      }
      fwrite_fmt(stderr, "Re-encoded map matches the input ({} bytes)\n", encoded.size());
    }
    if (reencode) {
      write_output(output_filename, encoded, was_compressed);
    }
  }

  return 0;
}

int main(int argc, char* argv[]) {
  Arguments args(&argv[1], argc - 1);
  if (args.get<bool>("help") || argc <= 1) {
    print_usage();
    return 0;
  }

  try {
    return run(args);
  } catch (const FormatError& e) {
    fwrite_fmt(stderr, "{}: {}\n", args.get<string>(0, false), e.what());
    return 2;
  } catch (const exception& e) {
    fwrite_fmt(stderr, "Error: {}\n", e.what());
    return 1;
  }
}
