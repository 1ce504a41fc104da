#include <stdexcept>
#include <string>

#include "Expect.hh"
#include "Fixtures.hh"
#include "SaveFormats/Compression.hh"
#include "SaveFormats/MapFile.hh"

using namespace std;
using namespace FalloutDASM;

static void TestGzipDetection() {
  EXPECT_TRUE(is_gzip_compressed(string("\x1F\x8B\x08\x00", 4)));
  EXPECT_FALSE(is_gzip_compressed(string("\x1F", 1)));
  EXPECT_FALSE(is_gzip_compressed(string("\x00\x00\x00\x14", 4)));
  EXPECT_FALSE(is_gzip_compressed(string()));
}

static void TestCompressedMapIsRoutedThroughInflate() {
  string plain = Fixtures::scenario_a_map();
  string compressed = compress_gzip(plain);
  EXPECT_TRUE(is_gzip_compressed(compressed));
  EXPECT_TRUE(compressed.size() < plain.size());

  string inflated = maybe_decompress_gzip(compressed);
  EXPECT_EQ(inflated.size(), plain.size());
  EXPECT_EQ(inflated, plain);

  DecodeOptions opts;
  opts.log_level = phosg::LogLevel::L_ERROR;
  DecodedMap map = decode_map(inflated, opts);
  EXPECT_EQ(map.scripts().size(), 85u);
}

static void TestUncompressedDataPassesThrough() {
  string plain = Fixtures::scenario_b_map();
  string out = maybe_decompress_gzip(plain);
  EXPECT_EQ(out.size(), plain.size());
  EXPECT_EQ(out, plain);
}

static void TestConcatenatedMembers() {
  string a = compress_gzip("first member, ");
  string b = compress_gzip("second member");
  EXPECT_EQ(decompress_gzip(a + b), string("first member, second member"));
}

static void TestEmptyInput() {
  EXPECT_EQ(decompress_gzip(compress_gzip("")), string());
}

static void TestCorruptData() {
  string compressed = compress_gzip(Fixtures::scenario_b_map());
  EXPECT_THROWS(runtime_error, decompress_gzip(compressed.substr(0, compressed.size() / 2)));

  // Reserved header flag bits set
  string corrupt = compressed;
  corrupt[3] = '\xFF';
  EXPECT_THROWS(runtime_error, decompress_gzip(corrupt));
}

int main() {
  TestGzipDetection();
  TestCompressedMapIsRoutedThroughInflate();
  TestUncompressedDataPassesThrough();
  TestConcatenatedMembers();
  TestEmptyInput();
  TestCorruptData();
  return report_test_results("CompressionTests");
}
