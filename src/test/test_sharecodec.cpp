#include <cassert>
#include <cstdint>
#include <print>
#include <string>
#include <vector>

#include "primeshare/sharecodec.hpp"
#include "testsupport.hpp"

using namespace PrimeShare;
using PrimeShare::Test::throws;

namespace {

const auto alphabet = Alphabet::shareAlphabet();

void testLayout() {
  auto layout = ShareLayout::forByteWidth(2, alphabet);
  assert(layout.fieldWidth == 3);
  assert(layout.thresholdOffset() == 1);
  assert(layout.indexOffset() == 4);
  assert(layout.bodyOffset() == 7);
  assert(layout.valueOffset(2) == 13);
  assert(layout.shareLength(3, 1) == 17);

  assert(throws<RangeError>([] { ShareLayout::forByteWidth(8, alphabet); }));
}

void testEncode() {
  ShareRecord record{1, 3, 1, {0, 256}, 0};
  assert(ShareCodec::encode(record, alphabet) == "10301005v");

  ShareRecord padded{2, 2, 300, {20757}, 1};
  assert(ShareCodec::encode(padded, alphabet) == "200206uabc=");

  ShareRecord empty{1, 2, 1, {}, 0};
  assert(ShareCodec::encode(empty, alphabet) == "10201");
}

void testDecode() {
  auto record = ShareCodec::decode("10301005v", alphabet);
  assert(record.byteWidth == 1);
  assert(record.threshold == 3);
  assert(record.index == 1);
  assert((record.values == std::vector<uint64_t>{0, 256}));
  assert(record.padding == 0);

  auto padded = ShareCodec::decode("200206uabc=", alphabet);
  assert(padded.byteWidth == 2);
  assert(padded.index == 300);
  assert((padded.values == std::vector<uint64_t>{20757}));
  assert(padded.padding == 1);

  auto empty = ShareCodec::decode("10201", alphabet);
  assert(empty.values.empty() && empty.padding == 0);
}

void testMalformed() {
  const std::vector<std::string> malformed{
      "",                 // nothing at all
      "0020100",          // byte width zero
      "8020100",          // byte width beyond the prime table
      "x020100",          // not a hex digit
      "1020",             // truncated header
      "102010",           // body not a multiple of the field width
      "10201AA",          // symbol outside the alphabet
      "1020100=",         // padding at byte width 1
      "2002001=",         // padding without any value
      "2002001000==",     // padding as wide as the byte width
      "2002001000=000",   // padding in the middle of the body
      "10200",            // index zero
      "10101",            // threshold below two
      "102015w",          // value 257 is outside the field of 257
      "15x01",            // threshold outside the field
  };

  for (const auto &share : malformed) {
    assert(throws<MalformedShareError>([&] { ShareCodec::decode(share, alphabet); }));
  }
}

}  // namespace

int main() {
  testLayout();
  testEncode();
  testDecode();
  testMalformed();

  std::println("sharecodec: ok");
  return 0;
}
