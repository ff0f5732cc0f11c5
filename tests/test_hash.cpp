#include "promptart/art/Prompt.h"
#include "promptart/core/Hash.h"

#include "test_harness.h"

#include <string>

int test_hash() {
  int failures = 0;

  using namespace promptart;

  // FIPS 180-4 known answers.
  CHECK(core::sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  CHECK(core::sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  CHECK(core::sha256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

  // Multi-block input crossing many 64-byte boundaries.
  {
    const std::string million(1000000, 'a');
    CHECK(core::sha256Hex(million) == "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
  }

  // 55/56/64 bytes exercise the padding edge cases; only consistency is checked here.
  for (std::size_t n : {55u, 56u, 63u, 64u, 65u}) {
    const std::string s(n, 'x');
    const core::Sha256Digest a = core::sha256(s);
    const core::Sha256Digest b = core::sha256(s.data(), s.size());
    CHECK(a == b);
    CHECK(core::toHex(a.data(), a.size()) == core::sha256Hex(s));
  }

  {
    const core::u8 bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    CHECK(core::toHex(bytes, sizeof(bytes)) == "000fa0ff");
  }

  // Seed = first 8 hex digits of the digest.
  CHECK(art::deriveSeed("") == 0xe3b0c442u);
  CHECK(art::deriveSeed("abc") == 0xba7816bfu);
  CHECK(art::deriveSeed("a quiet night under the stars and moon") ==
        art::deriveSeed(std::string("a quiet night under the stars and moon")));
  CHECK(art::deriveSeed("Night") != art::deriveSeed("night"));

  return failures;
}
