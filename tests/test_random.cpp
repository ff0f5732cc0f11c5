#include "promptart/core/Random.h"
#include "promptart/core/StableHash.h"

#include "test_harness.h"

int test_random() {
  int failures = 0;

  using namespace promptart::core;

  // Reference SplitMix64 output for seed 0.
  {
    SplitMix64 rng(0);
    CHECK(rng.nextU64() == 0xE220A8397B1DCDAFull);
    CHECK(rng.draws() == 1);
  }

  // Same seed -> same stream; reseed restarts it.
  {
    SplitMix64 a(0xe3b0c442u);
    SplitMix64 b(0xe3b0c442u);
    for (int i = 0; i < 64; ++i) CHECK(a.nextU64() == b.nextU64());

    const u64 first = [] { SplitMix64 r(7); return r.nextU64(); }();
    a.reseed(7);
    CHECK(a.draws() == 0);
    CHECK(a.nextU64() == first);
  }

  // Ranges stay inside their bounds and each call is one draw.
  {
    SplitMix64 rng(12345);
    bool sawMin = false;
    bool sawMax = false;
    for (int i = 0; i < 2000; ++i) {
      const int v = rng.range(1, 3);
      CHECK(v >= 1 && v <= 3);
      sawMin = sawMin || v == 1;
      sawMax = sawMax || v == 3;

      const double d = rng.range(0.3, 1.2);
      CHECK(d >= 0.3 && d < 1.2);
    }
    CHECK(sawMin);
    CHECK(sawMax);
    CHECK(rng.draws() == 4000);

    CHECK(rng.range(-14, -14) == -14);
    CHECK(rng.range(5, 2) >= 2);
  }

  {
    SplitMix64 rng(99);
    int hits = 0;
    for (int i = 0; i < 10000; ++i) hits += rng.chance(0.35) ? 1 : 0;
    CHECK(hits > 3000 && hits < 4000);
    CHECK(!SplitMix64(1).chance(0.0));
  }

  // Signature builder: order and length-prefix sensitive.
  {
    StableHash64 a;
    a.addString("ab");
    a.addString("c");
    StableHash64 b;
    b.addString("a");
    b.addString("bc");
    CHECK(a.value() != b.value());

    StableHash64 c;
    c.addString("ab");
    c.addString("c");
    CHECK(a.value() == c.value());

    c.reset();
    CHECK(c.value() == StableHash64::kOffsetBasis);
  }

  return failures;
}
