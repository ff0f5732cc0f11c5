#include "promptart/art/Prompt.h"

#include "test_harness.h"

#include <array>
#include <string_view>

int test_prompt() {
  int failures = 0;

  using namespace promptart::art;

  {
    const TokenSet t = extractTokens("Hello, World! hello 42x");
    CHECK(t.size() == 3);
    CHECK(t.count("hello") == 1);
    CHECK(t.count("world") == 1);
    CHECK(t.count("42x") == 1);
    CHECK(joinTokens(t) == "42x, hello, world");
    CHECK(joinTokens(t, "|") == "42x|hello|world");
  }

  // Non-ASCII bytes split words and are dropped.
  {
    const TokenSet t = extractTokens("caf\xc3\xa9 au lait");
    CHECK(t.size() == 3);
    CHECK(t.count("caf") == 1);
    CHECK(t.count("au") == 1);
    CHECK(t.count("lait") == 1);
  }

  {
    CHECK(extractTokens("").empty());
    CHECK(extractTokens("  ...!!!  ").empty());
    CHECK(extractTokens("neon-lit_street").size() == 3);
    CHECK(joinTokens(TokenSet{}).empty());
  }

  {
    const TokenSet t = extractTokens("Stars over the SEA");
    constexpr std::array<std::string_view, 2> marine{"ocean", "sea"};
    constexpr std::array<std::string_view, 2> forest{"forest", "tree"};
    CHECK(hasAnyToken(t, marine));
    CHECK(!hasAnyToken(t, forest));
    // Whole words only.
    CHECK(!hasAnyToken(extractTokens("seashore"), marine));
  }

  return failures;
}
