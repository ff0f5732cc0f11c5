#include "promptart/core/Args.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static std::vector<char*> makeArgv(std::initializer_list<const char*> items) {
  std::vector<char*> argv;
  argv.reserve(items.size());
  for (const char* s : items) {
    argv.push_back(const_cast<char*>(s));
  }
  return argv;
}

int test_args() {
  int fails = 0;

  using promptart::core::Args;

  // Key/value forms and typed getters.
  {
    auto argv = makeArgv({"promptart_cli", "--id", "42", "--out=data/x", "--set", "a=1", "--set", "b=2",
                          "--blur", "-0.5"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (args.program() != "promptart_cli") {
      std::cerr << "[test_args] expected program name\n";
      ++fails;
    }

    long long id = 0;
    if (!args.getI64("id", id) || id != 42) {
      std::cerr << "[test_args] expected --id 42\n";
      ++fails;
    }

    std::string out;
    if (!args.getString("out", out) || out != "data/x") {
      std::cerr << "[test_args] expected --out=data/x\n";
      ++fails;
    }

    const auto sets = args.values("set");
    if (sets.size() != 2 || sets[0] != "a=1" || sets[1] != "b=2") {
      std::cerr << "[test_args] expected two --set values, got size=" << sets.size() << "\n";
      ++fails;
    }

    double blur = 0.0;
    if (!args.getDouble("blur", blur) || std::abs(blur - (-0.5)) > 1e-12) {
      std::cerr << "[test_args] expected --blur -0.5 to parse\n";
      ++fails;
    }

    if (!args.has("id") || args.has("nope")) {
      std::cerr << "[test_args] has() mismatch\n";
      ++fails;
    }
  }

  // Typed getters reject partial parses.
  {
    auto argv = makeArgv({"app", "--id", "12abc"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    long long id = 7;
    if (args.getI64("id", id) || id != 7) {
      std::cerr << "[test_args] expected --id 12abc to be rejected\n";
      ++fails;
    }
  }

  // Arity 0 keeps the following words positional.
  {
    auto argv = makeArgv({"app", "--describe", "quiet", "night"});
    Args args;
    args.setArity("describe", 0);
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("describe")) {
      std::cerr << "[test_args] expected --describe to be a flag\n";
      ++fails;
    }
    const auto& pos = args.positional();
    if (pos.size() != 2 || pos[0] != "quiet" || pos[1] != "night") {
      std::cerr << "[test_args] expected 2 positional words after --describe\n";
      ++fails;
    }
  }

  // Without an arity the next word is the value.
  {
    auto argv = makeArgv({"app", "--describe", "quiet"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    if (args.hasFlag("describe") || args.last("describe").value_or("") != "quiet") {
      std::cerr << "[test_args] expected --describe quiet as key/value by default\n";
      ++fails;
    }
  }

  // A trailing option with no value is a flag.
  {
    auto argv = makeArgv({"app", "--help"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    if (!args.hasFlag("help")) {
      std::cerr << "[test_args] expected --help flag\n";
      ++fails;
    }
  }

  // The end-of-options marker forces everything after it to be positional.
  {
    auto argv = makeArgv({"app", "--flag", "--", "--notAFlag", "-x", "pos"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("flag")) {
      std::cerr << "[test_args] expected --flag to be recognized\n";
      ++fails;
    }
    if (args.hasFlag("notAFlag") || args.hasFlag("x")) {
      std::cerr << "[test_args] expected tokens after -- to NOT be parsed as flags\n";
      ++fails;
    }
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "--notAFlag" || pos[1] != "-x" || pos[2] != "pos") {
      std::cerr << "[test_args] expected 3 positional args after --, got size=" << pos.size() << "\n";
      ++fails;
    }
  }

  // Empty values are kept (--prompt "").
  {
    auto argv = makeArgv({"app", "--prompt", "", "--id", "1"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    std::string prompt = "unset";
    if (!args.getString("prompt", prompt) || !prompt.empty()) {
      std::cerr << "[test_args] expected empty --prompt value\n";
      ++fails;
    }
  }

  // -k=value for single-letter options.
  {
    auto argv = makeArgv({"app", "-o=-"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    const auto v = args.last("o");
    if (!v || *v != "-") {
      std::cerr << "[test_args] expected -o=- to parse value '-'\n";
      ++fails;
    }
  }

  // Negative numbers stay positional; grouped short flags split.
  {
    auto argv = makeArgv({"app", "-1", "-0.25", "-hv"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    const auto& pos = args.positional();
    if (pos.size() != 2 || pos[0] != "-1" || pos[1] != "-0.25") {
      std::cerr << "[test_args] expected negative positional args to remain positional\n";
      ++fails;
    }
    if (!args.hasFlag("h") || !args.hasFlag("v")) {
      std::cerr << "[test_args] expected -hv to set flags h and v\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_args] pass\n";
  return fails;
}
