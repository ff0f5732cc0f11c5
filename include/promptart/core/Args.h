#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace promptart::core {

// Small argument parser for the command-line tools.
//
//  - Flags:       --describe   -h
//  - Key/value:   --id 42   --id=42   -o=dir
//  - Positional:  everything else; "--" makes the rest positional.
//
// Repeated keys keep every value (values()); last() returns the final one.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  // Number of values a long option consumes. 0 declares a pure switch, so
  // "--describe night sky" keeps the words positional. Default is 1.
  void setArity(std::string_view key, int valueCount) {
    if (valueCount < 0) return;
    arity_[std::string(key)] = valueCount;
  }

  void parse(int argc, char** argv) {
    *this = Args(std::move(arity_));
    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    int i = 1;
    while (i < argc) {
      const std::string_view word = argv[i] ? argv[i] : "";
      ++i;
      if (word.empty()) continue;

      if (word == "--") {
        for (; i < argc; ++i) {
          if (argv[i]) positional_.emplace_back(argv[i]);
        }
        break;
      }

      if (word.substr(0, 2) == "--") {
        const std::string_view body = word.substr(2);
        const std::size_t eq = body.find('=');
        if (eq != std::string_view::npos) {
          kv_[std::string(body.substr(0, eq))].emplace_back(body.substr(eq + 1));
        } else {
          takeValues(std::string(body), argc, argv, i);
        }
      } else if (word.size() >= 2 && word[0] == '-' && !looksLikeNumber(word)) {
        if (word.size() > 2 && word[2] == '=') {
          kv_[std::string(1, word[1])].emplace_back(word.substr(3));
        } else {
          // Grouped short flags (-hv).
          for (const char c : word.substr(1)) {
            if (std::isalnum((unsigned char)c)) flags_.emplace_back(1, c);
          }
        }
      } else {
        positional_.emplace_back(word);
      }
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& positional() const { return positional_; }

  // Typed getters return true only if the key was given and parsed completely.
  bool getI64(std::string_view key, long long& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const long long val = std::strtoll(v->c_str(), &end, 10);
    if (!end || *end != '\0') return false;
    out = val;
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const double val = std::strtod(v->c_str(), &end);
    if (!end || *end != '\0') return false;
    out = val;
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

private:
  explicit Args(std::unordered_map<std::string, int> arity) : arity_(std::move(arity)) {}

  // Moves up to the option's arity of following non-switch words into its
  // values; an option that takes none is recorded as a flag.
  void takeValues(const std::string& key, int argc, char** argv, int& next) {
    const auto ar = arity_.find(key);
    const int want = ar == arity_.end() ? 1 : ar->second;

    int taken = 0;
    for (; taken < want && next < argc && argv[next] && !isSwitch(argv[next]); ++taken) {
      kv_[key].emplace_back(argv[next++]);
    }
    if (taken == 0) flags_.push_back(key);
  }

  // "-1", "-0.5", "-.25" are values, not switches.
  static bool looksLikeNumber(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    bool anyDigit = false;
    bool anyDot = false;
    for (; i < s.size(); ++i) {
      const unsigned char c = (unsigned char)s[i];
      if (std::isdigit(c)) { anyDigit = true; continue; }
      if (c == '.' && !anyDot) { anyDot = true; continue; }
      return false;
    }
    return anyDigit;
  }

  // A lone "-" is a value (stdin/stdout placeholder).
  static bool isSwitch(std::string_view s) {
    return s.size() >= 2 && s[0] == '-' && !looksLikeNumber(s);
  }

  std::string program_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
  std::unordered_map<std::string, int> arity_;
};

} // namespace promptart::core
