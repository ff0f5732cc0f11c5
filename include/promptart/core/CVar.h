#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace promptart::core {

// Typed runtime settings ("CVars") addressed by dotted names such as
// "art.blur_sigma", with an INI-like config file:
//
//   # comment
//   log.level = info
//
//   [art]                       # following keys are read as "art.<key>"
//   generator  = scene
//   blur_sigma = 0.5            # trailing comments are allowed
//   output_dir = "data/images"
//
// A file may be loaded before the owning module defines its variables; such
// assignments stay pending and are applied by the matching define call.

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

enum CVarFlags : std::uint32_t {
  CVar_None     = 0u,
  CVar_Archive  = 1u << 0, // written by saveFile()
  CVar_ReadOnly = 1u << 1
};

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;
using CVarListener = std::function<void(const struct CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  std::uint32_t flags{CVar_None};

  CVarValue value{};
  CVarValue defaultValue{};

  // Run after every successful set/reset, with the registry unlocked.
  std::vector<CVarListener> listeners;
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Defining an existing name keeps its value and refreshes flags, help and
  // default. A different type is refused with nullptr.
  CVar* defineBool(std::string_view name, bool defaultValue,
                   std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue,
                  std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineFloat(std::string_view name, double defaultValue,
                    std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineString(std::string_view name, std::string defaultValue,
                     std::uint32_t flags = CVar_Archive, std::string_view help = {});

  // Missing names and type mismatches return the fallback.
  bool        getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double      getFloat(std::string_view name, double fallback = 0.0) const;
  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  bool setBool(std::string_view name, bool v, std::string* outError = nullptr);
  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Text is parsed as the variable's type: bools accept 1/0, true/false,
  // on/off, yes/no; strings may be quoted.
  bool setFromString(std::string_view name, std::string_view text, std::string* outError = nullptr);

  // "name=value", as given to --set on the command line.
  bool applyAssignment(std::string_view assignment, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Sorted by name. A non-empty filter keeps names containing it, ignoring case.
  std::vector<const CVar*> list(std::string_view filter = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  // Reads every line even after an error; returns false if the file cannot be
  // opened or any line is malformed or fails to parse for a known variable.
  // outError gets one "path:line: message" entry per problem.
  bool loadFile(const std::string& path, std::string* outError = nullptr);

  // Archived variables grouped into [section] blocks by their first name
  // component, then any pending assignments under their full names.
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  CVar* define(std::string_view name, CVarType type, CVarValue def,
               std::uint32_t flags, std::string_view help);
  bool assign(std::string_view name, CVarValue v, std::string* outError);

  template <class T>
  T valueOr(std::string_view name, T fallback) const;

  // Caller holds mutex_.
  void takePending(CVar& var);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

// Process-wide registry used by the tools.
CVarRegistry& cvars();

// Defines log.level and keeps setLogLevel() in sync with it. Repeat calls are no-ops.
void installDefaultCVars(CVarRegistry& registry);

} // namespace promptart::core
