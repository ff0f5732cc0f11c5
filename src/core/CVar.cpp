#include "promptart/core/CVar.h"

#include "promptart/core/Log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace promptart::core {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

std::string toLower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) out.push_back((char)std::tolower(c));
  return out;
}

bool readBool(std::string_view s, bool& out) {
  static constexpr std::string_view kTrue[] = {"1", "true", "on", "yes"};
  static constexpr std::string_view kFalse[] = {"0", "false", "off", "no"};
  const std::string k = toLower(trim(s));
  if (std::find(std::begin(kTrue), std::end(kTrue), k) != std::end(kTrue)) {
    out = true;
    return true;
  }
  if (std::find(std::begin(kFalse), std::end(kFalse), k) != std::end(kFalse)) {
    out = false;
    return true;
  }
  return false;
}

bool readInt(std::string_view s, std::int64_t& out) {
  s = trim(s);
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, out, 10);
  return res.ec == std::errc{} && res.ptr == end;
}

bool readFloat(std::string_view s, double& out) {
  const std::string tmp(trim(s));
  if (tmp.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size()) return false;
  out = v;
  return true;
}

// Drops one pair of surrounding quotes and resolves \" \' \\ \n \t.
std::string readString(std::string_view s) {
  s = trim(s);
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    s = s.substr(1, s.size() - 2);
  }

  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 == s.size()) {
      out.push_back(s[i]);
      continue;
    }
    switch (s[i + 1]) {
      case 'n': out.push_back('\n'); ++i; break;
      case 't': out.push_back('\t'); ++i; break;
      case '"':
      case '\'':
      case '\\': out.push_back(s[i + 1]); ++i; break;
      default: out.push_back('\\'); break;
    }
  }
  return out;
}

std::string writeString(std::string_view s) {
  const bool plain = !s.empty() && std::none_of(s.begin(), s.end(), [](char c) {
    return std::isspace((unsigned char)c) || c == '#' || c == '=' || c == '"' || c == '\\' || c == '[';
  });
  if (plain) return std::string(s);

  std::string out = "\"";
  for (char c : s) {
    if (c == '\n') out += "\\n";
    else if (c == '\t') out += "\\t";
    else {
      if (c == '"' || c == '\\') out.push_back('\\');
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

bool parseAs(CVarType type, std::string_view text, CVarValue& out) {
  switch (type) {
    case CVarType::Bool: {
      bool v = false;
      if (!readBool(text, v)) return false;
      out = v;
      return true;
    }
    case CVarType::Int: {
      std::int64_t v = 0;
      if (!readInt(text, v)) return false;
      out = v;
      return true;
    }
    case CVarType::Float: {
      double v = 0.0;
      if (!readFloat(text, v)) return false;
      out = v;
      return true;
    }
    case CVarType::String:
      out = readString(text);
      return true;
  }
  return false;
}

CVarType typeOf(const CVarValue& v) {
  return static_cast<CVarType>(v.index());
}

// Cuts a '#' comment that is not inside double quotes.
std::string_view stripComment(std::string_view line) {
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"') quoted = !quoted;
    else if (line[i] == '#' && !quoted) return line.substr(0, i);
  }
  return line;
}

std::string_view sectionOf(std::string_view name) {
  const std::size_t dot = name.find('.');
  return dot == std::string_view::npos ? std::string_view{} : name.substr(0, dot);
}

} // namespace

static_assert(std::variant_size_v<CVarValue> == 4, "CVarValue alternatives must follow CVarType order");

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return it == vars_.end() ? nullptr : &it->second;
}

CVar* CVarRegistry::define(std::string_view name, CVarType type, CVarValue def,
                           std::uint32_t flags, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto [it, inserted] = vars_.try_emplace(std::string(name));
  CVar& var = it->second;
  if (inserted) {
    var.name = it->first;
    var.type = type;
    var.value = def;
  } else if (var.type != type) {
    return nullptr;
  }

  var.flags = flags;
  if (!help.empty()) var.help = std::string(help);
  var.defaultValue = std::move(def);
  takePending(var);
  return &var;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue,
                               std::uint32_t flags, std::string_view help) {
  return define(name, CVarType::Bool, defaultValue, flags, help);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue,
                              std::uint32_t flags, std::string_view help) {
  return define(name, CVarType::Int, defaultValue, flags, help);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue,
                                std::uint32_t flags, std::string_view help) {
  return define(name, CVarType::Float, defaultValue, flags, help);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue,
                                 std::uint32_t flags, std::string_view help) {
  return define(name, CVarType::String, std::move(defaultValue), flags, help);
}

template <class T>
T CVarRegistry::valueOr(std::string_view name, T fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const T* v = std::get_if<T>(&it->second.value);
  return v ? *v : fallback;
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  return valueOr<bool>(name, fallback);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  return valueOr<std::int64_t>(name, fallback);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  return valueOr<double>(name, fallback);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  return valueOr<std::string>(name, std::string(fallback));
}

bool CVarRegistry::assign(std::string_view name, CVarValue v, std::string* outError) {
  std::string error;
  CVar changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      error = "Unknown cvar: " + std::string(name);
    } else if ((it->second.flags & CVar_ReadOnly) != 0u) {
      error = "CVar is read-only: " + it->second.name;
    } else if (typeOf(v) != it->second.type) {
      error = std::string("CVar ") + it->second.name + " expects " + typeName(it->second.type) +
              ", got " + typeName(typeOf(v));
    } else {
      it->second.value = std::move(v);
      changed = it->second;
    }
  }

  if (!error.empty()) {
    if (outError) *outError = error;
    return false;
  }

  for (const CVarListener& cb : changed.listeners) {
    if (cb) cb(changed);
  }
  return true;
}

bool CVarRegistry::setBool(std::string_view name, bool v, std::string* outError) {
  return assign(name, v, outError);
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return assign(name, v, outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return assign(name, v, outError);
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return assign(name, std::move(v), outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view text, std::string* outError) {
  const CVar* var = find(name);
  if (!var) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }

  // Type never changes after definition, so reading it unlocked is fine.
  const CVarType type = var->type;
  CVarValue parsed;
  if (!parseAs(type, text, parsed)) {
    if (outError) {
      *outError = std::string("Invalid ") + typeName(type) + " for " + std::string(name) + ": '" +
                  std::string(trim(text)) + "'";
    }
    return false;
  }
  return assign(name, std::move(parsed), outError);
}

bool CVarRegistry::applyAssignment(std::string_view assignment, std::string* outError) {
  const std::size_t eq = assignment.find('=');
  const std::string_view name = trim(assignment.substr(0, eq));
  if (eq == std::string_view::npos || name.empty()) {
    if (outError) *outError = "Expected name=value, got: '" + std::string(assignment) + "'";
    return false;
  }
  return setFromString(name, assignment.substr(eq + 1), outError);
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  const CVar* var = find(name);
  if (!var) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  CVarValue def;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    def = var->defaultValue;
  }
  return assign(name, std::move(def), outError);
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

std::vector<const CVar*> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = toLower(filter);
  std::vector<const CVar*> out;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [name, var] : vars_) {
    if (needle.empty() || toLower(name).find(needle) != std::string::npos) out.push_back(&var);
  }
  return out;
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Bool: return "bool";
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVar& v) {
  if (const bool* b = std::get_if<bool>(&v.value)) return *b ? "true" : "false";
  if (const std::int64_t* i = std::get_if<std::int64_t>(&v.value)) return std::to_string(*i);
  if (const double* f = std::get_if<double>(&v.value)) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(6);
    oss << *f;
    return oss.str();
  }
  return std::get<std::string>(v.value);
}

void CVarRegistry::takePending(CVar& var) {
  const auto it = pending_.find(var.name);
  if (it == pending_.end()) return;

  CVarValue parsed;
  if (parseAs(var.type, it->second, parsed)) {
    var.value = std::move(parsed);
  } else {
    PROMPTART_LOG_WARN("cvar " + var.name + ": ignoring config value '" + it->second + "' (expected " +
                       typeName(var.type) + ")");
  }
  pending_.erase(it);
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open config file: " + path;
    return false;
  }

  std::ostringstream problems;
  auto report = [&](int lineNo, std::string_view msg) {
    problems << path << ":" << lineNo << ": " << msg << "\n";
  };

  std::string section;
  std::string raw;
  int lineNo = 0;
  while (std::getline(in, raw)) {
    ++lineNo;
    const std::string_view line = trim(stripComment(raw));
    if (line.empty()) continue;

    if (line.front() == '[') {
      if (line.back() != ']') {
        report(lineNo, "unterminated section header");
        continue;
      }
      section = std::string(trim(line.substr(1, line.size() - 2)));
      continue;
    }

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      report(lineNo, "expected name = value");
      continue;
    }
    const std::string_view key = trim(line.substr(0, eq));
    const std::string_view value = trim(line.substr(eq + 1));
    if (key.empty()) {
      report(lineNo, "missing name before '='");
      continue;
    }

    const std::string name = section.empty() ? std::string(key) : section + "." + std::string(key);
    if (!exists(name)) {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_[name] = std::string(value);
      continue;
    }

    std::string err;
    if (!setFromString(name, value, &err)) report(lineNo, err);
  }

  const std::string text = problems.str();
  if (!text.empty() && outError) *outError = text;
  return text.empty();
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }

  auto formatted = [](const CVar& v) {
    return v.type == CVarType::String ? writeString(std::get<std::string>(v.value)) : valueToString(v);
  };

  out << "# promptart settings\n";

  std::lock_guard<std::mutex> lock(mutex_);

  // Unsectioned entries first: a [section] header would prefix them on reload.
  for (const auto& [name, var] : vars_) {
    if ((var.flags & CVar_Archive) != 0u && sectionOf(name).empty()) out << name << " = " << formatted(var) << "\n";
  }
  if (!pending_.empty()) {
    out << "\n# not defined when saved\n";
    for (const auto& [name, text] : pending_) out << name << " = " << text << "\n";
  }

  std::string_view current;
  for (const auto& [name, var] : vars_) {
    const std::string_view section = sectionOf(name);
    if ((var.flags & CVar_Archive) == 0u || section.empty()) continue;
    if (section != current) {
      out << "\n[" << section << "]\n";
      current = section;
    }
    out << std::string_view(name).substr(section.size() + 1) << " = " << formatted(var) << "\n";
  }

  out.flush();
  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }
  return true;
}

bool CVarRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(name) != 0;
}

std::optional<std::string> CVarRegistry::pendingValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

CVarRegistry& cvars() {
  static CVarRegistry registry;
  return registry;
}

void installDefaultCVars(CVarRegistry& registry) {
  if (registry.exists("log.level")) return;

  const std::string current(toString(getLogLevel()));
  if (!registry.defineString("log.level", current, CVar_Archive,
                             "Log level: trace|debug|info|warn|error|off")) {
    return;
  }

  // define() may have applied a value loaded from a config file.
  LogLevel level = LogLevel::Info;
  if (parseLogLevel(registry.getString("log.level", current), level)) setLogLevel(level);

  registry.addListener("log.level", [](const CVar& cv) {
    LogLevel next = LogLevel::Info;
    if (parseLogLevel(std::get<std::string>(cv.value), next)) {
      setLogLevel(next);
    } else {
      PROMPTART_LOG_WARN("log.level: unknown level '" + std::get<std::string>(cv.value) + "'");
    }
  });
}

} // namespace promptart::core
