#include "parkwise/core/CVar.h"

#include "parkwise/core/Log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace parkwise::core {

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = (char)std::tolower((unsigned char)c);
  return out;
}

static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2) {
    const char q0 = s.front();
    const char q1 = s.back();
    if ((q0 == '"' && q1 == '"') || (q0 == '\'' && q1 == '\'')) {
      s = s.substr(1, s.size() - 2);
    }
  }
  // Escapes: \" \\ \n \t
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == '\\' || n == '"' || n == '\'') { out.push_back(n); ++i; continue; }
      if (n == 'n') { out.push_back('\n'); ++i; continue; }
      if (n == 't') { out.push_back('\t'); ++i; continue; }
    }
    out.push_back(c);
  }
  return out;
}

static std::string quoteIfNeeded(std::string_view s) {
  const bool needs = std::any_of(s.begin(), s.end(), [](char c) {
    return std::isspace((unsigned char)c) || c == '#' || c == '=' || c == '"' || c == '\\';
  });
  if (!needs) return std::string(s);

  std::string out;
  out.reserve(s.size() + 8);
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out.push_back(c); break;
    }
  }
  out.push_back('"');
  return out;
}

// Parse `text` as a value of `type`. Returns false on malformed input.
static bool parseValue(CVarType type, std::string_view text, CVarValue& out) {
  const std::string_view t = trimView(text);
  switch (type) {
    case CVarType::Bool: {
      const std::string k = lowerAscii(t);
      if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
      if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
      return false;
    }
    case CVarType::Int: {
      if (t.empty()) return false;
      std::int64_t v = 0;
      const auto res = std::from_chars(t.data(), t.data() + t.size(), v, 10);
      if (res.ec != std::errc{} || res.ptr != t.data() + t.size()) return false;
      out = v;
      return true;
    }
    case CVarType::Float: {
      if (t.empty()) return false;
      const std::string tmp(t);
      char* end = nullptr;
      const double v = std::strtod(tmp.c_str(), &end);
      if (!end || (std::size_t)(end - tmp.c_str()) != tmp.size()) return false;
      out = v;
      return true;
    }
    case CVarType::String:
      out = unquote(t);
      return true;
  }
  return false;
}

static bool typeMatches(CVarType type, const CVarValue& v) {
  switch (type) {
    case CVarType::Bool:   return std::holds_alternative<bool>(v);
    case CVarType::Int:    return std::holds_alternative<std::int64_t>(v);
    case CVarType::Float:  return std::holds_alternative<double>(v);
    case CVarType::String: return std::holds_alternative<std::string>(v);
  }
  return false;
}

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

CVar* CVarRegistry::defineImpl(std::string_view name, CVarType type, CVarValue def,
                               std::uint32_t flags, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it != vars_.end()) {
    if (it->second.type != type) return nullptr;
    it->second.flags = flags;
    if (!help.empty()) it->second.help = std::string(help);
    it->second.defaultValue = std::move(def);
    applyPendingLocked(it->second);
    return &it->second;
  }

  CVar v;
  v.name = std::string(name);
  v.type = type;
  v.flags = flags;
  v.help = std::string(help);
  v.value = def;
  v.defaultValue = std::move(def);

  auto [insIt, ok] = vars_.emplace(v.name, std::move(v));
  (void)ok;
  applyPendingLocked(insIt->second);
  return &insIt->second;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue,
                               std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Bool, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue,
                              std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Int, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue,
                                std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Float, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue,
                                 std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::String, CVarValue{std::move(defaultValue)}, flags, help);
}

bool CVarRegistry::setValueImpl(std::string_view name, const CVarValue& v, std::string* outError) {
  CVar* var = nullptr;
  std::vector<CVarListener> listeners;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    if ((it->second.flags & CVar_ReadOnly) != 0u) {
      if (outError) *outError = "CVar is read-only: " + it->second.name;
      return false;
    }
    if (!typeMatches(it->second.type, v)) {
      if (outError) *outError = "Type mismatch for cvar: " + it->second.name;
      return false;
    }

    it->second.value = v;
    var = &it->second;
    listeners = it->second.listeners;
  }

  for (const auto& cb : listeners) {
    if (cb) cb(*var);
  }
  return true;
}

bool CVarRegistry::setBool(std::string_view name, bool v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return setValueImpl(name, CVarValue{std::move(v)}, outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  CVarType type;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    type = it->second.type;
  }

  CVarValue parsed;
  if (!parseValue(type, value, parsed)) {
    if (outError) *outError = std::string("Invalid ") + typeName(type) + " for " + std::string(name) + ": " + std::string(value);
    return false;
  }
  return setValueImpl(name, parsed, outError);
}

bool CVarRegistry::assign(std::string_view assignment, std::string* outError) {
  const std::size_t eq = assignment.find('=');
  if (eq == std::string_view::npos) {
    if (outError) *outError = "Expected name=value, got: " + std::string(assignment);
    return false;
  }
  const std::string_view name = trimView(assignment.substr(0, eq));
  if (name.empty()) {
    if (outError) *outError = "Missing cvar name in: " + std::string(assignment);
    return false;
  }
  return setFromString(name, assignment.substr(eq + 1), outError);
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  CVarValue def;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    def = it->second.defaultValue;
  }
  return setValueImpl(name, def, outError);
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

template <class T>
static T getTyped(const std::map<std::string, CVar, std::less<>>& vars, std::string_view name, T fallback) {
  const auto it = vars.find(name);
  if (it == vars.end()) return fallback;
  if (!std::holds_alternative<T>(it->second.value)) return fallback;
  return std::get<T>(it->second.value);
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<bool>(vars_, name, fallback);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<std::int64_t>(vars_, name, fallback);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<double>(vars_, name, fallback);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<std::string>(vars_, name, std::string(fallback));
}

std::vector<const CVar*> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = lowerAscii(filter);
  std::vector<const CVar*> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(vars_.size());
  for (const auto& kv : vars_) {
    if (!needle.empty() && lowerAscii(kv.first).find(needle) == std::string::npos) continue;
    out.push_back(&kv.second);
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
  switch (v.type) {
    case CVarType::Bool:
      return std::get<bool>(v.value) ? "true" : "false";
    case CVarType::Int:
      return std::to_string(std::get<std::int64_t>(v.value));
    case CVarType::Float: {
      std::ostringstream oss;
      oss.setf(std::ios::fixed);
      oss.precision(6);
      oss << std::get<double>(v.value);
      return oss.str();
    }
    case CVarType::String:
      return std::get<std::string>(v.value);
  }
  return {};
}

void CVarRegistry::applyPendingLocked(CVar& var) {
  auto pit = pending_.find(var.name);
  if (pit == pending_.end()) return;

  CVarValue parsed;
  if (parseValue(var.type, pit->second, parsed)) {
    var.value = std::move(parsed);
  } else {
    log(LogLevel::Warn, "cvar " + var.name + ": ignoring malformed pending value '" + pit->second + "'");
  }
  pending_.erase(pit);
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open config file: " + path;
    return false;
  }

  bool hadErrors = false;
  std::ostringstream errs;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;

    std::string_view sv = trimView(line);
    if (const std::size_t hash = sv.find('#'); hash != std::string_view::npos) {
      sv = trimView(sv.substr(0, hash));
    }
    if (sv.empty()) continue;

    std::string_view name;
    std::string_view val;
    const std::size_t eq = sv.find('=');
    if (eq != std::string_view::npos) {
      name = trimView(sv.substr(0, eq));
      val = trimView(sv.substr(eq + 1));
    } else {
      std::size_t sp = 0;
      while (sp < sv.size() && !std::isspace((unsigned char)sv[sp])) ++sp;
      name = sv.substr(0, sp);
      val = trimView(sv.substr(sp));
    }
    if (name.empty()) continue;

    bool known = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      known = (vars_.find(name) != vars_.end());
      if (!known) pending_[std::string(name)] = std::string(val);
    }

    if (known) {
      std::string err;
      if (!setFromString(name, val, &err)) {
        hadErrors = true;
        errs << path << ":" << lineNo << ": " << err << "\n";
      }
    }
  }

  if (hadErrors && outError) *outError = errs.str();
  return !hadErrors;
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }

  out << "# parkwise configuration\n\n";

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    const CVar& v = kv.second;
    if ((v.flags & CVar_Archive) == 0u) continue;

    out << v.name << " = ";
    if (v.type == CVarType::String) {
      out << quoteIfNeeded(std::get<std::string>(v.value));
    } else {
      out << valueToString(v);
    }
    out << "\n";
  }

  if (!pending_.empty()) {
    out << "\n# Pending (not defined when saved)\n";
    for (const auto& kv : pending_) {
      out << kv.first << " = " << quoteIfNeeded(kv.second) << "\n";
    }
  }
  return true;
}

bool CVarRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(name) != pending_.end();
}

std::optional<std::string> CVarRegistry::pendingValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

CVarRegistry& cvars() {
  static CVarRegistry g;
  return g;
}

void installLogCVars(CVarRegistry& reg) {
  const bool existed = reg.exists("log.level");
  reg.defineString("log.level", "info", CVar_Archive,
                   "Global log level: trace|debug|info|warn|error|off");
  if (existed) return;

  reg.addListener("log.level", [](const CVar& cv) {
    if (!std::holds_alternative<std::string>(cv.value)) return;
    LogLevel lvl = LogLevel::Info;
    if (!parseLogLevel(std::get<std::string>(cv.value), lvl)) {
      PARKWISE_LOG_WARN("cvar log.level: invalid value (expected trace|debug|info|warn|error|off)");
      return;
    }
    setLogLevel(lvl);
  });

  // A pending value from an earlier loadFile() was applied without listeners.
  LogLevel lvl = LogLevel::Info;
  if (parseLogLevel(reg.getString("log.level", "info"), lvl)) setLogLevel(lvl);
}

} // namespace parkwise::core
