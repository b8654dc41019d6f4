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

namespace parkwise::core {

// Configuration variables ("cvars"): small typed settings addressed by a dotted
// name such as "facility.bays".
//
//  - Deterministic iteration order (name-sorted) for stable dumps and tests.
//  - Line-based config files:   name = value   # comment
//  - Assignments for names that are not defined yet are kept as "pending" and
//    applied when the variable is defined.

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

enum CVarFlags : std::uint32_t {
  CVar_None     = 0u,
  CVar_Archive  = 1u << 0, // written by saveFile()
  CVar_ReadOnly = 1u << 1  // rejected by set*()
};

inline constexpr std::uint32_t operator|(CVarFlags a, CVarFlags b) {
  return (std::uint32_t)a | (std::uint32_t)b;
}

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;
using CVarListener = std::function<void(const struct CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  std::uint32_t flags{CVar_None};

  CVarValue value{};
  CVarValue defaultValue{};

  // Called after a successful set/reset.
  std::vector<CVarListener> listeners;
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Idempotent. Re-defining with the same type keeps the current value; a
  // different type returns nullptr.
  CVar* defineBool(std::string_view name, bool defaultValue,
                   std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue,
                  std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineFloat(std::string_view name, double defaultValue,
                    std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineString(std::string_view name, std::string defaultValue,
                     std::uint32_t flags = CVar_Archive, std::string_view help = {});

  bool         getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double       getFloat(std::string_view name, double fallback = 0.0) const;
  std::string  getString(std::string_view name, std::string_view fallback = {}) const;

  bool setBool(std::string_view name, bool v, std::string* outError = nullptr);
  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Parse `value` according to the variable's declared type.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  // Parse a single "name=value" assignment (as given on the command line).
  bool assign(std::string_view assignment, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Name-sorted. Non-empty `filter` keeps names containing it (case-insensitive).
  std::vector<const CVar*> list(std::string_view filter = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  CVar* defineImpl(std::string_view name, CVarType type, CVarValue def,
                   std::uint32_t flags, std::string_view help);

  bool setValueImpl(std::string_view name, const CVarValue& v, std::string* outError);

  // Called with mutex_ held.
  void applyPendingLocked(CVar& var);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

// Process-wide registry used by the CLI.
CVarRegistry& cvars();

// Defines "log.level" on `reg` and wires it to setLogLevel(). Safe to call repeatedly.
void installLogCVars(CVarRegistry& reg);

} // namespace parkwise::core
