/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Multi-format service configuration with template-based backend
 *        dispatch.
 *
 * Design patterns:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (RECYCLE_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (RECYCLE_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (RECYCLE_CONFIG_YAML_ENABLED)
 *
 * All formats are flattened to "section + key = value". Sections map onto
 * services:
 *
 * @code
 *   [log]
 *   level = info
 *
 *   [database]
 *   key = db
 *   timeout_ms = 5000
 *   inbox_capacity = 64
 * @endcode
 *
 * @code
 *   recycle::IniConfig cfg;
 *   cfg.LoadFile("app.ini");
 *   recycle::ApplyLogSettings(cfg);
 *   auto settings = recycle::LoadServiceSettings(cfg, "database");
 *   if (settings.has_value()) recycle::ApplyServiceSettings(settings.value(), spec);
 * @endcode
 */

#ifndef RECYCLE_CONFIG_HPP_
#define RECYCLE_CONFIG_HPP_

#include "recycle/log.hpp"
#include "recycle/platform.hpp"
#include "recycle/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <tuple>
#include <vector>

#ifdef RECYCLE_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef RECYCLE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef RECYCLE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace recycle {

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kInvalidValue
};

inline const char* ConfigErrorToString(ConfigError err) noexcept {
  switch (err) {
    case ConfigError::kFileNotFound:       return "FileNotFound";
    case ConfigError::kParseError:         return "ParseError";
    case ConfigError::kFormatNotSupported: return "FormatNotSupported";
    case ConfigError::kInvalidValue:       return "InvalidValue";
  }
  return "Unknown";
}

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const std::string& a, const std::string& b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char la = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
    char lb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
    if (la != lb) return false;
  }
  return true;
}

}  // namespace detail

// ============================================================================
// Backend Tag Types
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - Flat key-value storage
// ============================================================================

class ConfigStore {
 public:
  // --- Typed Getters ---

  std::string GetString(const std::string& section, const std::string& key,
                        const std::string& default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int64_t GetInt(const std::string& section, const std::string& key,
                 int64_t default_val = 0) const {
    optional<int64_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  bool GetBool(const std::string& section, const std::string& key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  double GetDouble(const std::string& section, const std::string& key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    const char* begin = e->value.c_str();
    char* end = nullptr;
    double val = std::strtod(begin, &end);
    return (end == begin) ? default_val : val;
  }

  // --- Optional Getters ---

  /** @brief Integer value; empty when missing or not fully numeric. */
  optional<int64_t> FindInt(const std::string& section,
                            const std::string& key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    const char* begin = e->value.c_str();
    char* end = nullptr;
    long long val = std::strtoll(begin, &end, 10);
    if (end == begin || *end != '\0') return {};
    return optional<int64_t>(static_cast<int64_t>(val));
  }

  optional<std::string> FindString(const std::string& section,
                                   const std::string& key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<std::string>()
                          : optional<std::string>(e->value);
  }

  // --- Query ---

  bool HasSection(const std::string& section) const {
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section)) return true;
    }
    return false;
  }

  bool HasKey(const std::string& section, const std::string& key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /** @brief Insert or overwrite one entry (keys are case-insensitive). */
  void Set(const std::string& section, const std::string& key,
           const std::string& value) {
    for (Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section) &&
          detail::CaseEqual(e.key, key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  static expected<std::string, ConfigError> ReadFile(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string out;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
      out.append(buf, n);
    }
    const bool failed = std::ferror(f) != 0;
    (void)std::fclose(f);
    if (failed) {
      return expected<std::string, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<std::string, ConfigError>::success(std::move(out));
  }

  const Entry* FindEntry(const std::string& section,
                         const std::string& key) const {
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section) &&
          detail::CaseEqual(e.key, key))
        return &e;
    }
    return nullptr;
  }

  static bool ParseBool(const std::string& str) noexcept {
    return detail::CaseEqual(str, "true") || str == "1" ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static std::string GetExtension(const std::string& path) {
    const size_t dot = path.find_last_of('.');
    const size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return path.substr(dot + 1);
  }

  std::vector<Entry> entries_;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&,
                                               const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                 const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef RECYCLE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const std::string& path) {
    int result = ini_parse(path.c_str(), Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    int result = ini_parse_string(data.c_str(), Handler, &store);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->Set(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- JSON Backend ---

#ifdef RECYCLE_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const std::string& path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.Set("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef RECYCLE_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const std::string& path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.Set(sec, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.Set("", sec, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const std::string& path, ConfigFormat format = ConfigFormat::kAuto) {
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const std::string& path,
                                           ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data,
                                             ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const std::string& path) const {
    const std::string ext = GetExtension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

#ifdef RECYCLE_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef RECYCLE_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef RECYCLE_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// Service Settings
// ============================================================================

/** @brief Per-service overrides read from one config section. */
struct ServiceSettings {
  optional<std::string> key;
  optional<uint32_t> timeout_ms;
  optional<uint32_t> inbox_capacity;
};

namespace detail {

inline expected<optional<uint32_t>, ConfigError> ReadPositive(
    const ConfigStore& store, const std::string& section,
    const std::string& key) {
  using Ret = expected<optional<uint32_t>, ConfigError>;
  if (!store.HasKey(section, key)) {
    return Ret::success(optional<uint32_t>());
  }
  optional<int64_t> v = store.FindInt(section, key);
  if (!v.has_value() || v.value() <= 0 || v.value() > 0xFFFFFFFFLL) {
    RECYCLE_LOG_WARN("Config", "[%s] %s: expected a positive integer, got '%s'",
                     section.c_str(), key.c_str(),
                     store.GetString(section, key).c_str());
    return Ret::error(ConfigError::kInvalidValue);
  }
  return Ret::success(optional<uint32_t>(static_cast<uint32_t>(v.value())));
}

}  // namespace detail

/**
 * @brief Read key, timeout_ms and inbox_capacity from @p section.
 *
 * Missing keys stay unset. Non-numeric, zero or negative numbers fail with
 * kInvalidValue.
 */
inline expected<ServiceSettings, ConfigError> LoadServiceSettings(
    const ConfigStore& store, const std::string& section) {
  using Ret = expected<ServiceSettings, ConfigError>;
  ServiceSettings settings;
  settings.key = store.FindString(section, "key");

  auto timeout = detail::ReadPositive(store, section, "timeout_ms");
  if (!timeout.has_value()) return Ret::error(timeout.get_error());
  settings.timeout_ms = timeout.value();

  auto capacity = detail::ReadPositive(store, section, "inbox_capacity");
  if (!capacity.has_value()) return Ret::error(capacity.get_error());
  settings.inbox_capacity = capacity.value();

  return Ret::success(std::move(settings));
}

/**
 * @brief Overlay the present settings onto a ServiceSpec or ServiceMapSpec.
 */
template <typename SpecT>
void ApplyServiceSettings(const ServiceSettings& settings, SpecT& spec) {
  if (settings.key.has_value() && !settings.key.value().empty()) {
    spec.key = settings.key.value();
  }
  if (settings.timeout_ms.has_value()) {
    spec.timeout_ms = settings.timeout_ms.value();
  }
  if (settings.inbox_capacity.has_value()) {
    spec.inbox_capacity = settings.inbox_capacity.value();
  }
}

/**
 * @brief Apply "[log] level = ..." to the logger.
 *
 * A missing entry leaves the level unchanged; an unknown name fails with
 * kInvalidValue.
 */
inline expected<void, ConfigError> ApplyLogSettings(const ConfigStore& store) {
  optional<std::string> name = store.FindString("log", "level");
  if (!name.has_value()) {
    return expected<void, ConfigError>::success();
  }
  log::Level level = log::GetLevel();
  if (!log::ParseLevel(name.value().c_str(), level)) {
    RECYCLE_LOG_WARN("Config", "[log] level: unknown level '%s'",
                     name.value().c_str());
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  log::SetLevel(level);
  return expected<void, ConfigError>::success();
}

}  // namespace recycle

#endif  // RECYCLE_CONFIG_HPP_
