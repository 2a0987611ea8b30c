/**
 * @file config.hpp
 * @brief Section/key configuration store with INI, JSON and YAML backends.
 *
 * Every format is flattened into "section + key = value" entries. The backend
 * is chosen by file extension or passed explicitly:
 *   - IniBackend  : inih          (PDFMERGE_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (PDFMERGE_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (PDFMERGE_CONFIG_YAML_ENABLED)
 *
 * @code
 *   pdfmerge::MultiConfig cfg;
 *   auto r = cfg.LoadFile("merge.ini");
 *   uint16_t port = cfg.GetPort("server", "port", 3001);
 * @endcode
 */

#ifndef PDFMERGE_CONFIG_HPP_
#define PDFMERGE_CONFIG_HPP_

#include "pdfmerge/platform.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>
#include <vector>

#ifdef PDFMERGE_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef PDFMERGE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef PDFMERGE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace pdfmerge {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") || detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") || detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat entry list with typed getters. Lookups are case-insensitive.
 *
 * Getters never fail: a missing or unparsable value yields the default.
 * Use the Find* variants to distinguish "absent" from "default".
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int64_t GetInt(const char* section, const char* key, int64_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  uint16_t GetPort(const char* section, const char* key, uint16_t default_val = 0) const {
    auto v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    if (v.value() < 0) return 0;
    if (v.value() > 65535) return 65535;
    return static_cast<uint16_t>(v.value());
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value.c_str()) : default_val;
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  optional<int64_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long long val = std::strtoll(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return {};
    return optional<int64_t>(static_cast<int64_t>(val));
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>{} : optional<bool>{ParseBool(e->value.c_str())};
  }

  bool HasSection(const char* section) const {
    PDFMERGE_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  /// Insert or overwrite one entry. Used by the parsers and by command-line
  /// overrides.
  bool Set(const char* section, const char* key, const char* value) {
    for (auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        e.value = value;
        return true;
      }
    }
    if (entries_.size() >= kMaxEntries) return false;
    entries_.push_back(Entry{section, key, value});
    return true;
  }

 protected:
  static constexpr uint32_t kMaxEntries = 256;
  static constexpr uint32_t kMaxFileSize = 64U * 1024U;

  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  const Entry* FindEntry(const char* section, const char* key) const {
    PDFMERGE_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
           detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on");
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::string out;
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
      out.append(chunk, n);
      if (out.size() > kMaxFileSize) {
        (void)std::fclose(f);
        return expected<std::string, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    (void)std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(out));
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backend compiled out: every call reports kFormatNotSupported.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef PDFMERGE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name, const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Set(section != nullptr ? section : "", name != nullptr ? name : "",
                      value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef PDFMERGE_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.Set(it.key().c_str(), kit.key().c_str(), ToStr(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", it.key().c_str(), ToStr(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_float()) {
      char b[32];
      (void)std::snprintf(b, sizeof(b), "%g", n.get<double>());
      return b;
    }
    return n.dump();
  }
};
#endif

#ifdef PDFMERGE_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& data) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(data);
    } catch (const fkyaml::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          if (!store.Set(sec.c_str(), key.c_str(), ToStr(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", sec.c_str(), ToStr(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char b[32];
      (void)std::snprintf(b, sizeof(b), "%g", n.get_value<double>());
      return b;
    }
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

  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    PDFMERGE_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data, ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0) return DispatchBuffer<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

// The INI backend is always listed first; JSON and YAML are appended when
// their libraries were found at configure time.
using MultiConfig = Config<IniBackend
#ifdef PDFMERGE_CONFIG_JSON_ENABLED
                           ,
                           JsonBackend
#endif
#ifdef PDFMERGE_CONFIG_YAML_ENABLED
                           ,
                           YamlBackend
#endif
                           >;

}  // namespace pdfmerge

#endif  // PDFMERGE_CONFIG_HPP_
