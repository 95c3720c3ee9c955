/**
 * @file config.hpp
 * @brief Multi-format configuration store with compile-time backend dispatch.
 *
 * Every format is flattened to a "section + key = value" model:
 *   - IniBackend  : inih            (KIZ_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json   (KIZ_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML          (KIZ_CONFIG_YAML_ENABLED)
 *
 * Top-level JSON/YAML objects become sections; scalars at the root land in
 * the "" section.
 *
 * Usage:
 * @code
 *   kiz::MultiConfig cfg;
 *   if (cfg.LoadFile("kizkiz.ini")) {
 *     uint32_t timeout = cfg.GetUint("request", "timeout_ms", 3000U);
 *   }
 * @endcode
 */

#ifndef KIZ_CONFIG_HPP_
#define KIZ_CONFIG_HPP_

#include "kiz/platform.hpp"
#include "kiz/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef KIZ_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef KIZ_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef KIZ_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef KIZ_CONFIG_MAX_FILE_SIZE
#define KIZ_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace kiz {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
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
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf") ||
           detail::CaseEqual(ext, "cfg");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat, fixed-capacity section/key/value table with typed getters.
 *
 * Lookups are case-insensitive. Re-adding an existing key overwrites it, so
 * later files loaded into the same store take precedence.
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.value_or(default_val);
  }

  /// Negative values fall back to the default.
  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0U) const {
    optional<int32_t> v = FindInt(section, key);
    if (!v.has_value() || v.value() < 0) return default_val;
    return static_cast<uint32_t>(v.value());
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    optional<bool> v = FindBool(section, key);
    return v.value_or(default_val);
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value) return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  /// Accepts true/false, yes/no, on/off, 1/0; anything else is "absent".
  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    const char* v = e->value;
    if (detail::CaseEqual(v, "true") || detail::CaseEqual(v, "yes") ||
        detail::CaseEqual(v, "on") || detail::CaseEqual(v, "1")) {
      return optional<bool>(true);
    }
    if (detail::CaseEqual(v, "false") || detail::CaseEqual(v, "no") ||
        detail::CaseEqual(v, "off") || detail::CaseEqual(v, "0")) {
      return optional<bool>(false);
    }
    return {};
  }

  bool HasSection(const char* section) const {
    KIZ_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// Programmatic override (e.g. from command-line flags).
  bool Set(const char* section, const char* key, const char* value) {
    return AddEntry(section, key, value);
  }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 192;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        CopyTruncated(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    CopyTruncated(e.section, section, kMaxKeyLen);
    CopyTruncated(e.key, key, kMaxKeyLen);
    CopyTruncated(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    KIZ_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t n = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (n == buf_size - 1U) && (std::fgetc(f) != EOF);
    std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

  static void CopyTruncated(char* dst, const char* src,
                            uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    for (; i + 1U < dst_size && src[i] != '\0'; ++i) dst[i] = src[i];
    dst[i] = '\0';
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Formats compiled out report kFormatNotSupported.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef KIZ_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int rc = ini_parse(path, OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (rc != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    if (ini_parse_string(data, OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section != nullptr ? section : "",
                           name != nullptr ? name : "",
                           value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef KIZ_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[KIZ_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(),
                              Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.AddEntry("", it.key().c_str(), Scalar(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    return n.dump();
  }
};
#endif

#ifdef KIZ_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[KIZ_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const std::string key = kit.key().get_value<std::string>();
          if (!store.AddEntry(section.c_str(), key.c_str(),
                              Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.AddEntry("", section.c_str(), Scalar(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& n) {
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
  static_assert(sizeof...(Backends) > 0,
                "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    KIZ_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = Detect(path);
    return ParseFileAs<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    KIZ_ASSERT(data != nullptr);
    return ParseBufferAs<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseFileAs(const char* path,
                                          ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return ParseFileAs<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseBufferAs(const char* data, uint32_t size,
                                            ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return ParseBufferAs<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat Detect(const char* path) const noexcept {
    const char* ext = Extension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

#if defined(KIZ_CONFIG_INI_ENABLED) || defined(KIZ_CONFIG_JSON_ENABLED) || \
    defined(KIZ_CONFIG_YAML_ENABLED)
#define KIZ_CONFIG_HAS_BACKEND 1

using MultiConfig = Config<
#ifdef KIZ_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(KIZ_CONFIG_INI_ENABLED) && \
    (defined(KIZ_CONFIG_JSON_ENABLED) || defined(KIZ_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef KIZ_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(KIZ_CONFIG_JSON_ENABLED) && defined(KIZ_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef KIZ_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

}  // namespace kiz

#endif  // KIZ_CONFIG_HPP_
