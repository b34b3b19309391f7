/**
 * @file config.hpp
 * @brief Flat section/key/value configuration with pluggable file formats.
 *
 * Backends are enabled at build time when their parser library is found:
 *   SLUICE_CONFIG_INI_ENABLED  -- INI via inih (ini.h)
 *   SLUICE_CONFIG_JSON_ENABLED -- JSON via nlohmann/json
 *
 * Usage:
 * @code
 *   sluice::Config<sluice::IniBackend> cfg;
 *   auto r = cfg.LoadFile("pipeline.ini");
 *   int32_t workers = cfg.GetInt("ingest", "workers", 1);
 * @endcode
 */

#ifndef SLUICE_CONFIG_HPP_
#define SLUICE_CONFIG_HPP_

#include "sluice/platform.hpp"
#include "sluice/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <tuple>

#ifdef SLUICE_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef SLUICE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

namespace sluice {

// ============================================================================
// ConfigError / ConfigFormat
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kKeyNotFound,
  kInvalidValue
};

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
};

// ============================================================================
// Backend Tags
// ============================================================================

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

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") || detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef SLUICE_CONFIG_MAX_FILE_SIZE
#define SLUICE_CONFIG_MAX_FILE_SIZE 8192U
#endif

/**
 * @brief Fixed-capacity table of (section, key, value) strings.
 *
 * Lookups are case-insensitive. A later entry with the same section and key
 * overwrites the earlier one. Top-level JSON scalars live in section "".
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
    auto r = FindInt(section, key);
    return r.has_value() ? r.value() : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : val;
  }

  /**
   * @brief Integer lookup that tells "missing" from "not a number".
   */
  expected<int32_t, ConfigError> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<int32_t, ConfigError>::error(ConfigError::kKeyNotFound);
    }
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value) {
      return expected<int32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<int32_t, ConfigError>::success(static_cast<int32_t>(val));
  }

  expected<bool, ConfigError> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<bool, ConfigError>::error(ConfigError::kKeyNotFound);
    }
    return expected<bool, ConfigError>::success(ParseBool(e->value));
  }

  bool HasSection(const char* section) const {
    SLUICE_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  static constexpr uint32_t kMaxEntries = 128;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path, char* buf,
                                                          uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    (void)std::fclose(f);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    SLUICE_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
           detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef SLUICE_CONFIG_INI_ENABLED
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

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t) {
    if (ini_parse_string(data, Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "", value ? value : "")
               ? 1
               : 0;
  }
};
#endif  // SLUICE_CONFIG_INI_ENABLED

#ifdef SLUICE_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[SLUICE_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
      char val[ConfigStore::kMaxValueLen];
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          ToStr(*kit, val, sizeof(val));
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(), val)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
        continue;
      }
      ToStr(*it, val, sizeof(val));
      if (!store.AddEntry("", it.key().c_str(), val)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static void ToStr(const nlohmann::json& n, char* b, uint32_t sz) noexcept {
    if (n.is_string()) {
      ConfigStore::SafeCopy(b, n.get_ref<const std::string&>().c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get<bool>() ? "true" : "false", sz);
    } else if (n.is_number_integer()) {
      (void)std::snprintf(b, sz, "%ld", static_cast<long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      (void)std::snprintf(b, sz, "%g", n.get<double>());
    } else {
      b[0] = '\0';
    }
  }
};
#endif  // SLUICE_CONFIG_JSON_ENABLED

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
    SLUICE_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    SLUICE_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
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
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

#ifdef SLUICE_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef SLUICE_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif

}  // namespace sluice

#endif  // SLUICE_CONFIG_HPP_
