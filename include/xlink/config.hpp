/**
 * @file config.hpp
 * @brief Multi-format configuration store with template-based backend dispatch.
 *
 * Design patterns:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *   - Recursive if-constexpr: zero-overhead format dispatch
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (XLINK_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (XLINK_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (XLINK_CONFIG_YAML_ENABLED)
 *
 * All formats are flattened to a "section + key = value" model. JSON arrays
 * and YAML sequences of scalars become comma-separated values, so
 *
 *   [links]                {"links": {"names": ["A", "B"]}}
 *   names = A, B           links: { names: [A, B] }
 *
 * all read back identically through GetList("links", "names", ...).
 *
 * Compatible with -fno-exceptions -fno-rtti.
 *
 * Usage:
 * @code
 *   xlink::MultiConfig cfg;
 *   cfg.LoadFile("links.ini");
 *   xlink::NameString names[8];
 *   auto n = cfg.GetList("links", "names", names, 8);
 * @endcode
 */

#ifndef XLINK_CONFIG_HPP_
#define XLINK_CONFIG_HPP_

#include "xlink/platform.hpp"
#include "xlink/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <tuple>

#ifdef XLINK_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef XLINK_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef XLINK_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#include <string>
#endif

namespace xlink {

// ============================================================================
// ConfigFormat
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend Tag Types (tag dispatch)
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

inline bool IsBlank(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
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
    return detail::StrCaseEqual(ext, "yaml") ||
           detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - Flat key-value storage base
// ============================================================================

#ifndef XLINK_CONFIG_MAX_FILE_SIZE
#define XLINK_CONFIG_MAX_FILE_SIZE 8192U
#endif

#ifndef XLINK_CONFIG_MAX_ENTRIES
#define XLINK_CONFIG_MAX_ENTRIES 128U
#endif

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = XLINK_CONFIG_MAX_ENTRIES;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  // --- Typed Getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    return (end == e->value) ? default_val : static_cast<int32_t>(val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  // --- Optional Getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    return (end == e->value) ? optional<int32_t>{}
                             : optional<int32_t>{static_cast<int32_t>(val)};
  }

  /**
   * @brief Whole-value unsigned parse: "8" and " 8 " succeed, "8x", "-1"
   *        and values above UINT32_MAX do not.
   */
  optional<uint32_t> FindUint32(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    const char* p = e->value;
    while (detail::IsBlank(*p)) ++p;
    if (*p < '0' || *p > '9') return {};
    char* end = nullptr;
    unsigned long long val = std::strtoull(p, &end, 10);
    while (detail::IsBlank(*end)) ++end;
    if (*end != '\0' || val > 0xFFFFFFFFULL) return {};
    return optional<uint32_t>{static_cast<uint32_t>(val)};
  }

  // --- List Getter ---

  /**
   * @brief Split a comma-separated value into @p out, trimming blanks and
   *        skipping empty items. A missing key yields zero items.
   * @return Item count, or kBufferFull if more than @p max_items are present
   *         or an item does not fit FixedString<N>.
   */
  template <uint32_t N>
  expected<uint32_t, ConfigError> GetList(const char* section, const char* key,
                                          FixedString<N>* out,
                                          uint32_t max_items) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return expected<uint32_t, ConfigError>::success(0U);

    uint32_t n = 0;
    const char* p = e->value;
    while (*p != '\0') {
      while (detail::IsBlank(*p)) ++p;
      const char* begin = p;
      while (*p != '\0' && *p != ',') ++p;
      const char* end = p;
      while (end > begin && detail::IsBlank(*(end - 1))) --end;
      if (*p == ',') ++p;
      const uint32_t len = static_cast<uint32_t>(end - begin);
      if (len == 0U) continue;
      if (n >= max_items || len > N) {
        return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
      }
      out[n] = FixedString<N>(TruncateToCapacity, begin, len);
      ++n;
    }
    return expected<uint32_t, ConfigError>::success(n);
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    XLINK_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /**
   * @brief Distinct section names in first-seen order.
   * @return Number written to @p out (at most @p max_sections).
   */
  uint32_t Sections(const char** out, uint32_t max_sections) const {
    uint32_t n = 0;
    for (uint32_t i = 0; i < count_ && n < max_sections; ++i) {
      bool seen = false;
      for (uint32_t j = 0; j < n; ++j) {
        if (detail::StrCaseEqual(out[j], entries_[i].section)) {
          seen = true;
          break;
        }
      }
      if (!seen) out[n++] = entries_[i].section;
    }
    return n;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
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

  static expected<uint32_t, ConfigError> ReadFileToBuffer(
      const char* path, char* buf, uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr)
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    const bool truncated = std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated)
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    XLINK_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key))
        return &entries_[i];
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

  /// Append ", item" (or "item" when @p dst is empty); false on overflow.
  static bool AppendListItem(char* dst, const char* item,
                             uint32_t dst_size) noexcept {
    const size_t used = std::strlen(dst);
    const size_t need = std::strlen(item) + (used > 0U ? 2U : 0U);
    if (used + need >= dst_size) return false;
    if (used > 0U) std::strcat(dst, ", ");
    std::strcat(dst, item);
    return true;
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
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend> - Template specialization per format
// ============================================================================

/** Default: format not supported (compile-time safe fallback). */
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

// --- INI Backend ---

#ifdef XLINK_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    int result = ini_parse_string(data, Handler, &store);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "")
               ? 1
               : 0;
  }
};
#endif

// --- JSON Backend ---

#ifdef XLINK_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[XLINK_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          char val[ConfigStore::kMaxValueLen];
          if (!ToStr(*kit, val, sizeof(val)) ||
              !store.AddEntry(it.key().c_str(), kit.key().c_str(), val))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else {
        char val[ConfigStore::kMaxValueLen];
        if (!ToStr(*it, val, sizeof(val)) ||
            !store.AddEntry("", it.key().c_str(), val))
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static void ScalarToStr(const nlohmann::json& n, char* b, uint32_t sz) noexcept {
    if (n.is_string()) {
      ConfigStore::SafeCopy(b, n.get_ref<const std::string&>().c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get<bool>() ? "true" : "false", sz);
    } else if (n.is_number_unsigned()) {
      std::snprintf(b, sz, "%llu",
                    static_cast<unsigned long long>(n.get<uint64_t>()));
    } else if (n.is_number_integer()) {
      std::snprintf(b, sz, "%lld", static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      std::snprintf(b, sz, "%g", n.get<double>());
    } else {
      auto s = n.dump();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    }
  }

  /// Arrays of scalars are joined with ", ". False if the list overflows.
  static bool ToStr(const nlohmann::json& n, char* b, uint32_t sz) noexcept {
    b[0] = '\0';
    if (!n.is_array()) {
      ScalarToStr(n, b, sz);
      return true;
    }
    for (const auto& item : n) {
      char one[ConfigStore::kMaxValueLen];
      ScalarToStr(item, one, sizeof(one));
      if (!ConfigStore::AppendListItem(b, one, sz)) return false;
    }
    return true;
  }
};
#endif

// --- YAML Backend ---

#ifdef XLINK_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[XLINK_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string yaml_str(data, size);
    auto root = fkyaml::node::deserialize(yaml_str);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;

      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          char val[ConfigStore::kMaxValueLen];
          if (!ToStr(*kit, val, sizeof(val)) ||
              !store.AddEntry(sec.c_str(), key.c_str(), val))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else {
        char val[ConfigStore::kMaxValueLen];
        if (!ToStr(node, val, sizeof(val)) ||
            !store.AddEntry("", sec.c_str(), val))
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static void ScalarToStr(const fkyaml::node& n, char* b, uint32_t sz) noexcept {
    if (n.is_string()) {
      auto s = n.get_value<std::string>();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get_value<bool>() ? "true" : "false", sz);
    } else if (n.is_integer()) {
      std::snprintf(b, sz, "%lld",
                    static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      std::snprintf(b, sz, "%g", n.get_value<double>());
    } else {
      b[0] = '\0';
    }
  }

  static bool ToStr(const fkyaml::node& n, char* b, uint32_t sz) noexcept {
    b[0] = '\0';
    if (!n.is_sequence()) {
      ScalarToStr(n, b, sz);
      return true;
    }
    for (auto it = n.begin(); it != n.end(); ++it) {
      char one[ConfigStore::kMaxValueLen];
      ScalarToStr(*it, one, sizeof(one));
      if (!ConfigStore::AppendListItem(b, one, sz)) return false;
    }
    return true;
  }
};
#endif

// ============================================================================
// Config<Backends...> - Compile-time composable config reader
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    XLINK_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    XLINK_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
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

  // First backend type (fallback format)
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Convenience Type Aliases
// ============================================================================

#if defined(XLINK_CONFIG_INI_ENABLED) || defined(XLINK_CONFIG_JSON_ENABLED) || \
    defined(XLINK_CONFIG_YAML_ENABLED)
#define XLINK_CONFIG_ANY_ENABLED 1

using MultiConfig = Config<
#ifdef XLINK_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(XLINK_CONFIG_INI_ENABLED) && \
    (defined(XLINK_CONFIG_JSON_ENABLED) || defined(XLINK_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef XLINK_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(XLINK_CONFIG_JSON_ENABLED) && defined(XLINK_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef XLINK_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef XLINK_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef XLINK_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef XLINK_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace xlink

#endif  // XLINK_CONFIG_HPP_
