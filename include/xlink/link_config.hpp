/**
 * @file link_config.hpp
 * @brief Load link topology and logging settings from a ConfigStore.
 *
 * Expected layout (INI shown; JSON / YAML flatten to the same model):
 *
 *   [router]
 *   default_capacity = 16        ; optional
 *
 *   [log]
 *   level = info                 ; optional
 *
 *   [links]
 *   names = Exchange, Monitor    ; optional, see below
 *
 *   [Exchange]
 *   endpoint1       = Pinger
 *   endpoint1_sends = Ping
 *   endpoint2       = Ponger
 *   endpoint2_sends = Pong
 *   capacity        = 8
 *
 * Without [links] names, every section holding an endpoint1 key is a link,
 * in file order.
 */

#ifndef XLINK_LINK_CONFIG_HPP_
#define XLINK_LINK_CONFIG_HPP_

#include "xlink/config.hpp"
#include "xlink/dispatch_key.hpp"
#include "xlink/link_builder.hpp"
#include "xlink/log.hpp"
#include "xlink/vocabulary.hpp"

#include <cstdint>
#include <cstring>

namespace xlink {

namespace detail {

inline expected<void, ConfigError> ReadName(const ConfigStore& cfg,
                                            const char* section,
                                            const char* key, bool required,
                                            NameString& out) {
  if (!cfg.HasKey(section, key)) {
    if (!required) {
      out.clear();
      return expected<void, ConfigError>::success();
    }
    XLINK_LOG_ERROR("LinkConfig", "[%s] missing '%s'", section, key);
    return expected<void, ConfigError>::error(ConfigError::kMissingKey);
  }
  const char* value = cfg.GetString(section, key);
  if (std::strlen(value) > NameString::capacity()) {
    XLINK_LOG_ERROR("LinkConfig", "[%s] %s: '%s' is too long", section, key,
                    value);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  out.assign(TruncateToCapacity, value);
  if (required && out.empty()) {
    XLINK_LOG_ERROR("LinkConfig", "[%s] %s is empty", section, key);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

inline expected<uint32_t, ConfigError> ReadCapacity(const ConfigStore& cfg,
                                                    const char* section,
                                                    const char* key,
                                                    uint32_t fallback) {
  if (!cfg.HasKey(section, key)) {
    return expected<uint32_t, ConfigError>::success(fallback);
  }
  auto cap = cfg.FindUint32(section, key);
  if (!cap.has_value() || cap.value() == 0U ||
      cap.value() > kMaxPathwayCapacity) {
    XLINK_LOG_ERROR("LinkConfig", "[%s] %s '%s' is not in 1..%u", section,
                    key, cfg.GetString(section, key), kMaxPathwayCapacity);
    return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<uint32_t, ConfigError>::success(cap.value());
}

inline expected<void, ConfigError> ReadLinkSpec(const ConfigStore& cfg,
                                                const char* section,
                                                uint32_t fallback_capacity,
                                                LinkSpec& spec) {
  if (!cfg.HasSection(section)) {
    XLINK_LOG_ERROR("LinkConfig", "link section [%s] not found", section);
    return expected<void, ConfigError>::error(ConfigError::kMissingKey);
  }
  if (std::strlen(section) > NameString::capacity()) {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  spec.name.assign(TruncateToCapacity, section);

  auto r = ReadName(cfg, section, "endpoint1", true, spec.endpoint1.name);
  if (r.has_value())
    r = ReadName(cfg, section, "endpoint2", true, spec.endpoint2.name);
  if (r.has_value())
    r = ReadName(cfg, section, "endpoint1_sends", false, spec.endpoint1.sends);
  if (r.has_value())
    r = ReadName(cfg, section, "endpoint2_sends", false, spec.endpoint2.sends);
  if (!r.has_value()) return r;

  if (spec.endpoint1.sends.empty() && spec.endpoint2.sends.empty()) {
    XLINK_LOG_ERROR("LinkConfig", "link %s sends nothing in either direction",
                    section);
    return expected<void, ConfigError>::error(ConfigError::kMissingKey);
  }

  auto cap = ReadCapacity(cfg, section, "capacity", fallback_capacity);
  if (!cap.has_value()) {
    return expected<void, ConfigError>::error(cap.get_error());
  }
  spec.capacity = cap.value();
  return expected<void, ConfigError>::success();
}

}  // namespace detail

/**
 * @brief Fill @p out with the links described by @p cfg.
 * @return Number of specs written; kBufferFull when more than @p max_specs
 *         links are listed, kMissingKey / kInvalidValue for a malformed link.
 */
inline expected<uint32_t, ConfigError> LoadLinkSpecs(const ConfigStore& cfg,
                                                     LinkSpec* out,
                                                     uint32_t max_specs) {
  using Result = expected<uint32_t, ConfigError>;

  auto fallback = detail::ReadCapacity(cfg, "router", "default_capacity",
                                       kDefaultLinkCapacity);
  if (!fallback.has_value()) return Result::error(fallback.get_error());

  NameString names[XLINK_MAX_LINKS];
  uint32_t count = 0;
  if (cfg.HasKey("links", "names")) {
    auto listed = cfg.GetList("links", "names", names, XLINK_MAX_LINKS);
    if (!listed.has_value()) {
      XLINK_LOG_ERROR("LinkConfig", "[links] names: more than %u links",
                      static_cast<unsigned>(XLINK_MAX_LINKS));
      return Result::error(listed.get_error());
    }
    count = listed.value();
  } else {
    const char* sections[ConfigStore::kMaxEntries];
    const uint32_t n = cfg.Sections(sections, ConfigStore::kMaxEntries);
    for (uint32_t i = 0; i < n; ++i) {
      if (!cfg.HasKey(sections[i], "endpoint1")) continue;
      if (count >= XLINK_MAX_LINKS ||
          std::strlen(sections[i]) > NameString::capacity()) {
        return Result::error(ConfigError::kBufferFull);
      }
      names[count++].assign(TruncateToCapacity, sections[i]);
    }
  }

  if (count > max_specs) {
    XLINK_LOG_ERROR("LinkConfig", "%u links configured, room for %u", count,
                    max_specs);
    return Result::error(ConfigError::kBufferFull);
  }
  for (uint32_t i = 0; i < count; ++i) {
    auto r = detail::ReadLinkSpec(cfg, names[i].c_str(), fallback.value(),
                                  out[i]);
    if (!r.has_value()) return Result::error(r.get_error());
  }
  XLINK_LOG_INFO("LinkConfig", "%u links loaded", count);
  return Result::success(count);
}

/**
 * @brief Apply [log] level to the runtime log level. A missing key leaves
 *        the level unchanged.
 */
inline expected<void, ConfigError> ApplyLogConfig(const ConfigStore& cfg) {
  if (!cfg.HasKey("log", "level")) {
    return expected<void, ConfigError>::success();
  }
  log::Level level = log::Level::kInfo;
  const char* value = cfg.GetString("log", "level");
  if (!log::ParseLevel(value, level)) {
    XLINK_LOG_ERROR("LinkConfig", "[log] level '%s' is not a level", value);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  log::SetLevel(level);
  return expected<void, ConfigError>::success();
}

}  // namespace xlink

#endif  // XLINK_LINK_CONFIG_HPP_
