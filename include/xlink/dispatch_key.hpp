/**
 * @file dispatch_key.hpp
 * @brief Name validation and dispatch key construction for link routes.
 *
 * A dispatch key identifies one directed pathway of a link:
 *
 *   "{link}/{source}_to_{target}"     e.g. "PingPongLink/Pinger_to_Ponger"
 *
 * Construction is injective: link names may not contain '/', endpoint
 * names may not contain "_to_" (nor '/'), a source may not end in "_to"
 * and a target may not start with "to_". Under those rules the first '/'
 * and the single "_to_" separator split a key back into exactly one
 * (link, source, target) triple.
 */

#ifndef XLINK_DISPATCH_KEY_HPP_
#define XLINK_DISPATCH_KEY_HPP_

#include "xlink/platform.hpp"
#include "xlink/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#ifndef XLINK_NAME_MAX_LEN
#define XLINK_NAME_MAX_LEN 31U
#endif

namespace xlink {

/// Link and endpoint names.
using NameString = FixedString<XLINK_NAME_MAX_LEN>;

/// Room for link + '/' + source + "_to_" + target.
using DispatchKey = FixedString<3U * XLINK_NAME_MAX_LEN + 5U>;

namespace detail {

inline bool EndsWith(const char* str, uint32_t len, const char* suffix) noexcept {
  const uint32_t n = static_cast<uint32_t>(std::strlen(suffix));
  return len >= n && std::strncmp(str + (len - n), suffix, n) == 0;
}

inline bool HasValidLength(const char* name, uint32_t& len) noexcept {
  if (name == nullptr) return false;
  const size_t raw = std::strlen(name);
  if (raw == 0U || raw > XLINK_NAME_MAX_LEN) return false;
  len = static_cast<uint32_t>(raw);
  return std::strchr(name, '/') == nullptr;
}

}  // namespace detail

/** @brief Non-empty, fits NameString, no '/'. */
inline bool IsValidLinkName(const char* name) noexcept {
  uint32_t len = 0;
  return detail::HasValidLength(name, len);
}

/** @brief Link-name rules plus the "_to_" separator restrictions. */
inline bool IsValidEndpointName(const char* name, bool is_source) noexcept {
  uint32_t len = 0;
  if (!detail::HasValidLength(name, len)) return false;
  if (std::strstr(name, "_to_") != nullptr) return false;
  if (is_source) {
    return !detail::EndsWith(name, len, "_to");
  }
  return std::strncmp(name, "to_", 3) != 0;
}

/**
 * @brief Build the dispatch key for the pathway @p source -> @p target on
 *        @p link.
 * @return kInvalidName if any part breaks the naming rules.
 */
inline expected<DispatchKey, LinkError> MakeDispatchKey(
    const char* link, const char* source, const char* target) noexcept {
  if (!IsValidLinkName(link) || !IsValidEndpointName(source, true) ||
      !IsValidEndpointName(target, false)) {
    return expected<DispatchKey, LinkError>::error(LinkError::kInvalidName);
  }
  DispatchKey key(TruncateToCapacity, link);
  bool ok = key.append("/") && key.append(source) && key.append("_to_") &&
            key.append(target);
  if (!ok) {
    return expected<DispatchKey, LinkError>::error(LinkError::kInvalidName);
  }
  return expected<DispatchKey, LinkError>::success(key);
}

}  // namespace xlink

#endif  // XLINK_DISPATCH_KEY_HPP_
