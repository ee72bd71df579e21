/**
 * @file platform.hpp
 * @brief Host detection, branch hint and debug assertion used by the
 *        pathway, endpoint and router headers.
 */

#ifndef XLINK_PLATFORM_HPP_
#define XLINK_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

// Selects the timestamp source in log.hpp.
#if defined(__linux__)
#define XLINK_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define XLINK_PLATFORM_MACOS 1
#endif

/// Marks the error branches of the send / claim fast paths.
#if defined(__GNUC__) || defined(__clang__)
#define XLINK_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define XLINK_UNLIKELY(x) (x)
#endif

namespace xlink {

/// Claim flags in ClaimSlot are aligned to this so that concurrent Take()
/// calls on neighbouring slots do not share a line.
static constexpr size_t kCacheLineSize = 64;

namespace detail {

/**
 * @brief Report a broken precondition (null name pointer, index out of
 *        range) and abort. Routing errors never come through here; they are
 *        returned as LinkError.
 */
[[noreturn]] inline void AssertFail(const char* cond, const char* file,
                                    int line) {
  (void)std::fprintf(stderr, "xlink: precondition '%s' violated at %s:%d\n",
                     cond, file, line);
  std::abort();
}

}  // namespace detail

}  // namespace xlink

#ifdef NDEBUG
#define XLINK_ASSERT(cond) ((void)0)
#else
#define XLINK_ASSERT(cond) \
  ((cond) ? ((void)0) : ::xlink::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // XLINK_PLATFORM_HPP_
