/**
 * @file platform.hpp
 * @brief Platform detection and the internal invariant check.
 */

#ifndef SLUICE_PLATFORM_HPP_
#define SLUICE_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

#if defined(__linux__)
#define SLUICE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SLUICE_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define SLUICE_PLATFORM_WINDOWS 1
#endif

namespace sluice {
namespace detail {

/// Reports a broken internal invariant and terminates. Debug builds only.
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "[sluice] invariant violated: %s (%s:%d)\n", cond, file, line);
  std::abort();
}

}  // namespace detail
}  // namespace sluice

// Guards programmer errors (null pointers into APIs that require one).
// Runtime failures go through expected<> instead.
#ifdef NDEBUG
#define SLUICE_ASSERT(cond) ((void)0)
#else
#define SLUICE_ASSERT(cond) ((cond) ? ((void)0) : ::sluice::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // SLUICE_PLATFORM_HPP_
