#pragma once

/// Cross-compiler force-inline
#if defined(_MSC_VER)
#   define GK_FORCE_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#   define GK_FORCE_INLINE inline __attribute__((always_inline))
#else
#   define GK_FORCE_INLINE inline
#endif

