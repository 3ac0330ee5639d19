#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define ADBANDIT_STRONG_INLINE inline __attribute__((always_inline))
#else
#define ADBANDIT_STRONG_INLINE inline
#endif
