#pragma once

#include <cstddef>
#include <cstdint>

#if defined(_MSC_VER)
#define VINE_FORCE_INLINE __forceinline
#define VINE_LIKELY(x) (x)
#define VINE_UNLIKELY(x) (x)
#else
#define VINE_FORCE_INLINE inline __attribute__((always_inline))
#define VINE_LIKELY(x) __builtin_expect(!!(x), 1)
#define VINE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif

namespace vine {

typedef uint8_t uint8;
typedef uint16_t uint16;
typedef uint32_t uint32;
typedef uint64_t uint64;
typedef int32_t int32;
typedef int64_t int64;

} // namespace vine
