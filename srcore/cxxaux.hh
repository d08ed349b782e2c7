// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_CXXAUX_HH__
#define __SHEETROCK_CXXAUX_HH__

#include <srcore/sysconfig.h>
#include <stddef.h>                     // NULL
#include <stdint.h>
#include <sys/types.h>                  // uint
#include <memory>
#include <string>
#include <vector>

// == Arithmetic Macros ==
#define SHEETROCK_ABS(a)                ((a) < 0 ? -(a) : (a))
#define SHEETROCK_MIN(a,b)              ((a) <= (b) ? (a) : (b))
#define SHEETROCK_MAX(a,b)              ((a) >= (b) ? (a) : (b))
#define SHEETROCK_CLAMP(v,lo,hi)        ((v) < (lo) ? (lo) : ((v) > (hi) ? (hi) : (v)))
#undef  ABS
#define ABS                             SHEETROCK_ABS
#undef  MIN
#define MIN                             SHEETROCK_MIN
#undef  MAX
#define MAX                             SHEETROCK_MAX
#undef  CLAMP
#define CLAMP                           SHEETROCK_CLAMP

// == Branch Hints ==
#define SHEETROCK_LIKELY(expr)          __builtin_expect (bool (expr), 1)
#define SHEETROCK_UNLIKELY(expr)        __builtin_expect (bool (expr), 0)

// == Preprocessor Helpers ==
#define SHEETROCK_CPP_PASTE2_(a,b)      a ## b
#define SHEETROCK_CPP_PASTE2(a,b)       SHEETROCK_CPP_PASTE2_ (a,b)     // expands __LINE__ first
#define SHEETROCK_CPP_STRINGIFY_(s)     #s
#define SHEETROCK_CPP_STRINGIFY(s)      SHEETROCK_CPP_STRINGIFY_ (s)
#define SHEETROCK_STATIC_ASSERT(expr)   static_assert (expr, #expr)

// == Compiler Attributes ==
#define SHEETROCK_PRINTF(fmt, args)     __attribute__ ((__format__ (__printf__, fmt, args)))
#define SHEETROCK_NORETURN              __attribute__ ((__noreturn__))

/// Delete copy constructor and assignment operator of @a ClassName.
#define SHEETROCK_CLASS_NON_COPYABLE(ClassName)                 \
  /*copy-ctor*/ ClassName  (const ClassName&) = delete;         \
  ClassName&    operator=  (const ClassName&) = delete

namespace Sheetrock {

// == Integer Types ==
typedef uint8_t         uint8;
typedef uint32_t        uint32;
typedef uint64_t        uint64;         ///< Microsecond timestamps and frame counters.
typedef int32_t         int32;
typedef int64_t         int64;
SHEETROCK_STATIC_ASSERT (sizeof (uint) == 4 && sizeof (uint64) == 8);

// == Standard Types ==
using   std::vector;
typedef std::string     String;
typedef vector<String>  StringVector;

/// Mix the hash @a h of another member into @a seed.
inline size_t
hash_combine (size_t seed, size_t h)
{
  return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // Sheetrock

#endif // __SHEETROCK_CXXAUX_HH__
