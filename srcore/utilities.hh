// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_UTILITIES_HH__
#define __SHEETROCK_UTILITIES_HH__

#include <srcore/inout.hh>
#include <cmath>

namespace Sheetrock {

// == Floating Point ==
/// Compare two doubles for equality within @a epsilon.
inline bool
nearly_equal (double a, double b, double epsilon = 1e-10)
{
  return std::fabs (a - b) <= epsilon;
}

/// Compare two optional doubles, NaN marks an absent value and two absent values are equal.
inline bool
optional_equals (double a, double b)
{
  return a == b || (std::isnan (a) && std::isnan (b));
}

// == Timestamps ==
uint64  timestamp_startup  ();          // µseconds
uint64  timestamp_realtime ();          // µseconds
String  timestamp_format   (uint64 stamp);

} // Sheetrock

#endif // __SHEETROCK_UTILITIES_HH__
