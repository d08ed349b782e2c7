// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "utilities.hh"
#include <glib.h>

namespace Sheetrock {

static const uint64 startup_stamp = timestamp_realtime();

/// The timestamp_realtime() value around program startup.
uint64
timestamp_startup ()
{
  return startup_stamp ? startup_stamp : timestamp_realtime();
}

/// Wall clock time in µseconds.
uint64
timestamp_realtime ()
{
  return g_get_real_time();
}

/// Render a µsecond @a stamp as seconds with six decimals.
String
timestamp_format (uint64 stamp)
{
  return string_format ("%llu.%06llu", (unsigned long long) (stamp / 1000000), (unsigned long long) (stamp % 1000000));
}

} // Sheetrock
