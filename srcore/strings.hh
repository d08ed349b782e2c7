// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_STRINGS_HH__
#define __SHEETROCK_STRINGS_HH__

#include <srcore/cxxaux.hh>

namespace Sheetrock {

String       string_cprintf     (const char *format, ...) SHEETROCK_PRINTF (1, 2);
StringVector string_split       (const String &string, const String &separators);
String       string_join        (const String &junctor, const StringVector &strings);
bool         string_to_bool     (const String &string, bool empty_default = false);
bool         string_option_find (const String &options, const String &key, String *value);

/// @cond NOT_4_DOXYGEN
namespace StringFormatter {
template<class T> inline const T& format_arg (const T &value)      { return value; }
inline const char*                format_arg (const String &value) { return value.c_str(); }
} // StringFormatter
/// @endcond

/** Format a string ala printf() in the POSIX/C locale.
 * String arguments may be passed directly for %s directives.
 */
template<class... Args> String
string_format (const char *format, const Args &...args)
{
  return string_cprintf (format, StringFormatter::format_arg (args)...);
}

} // Sheetrock

#endif // __SHEETROCK_STRINGS_HH__
