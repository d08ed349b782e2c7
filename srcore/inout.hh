// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_INOUT_HH__
#define __SHEETROCK_INOUT_HH__

#include <srcore/strings.hh>

#ifdef  __FILE_DIR__
#define SHEETROCK_PRETTY_FILE                   (__FILE_DIR__ "/" __FILE__)
#else
#define SHEETROCK_PRETTY_FILE                   (__FILE__)
#endif

namespace Sheetrock {

// == Basic I/O ==
template<class... Args> void printout (const char *format, const Args &...args) SHEETROCK_PRINTF (1, 0);
template<class... Args> void printerr (const char *format, const Args &...args) SHEETROCK_PRINTF (1, 0);

// == Debug Configuration ==
void   debug_config_add  (const String &option);
void   debug_config_del  (const String &key);
String debug_config_get  (const String &key, const String &default_value = "");
bool   debug_config_bool (const String &key, bool default_value = false);
bool   debug_key_enabled (const char *key);
bool   debug_devel_check ();

// == Debugging Macros ==
#define SHEETROCK_KEY_DEBUG(key,...)       do { if (SHEETROCK_UNLIKELY (Sheetrock::debug_key_enabled (key))) Sheetrock::debug_message ('D', SHEETROCK_PRETTY_FILE, __LINE__, Sheetrock::string_format (__VA_ARGS__), key); } while (0)
#define SHEETROCK_DIAG(...)                do { Sheetrock::debug_message ('G', SHEETROCK_PRETTY_FILE, __LINE__, Sheetrock::string_format (__VA_ARGS__)); } while (0)
#define SHEETROCK_CRITICAL(...)            do { Sheetrock::debug_message ('C', SHEETROCK_PRETTY_FILE, __LINE__, Sheetrock::string_format (__VA_ARGS__)); } while (0)
#define SHEETROCK_CRITICAL_UNLESS(cond)    do { if (SHEETROCK_LIKELY (cond)) break; Sheetrock::debug_message ('C', SHEETROCK_PRETTY_FILE, __LINE__, "assertion failed: " #cond); } while (0)
#define SHEETROCK_ASSERT_RETURN(cond, ...) do { if (SHEETROCK_LIKELY (cond)) break; Sheetrock::debug_message ('C', SHEETROCK_PRETTY_FILE, __LINE__, "assertion failed: " #cond); return __VA_ARGS__; } while (0)
#define SHEETROCK_ASSERT(cond)             do { if (SHEETROCK_LIKELY (cond)) break; Sheetrock::debug_fatal (SHEETROCK_PRETTY_FILE, __LINE__, "assertion failed: " #cond); } while (0)
#define SHEETROCK_ASSERT_UNREACHED()       do { Sheetrock::debug_fatal (SHEETROCK_PRETTY_FILE, __LINE__, "line must not be reached"); } while (0)
#define SHEETROCK_FATAL(...)               do { Sheetrock::debug_fatal (SHEETROCK_PRETTY_FILE, __LINE__, Sheetrock::string_format (__VA_ARGS__)); } while (0)

/** @def SHEETROCK_ASSERT_RETURN(condition [, rvalue])
 * Issue a critical and return @a rvalue from the current function if @a condition is false.
 * Criticals abort the program when the debug option "fatal-warnings" is enabled.
 */

// == Convenience Macros ==
#ifdef SHEETROCK_CONVENIENCE
#define __PRETTY_FILE__  SHEETROCK_PRETTY_FILE
#define assert_return    SHEETROCK_ASSERT_RETURN
#define assert_unreached SHEETROCK_ASSERT_UNREACHED
#define critical         SHEETROCK_CRITICAL
#define critical_unless  SHEETROCK_CRITICAL_UNLESS
#define fatal            SHEETROCK_FATAL
#endif // SHEETROCK_CONVENIENCE

/// @cond NOT_4_DOXYGEN
void printout_string (const String &string);
void printerr_string (const String &string);
void debug_message   (char kind, const char *file, int line, const String &message, const char *key = NULL);
void debug_fatal     (const char *file, int line, const String &message) SHEETROCK_NORETURN;
/// @endcond

/// Print a message on stdout (and flush stdout) ala printf(), using the POSIX/C locale.
template<class... Args> void
printout (const char *format, const Args &...args)
{
  printout_string (string_format (format, args...));
}

/// Print a message on stderr (and flush stderr) ala printf(), using the POSIX/C locale.
template<class... Args> void
printerr (const char *format, const Args &...args)
{
  printerr_string (string_format (format, args...));
}

} // Sheetrock

#endif // __SHEETROCK_INOUT_HH__
