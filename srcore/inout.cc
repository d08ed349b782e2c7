// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "inout.hh"
#include "utilities.hh"
#include "main.hh"
#include <unistd.h>
#include <stdio.h>
#include <stdlib.h>
#include <atomic>
#include <map>
#include <mutex>
#include <glib.h>

namespace Sheetrock {

// == Basic I/O ==
void
printout_string (const String &string)
{
  fflush (stderr);
  fputs (string.c_str(), stdout);
  fflush (stdout);
}

void
printerr_string (const String &string)
{
  fflush (stdout);
  fputs (string.c_str(), stderr);
  fflush (stderr);
}

// == Debug Configuration ==
static std::mutex               config_mutex;
static std::map<String, String> config_overrides;
static std::atomic<bool>        config_overridden (false);

static String
config_environment ()
{
  const char *env = g_getenv ("SHEETROCK_DEBUG");
  return env ? env : "";
}

static bool
config_lookup (const String &key, String *value)
{
  {
    std::lock_guard<std::mutex> locker (config_mutex);
    auto it = config_overrides.find (key);
    if (it != config_overrides.end())
      {
        *value = it->second;
        return true;
      }
  }
  if (string_option_find (config_environment(), key, value))
    return true;
  const String defaults = string_format ("devel=%d", SHEETROCK_ENABLE_DEVEL_MODE);
  return string_option_find (defaults, key, value);
}

/// Override a debug option, @a option is "key=value" or just "key" to enable it.
void
debug_config_add (const String &option)
{
  const size_t eq = option.find ('=');
  const String key = option.substr (0, eq);
  if (key.empty())
    return;
  std::lock_guard<std::mutex> locker (config_mutex);
  config_overrides[key] = eq == String::npos ? "1" : option.substr (eq + 1);
  config_overridden = true;
}

/// Remove an override set with debug_config_add().
void
debug_config_del (const String &key)
{
  std::lock_guard<std::mutex> locker (config_mutex);
  config_overrides.erase (key);
}

/** Query debug option @a key.
 * Overrides from debug_config_add() are consulted first, then the colon separated
 * list in $SHEETROCK_DEBUG, then the built-in defaults.
 */
String
debug_config_get (const String &key, const String &default_value)
{
  String value;
  return config_lookup (key, &value) ? value : default_value;
}

bool
debug_config_bool (const String &key, bool default_value)
{
  String value;
  return config_lookup (key, &value) ? string_to_bool (value, default_value) : default_value;
}

/// Check whether debugging messages for @a key are enabled, either by @a key itself or by "all".
bool
debug_key_enabled (const char *key)
{
  static const bool env_debugging = !config_environment().empty();
  if (!env_debugging && !config_overridden)
    return false;
  String value;
  if (config_lookup (key, &value) || config_lookup ("all", &value))
    return string_to_bool (value);
  return false;
}

/// Check whether development diagnostics are enabled, see SHEETROCK_DIAG().
bool
debug_devel_check ()
{
  return debug_config_bool ("devel");
}

// == Messages ==
static String
source_location (const char *file, int line)
{
  if (!file)
    return "";
  return line >= 0 ? string_format ("%s:%d: ", file, line) : string_format ("%s: ", file);
}

/** Print a message of @a kind on stderr.
 * Kinds are 'D' for debugging, 'G' for development diagnostics, 'C' for criticals
 * and 'F' for fatal errors. Criticals turn fatal with "fatal-warnings".
 */
void
debug_message (char kind, const char *file, int line, const String &message, const char *key)
{
  const double elapsed = (timestamp_realtime() - timestamp_startup()) / 1000000.0;
  switch (kind)
    {
    case 'D':
      printerr ("[%11.6f] %s: %s\n", elapsed, key ? key : "debug", message);
      break;
    case 'G':
      if (debug_devel_check())
        printerr ("[%11.6f] %sDIAG: %s\n", elapsed, source_location (file, line), message);
      break;
    case 'C':
    case 'F':
      {
        const bool aborting = kind == 'F' || debug_config_bool ("fatal-warnings");
        printerr ("%s%s[%d]: %s: %s\n", source_location (file, line), program_alias(), int (getpid()),
                  kind == 'F' ? "FATAL" : "CRITICAL", message);
        if (aborting)
          {
            printerr ("Aborting...\n");
            abort();
          }
      }
      break;
    }
}

void
debug_fatal (const char *file, int line, const String &message)
{
  debug_message ('F', file, line, message);
  abort();      // not reached
}

} // Sheetrock
