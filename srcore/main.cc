// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "main.hh"
#include <errno.h>
#include <string.h>
#include <glib.h>

namespace Sheetrock {

static String program_ident_;
static bool   core_initialized_ = false;

String
sheetrock_version ()
{
  return SHEETROCK_VERSION;
}

/** Remove every occurrence of @a option from @a argv.
 * Returns whether @a option was present, @a argcp is updated accordingly.
 */
bool
arg_parse_option (int *argcp, char **argv, const char *option)
{
  if (!argcp || !argv || *argcp < 1)
    return false;
  bool found = false;
  int j = 1;
  for (int i = 1; i < *argcp; i++)
    if (argv[i] && strcmp (argv[i], option) == 0)
      found = true;
    else
      argv[j++] = argv[i];
  for (int i = j; i < *argcp; i++)
    argv[i] = NULL;
  *argcp = j;
  return found;
}

/** Initialize the Sheetrock core for the program @a app_ident.
 * The program alias is taken from @a argv[0]. Settings in @a args are applied with
 * debug_config_add(), and "--fatal-warnings" is removed from @a argv, it turns criticals
 * from Sheetrock and glib into fatal errors. Repeated calls are ignored.
 */
void
init_core (const String &app_ident, int *argcp, char **argv, const StringVector &args)
{
  if (core_initialized_)
    {
      SHEETROCK_DIAG ("%s: ignoring repeated initialization for: %s", __func__, app_ident);
      return;
    }
  SHEETROCK_ASSERT (!app_ident.empty());
  core_initialized_ = true;
  program_ident_ = app_ident;
  const char *argv0 = argcp && *argcp > 0 && argv && argv[0] && argv[0][0] ? argv[0] : app_ident.c_str();
  gchar *prgname = g_path_get_basename (argv0);
  g_set_prgname (prgname);
  g_free (prgname);
  for (const String &setting : args)
    debug_config_add (setting);
  if (arg_parse_option (argcp, argv, "--fatal-warnings"))
    debug_config_add ("fatal-warnings");
  if (debug_config_bool ("fatal-warnings"))
    g_log_set_always_fatal (GLogLevelFlags (G_LOG_FATAL_MASK | G_LOG_LEVEL_WARNING | G_LOG_LEVEL_CRITICAL));
  SHEETROCK_KEY_DEBUG ("StartUp", "initialized %s (sheetrock-%s)", app_ident, sheetrock_version());
}

bool
init_core_initialized ()
{
  return core_initialized_;
}

/// The identifier passed to init_core().
String
program_ident ()
{
  return program_ident_;
}

/// Short program name, usually the last component of argv[0].
String
program_alias ()
{
  const char *prgname = g_get_prgname();
  return prgname ? prgname : program_invocation_short_name;
}

} // Sheetrock
