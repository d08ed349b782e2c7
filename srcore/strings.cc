// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "strings.hh"
#include <locale.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <glib.h>

namespace Sheetrock {

static locale_t
posix_locale ()
{
  static locale_t clocale = newlocale (LC_ALL_MASK, "C", NULL);
  return clocale;
}

/// Formatted printing ala printf() into a String, numbers use the POSIX/C locale.
String
string_cprintf (const char *format, ...)
{
  const locale_t saved = uselocale (posix_locale());
  va_list args;
  va_start (args, format);
  gchar *cstr = g_strdup_vprintf (format, args);
  va_end (args);
  uselocale (saved);
  const String result = cstr ? cstr : "";
  g_free (cstr);
  return result;
}

/// Split @a string at every character contained in @a separators, empty fields are kept.
StringVector
string_split (const String &string, const String &separators)
{
  StringVector fields;
  size_t start = 0;
  for (;;)
    {
      const size_t pos = string.find_first_of (separators, start);
      if (pos == String::npos)
        break;
      fields.push_back (string.substr (start, pos - start));
      start = pos + 1;
    }
  fields.push_back (string.substr (start));
  return fields;
}

String
string_join (const String &junctor, const StringVector &strings)
{
  String result;
  for (size_t i = 0; i < strings.size(); i++)
    {
      if (i)
        result += junctor;
      result += strings[i];
    }
  return result;
}

/** Interpret @a string as boolean.
 * Numbers are true if non-zero, "on" and "off" are recognized, other words
 * are true if they start like "yes" or "true".
 */
bool
string_to_bool (const String &string, bool empty_default)
{
  gchar *word = g_strstrip (g_strdup (string.c_str()));
  bool result;
  if (!word[0])
    result = empty_default;
  else if (g_ascii_isdigit (word[0]) || ((word[0] == '-' || word[0] == '+') && g_ascii_isdigit (word[1])))
    result = g_ascii_strtoll (word, NULL, 10) != 0;
  else if (g_ascii_strncasecmp (word, "on", 2) == 0)
    result = true;
  else if (g_ascii_strncasecmp (word, "off", 3) == 0)
    result = false;
  else
    result = strchr ("YyTt", word[0]) != NULL;
  g_free (word);
  return result;
}

/** Look up @a key in a list of options separated by ':' or ';'.
 * An option is either "key" or "key=value", later occurrences override earlier ones.
 * On success, @a value receives the option value, "1" for a bare key.
 */
bool
string_option_find (const String &options, const String &key, String *value)
{
  bool found = false;
  for (const String &option : string_split (options, ":;"))
    {
      const size_t eq = option.find ('=');
      if (option.compare (0, eq, key) != 0)
        continue;
      found = true;
      if (value)
        *value = eq == String::npos ? "1" : option.substr (eq + 1);
    }
  return found;
}

} // Sheetrock
