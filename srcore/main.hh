// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_MAIN_HH__
#define __SHEETROCK_MAIN_HH__

#include <srcore/utilities.hh>

namespace Sheetrock {

// == Initialization ==
void    init_core               (const String &app_ident, int *argcp, char **argv,
                                 const StringVector &args = StringVector());
bool    init_core_initialized   ();
bool    arg_parse_option        (int *argcp, char **argv, const char *option);
String  sheetrock_version       ();

// == Process Info ==
String  program_alias           ();
String  program_ident           ();

} // Sheetrock

#endif // __SHEETROCK_MAIN_HH__
