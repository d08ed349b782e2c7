// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_CORE_HH__
#define __SHEETROCK_CORE_HH__

#include <srcore/sysconfig.h>
#include <srcore/cxxaux.hh>
#include <srcore/strings.hh>
#include <srcore/inout.hh>
#include <srcore/utilities.hh>
#include <srcore/main.hh>
#include <srcore/signal.hh>

/**
 * @brief The Sheetrock namespace encompasses core utilities and the sheet extent machinery.
 *
 * The core utilities are available via including <sheetrock-core.hh> and
 * the sheet functionality can be included via <sheetrock.hh>.
 */
namespace Sheetrock {}

#endif // __SHEETROCK_CORE_HH__
