/**
 * @file sheetrock-core.hh
 * @brief Header file to include the core utilities of the Sheetrock namespace.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <srcore/srcore.hh>
