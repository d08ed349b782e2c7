/**
 * @file sheetrock.hh
 * @brief Header file to use the Sheetrock bottom sheet motion library.
 *
 * Including this will include all parts of the Sheetrock namespace, if
 * only the core parts are needed, see <sheetrock-core.hh>.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <sheetrock-core.hh>
#include <sheet/controller.hh>
