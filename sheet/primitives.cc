// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "primitives.hh"

namespace Sheetrock {

size_t
Size::hash () const
{
  std::hash<double> dhash;
  return hash_combine (dhash (width), dhash (height));
}

String
Size::string () const
{
  return string_format ("Size(%g, %g)", width, height);
}

size_t
EdgeInsets::hash () const
{
  std::hash<double> dhash;
  size_t h = dhash (left);
  h = hash_combine (h, dhash (top));
  h = hash_combine (h, dhash (right));
  return hash_combine (h, dhash (bottom));
}

String
EdgeInsets::string () const
{
  return string_format ("EdgeInsets(%g, %g, %g, %g)", left, top, right, bottom);
}

size_t
ViewportDimensions::hash () const
{
  std::hash<double> dhash;
  size_t h = hash_combine (dhash (width), dhash (height));
  return hash_combine (h, insets.hash());
}

String
ViewportDimensions::string () const
{
  return string_format ("ViewportDimensions(%g, %g, insets=%s)", width, height, insets.string());
}

} // Sheetrock
