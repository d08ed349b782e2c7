// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "extent.hh"

namespace Sheetrock {

Extent::Extent (Kind kind, double value) :
  kind_ (kind), value_ (value)
{
  SHEETROCK_ASSERT (value >= 0);
}

/// Create an Extent of a fixed, non-negative distance.
Extent
Extent::pixels (double pixels)
{
  return Extent (FIXED, pixels);
}

/// Create an Extent that covers a non-negative @a fraction of the content height.
Extent
Extent::proportional (double fraction)
{
  return Extent (PROPORTIONAL, fraction);
}

/// Resolve into a pixel offset, FIXED extents ignore @a content_dimensions.
double
Extent::resolve (const Size &content_dimensions) const
{
  switch (kind_)
    {
    case FIXED:
      return value_;
    case PROPORTIONAL:
      return value_ * content_dimensions.height;
    }
  SHEETROCK_ASSERT_UNREACHED();
}

size_t
Extent::hash () const
{
  return hash_combine (std::hash<int>() (kind_), std::hash<double>() (value_));
}

String
Extent::string () const
{
  if (kind_ == FIXED)
    return string_format ("Extent::pixels(%g)", value_);
  return string_format ("Extent::proportional(%g)", value_);
}

} // Sheetrock
