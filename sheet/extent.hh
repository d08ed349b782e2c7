// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_EXTENT_HH__
#define __SHEETROCK_EXTENT_HH__

#include <sheet/primitives.hh>

namespace Sheetrock {

/** Extent describes a visible portion of a sheet that resolves into a pixel offset.
 * A FIXED extent is an absolute distance, a PROPORTIONAL extent is a fraction of
 * the content height. Extents are immutable values compared structurally.
 */
class Extent {
public:
  enum Kind {
    FIXED,              ///< Absolute distance in pixels.
    PROPORTIONAL,       ///< Fraction of the content height.
  };
private:
  Kind          kind_;
  double        value_;
  explicit      Extent          (Kind kind, double value);
public:
  static Extent pixels          (double pixels);
  static Extent proportional    (double fraction);
  Kind          kind            () const        { return kind_; }
  double        value           () const        { return value_; }
  double        resolve         (const Size &content_dimensions) const;
  bool          operator==      (const Extent &other) const { return kind_ == other.kind_ && value_ == other.value_; }
  bool          operator!=      (const Extent &other) const { return !operator== (other); }
  size_t        hash            () const;
  String        string          () const;
};

} // Sheetrock

namespace std {
template<> struct hash<Sheetrock::Extent> {
  size_t operator() (const Sheetrock::Extent &e) const { return e.hash(); }
};
} // std

#endif  /* __SHEETROCK_EXTENT_HH__ */
