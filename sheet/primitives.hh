// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_PRIMITIVES_HH__
#define __SHEETROCK_PRIMITIVES_HH__

#include <sheetrock-core.hh>
#include <functional>

namespace Sheetrock {

/* --- Size --- */
class Size {
public:
  double width, height;
  Size (double w,
        double h) :
    width (w),
    height (h)
  {}
  explicit Size () :
    width (0),
    height (0)
  {}
  bool   operator== (const Size &s2) const { return width == s2.width && height == s2.height; }
  bool   operator!= (const Size &s2) const { return !operator== (s2); }
  size_t hash       () const;
  String string     () const;
};

/* --- EdgeInsets --- */
class EdgeInsets {
public:
  double left, top, right, bottom;
  EdgeInsets (double l,
              double t,
              double r,
              double b) :
    left (l), top (t), right (r), bottom (b)
  {}
  explicit EdgeInsets () :
    left (0), top (0), right (0), bottom (0)
  {}
  static EdgeInsets only_bottom (double b) { return EdgeInsets (0, 0, 0, b); }
  bool   operator== (const EdgeInsets &e2) const { return left == e2.left && top == e2.top && right == e2.right && bottom == e2.bottom; }
  bool   operator!= (const EdgeInsets &e2) const { return !operator== (e2); }
  size_t hash       () const;
  String string     () const;
};

/* --- ViewportDimensions --- */
/// Size of the visible area surrounding a sheet, the bottom inset is covered by e.g. an on-screen keyboard.
class ViewportDimensions {
public:
  double     width, height;
  EdgeInsets insets;
  ViewportDimensions (double w,
                      double h,
                      const EdgeInsets &i = EdgeInsets()) :
    width (w),
    height (h),
    insets (i)
  {}
  explicit ViewportDimensions () :
    width (0),
    height (0)
  {}
  bool   operator== (const ViewportDimensions &v2) const { return width == v2.width && height == v2.height && insets == v2.insets; }
  bool   operator!= (const ViewportDimensions &v2) const { return !operator== (v2); }
  size_t hash       () const;
  String string     () const;
};

} // Sheetrock

namespace std {
template<> struct hash<Sheetrock::Size> {
  size_t operator() (const Sheetrock::Size &s) const { return s.hash(); }
};
template<> struct hash<Sheetrock::EdgeInsets> {
  size_t operator() (const Sheetrock::EdgeInsets &e) const { return e.hash(); }
};
template<> struct hash<Sheetrock::ViewportDimensions> {
  size_t operator() (const Sheetrock::ViewportDimensions &v) const { return v.hash(); }
};
} // std

#endif  /* __SHEETROCK_PRIMITIVES_HH__ */
