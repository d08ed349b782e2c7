// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_CURVES_HH__
#define __SHEETROCK_CURVES_HH__

#include <sheetrock-core.hh>

namespace Sheetrock {

class Curve;
typedef std::shared_ptr<const Curve> CurveP;

/// An easing function that maps animation progress in [0, 1] onto [0, 1] with fixed end points.
class Curve {
protected:
  virtual double transform_internal (double t) const = 0;
public:
  virtual       ~Curve     () {}
  double        transform  (double t) const;
  virtual String string    () const = 0;
};

/// A cubic bezier curve through (0, 0) and (1, 1) with control points (a, b) and (c, d).
class Cubic : public Curve {
  double a_, b_, c_, d_;
  static double evaluate_cubic (double a, double b, double m);
protected:
  virtual double transform_internal (double t) const override;
public:
  explicit       Cubic              (double a, double b, double c, double d);
  virtual String string             () const override;
};

/// Frequently used curves, shared instances.
namespace Curves {
CurveP linear           ();
CurveP ease             ();
CurveP ease_in          ();
CurveP ease_out         ();
CurveP ease_in_out      ();
CurveP fast_out_slow_in ();
CurveP decelerate       ();
} // Curves

} // Sheetrock

#endif  /* __SHEETROCK_CURVES_HH__ */
