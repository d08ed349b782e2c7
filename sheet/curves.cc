// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "curves.hh"

namespace Sheetrock {

/// Map @a t in [0, 1], the end points are returned unaltered.
double
Curve::transform (double t) const
{
  SHEETROCK_ASSERT_RETURN (t >= 0 && t <= 1, CLAMP (t, 0.0, 1.0));
  if (t == 0.0 || t == 1.0)
    return t;
  return transform_internal (t);
}

// == Cubic ==
static const double cubic_error_bound = 0.001;

Cubic::Cubic (double a, double b, double c, double d) :
  a_ (a), b_ (b), c_ (c), d_ (d)
{}

double
Cubic::evaluate_cubic (double a, double b, double m)
{
  return 3 * a * (1 - m) * (1 - m) * m + 3 * b * (1 - m) * m * m + m * m * m;
}

double
Cubic::transform_internal (double t) const
{
  // bisect for the curve parameter whose x coordinate is t
  double start = 0.0, end = 1.0;
  while (true)
    {
      const double midpoint = (start + end) / 2;
      const double estimate = evaluate_cubic (a_, c_, midpoint);
      if (fabs (t - estimate) < cubic_error_bound)
        return evaluate_cubic (b_, d_, midpoint);
      if (estimate < t)
        start = midpoint;
      else
        end = midpoint;
    }
}

String
Cubic::string () const
{
  return string_format ("Cubic(%g, %g, %g, %g)", a_, b_, c_, d_);
}

// == Curves ==
namespace Curves {

class Linear : public Curve {
protected:
  virtual double transform_internal (double t) const override { return t; }
public:
  virtual String string             () const override { return "Curves::linear"; }
};

class Decelerate : public Curve {
protected:
  virtual double
  transform_internal (double t) const override
  {
    t = 1.0 - t;
    return 1.0 - t * t;
  }
public:
  virtual String string () const override { return "Curves::decelerate"; }
};

CurveP
linear ()
{
  static const CurveP curve = std::make_shared<Linear>();
  return curve;
}

CurveP
ease ()
{
  static const CurveP curve = std::make_shared<Cubic> (0.25, 0.1, 0.25, 1.0);
  return curve;
}

CurveP
ease_in ()
{
  static const CurveP curve = std::make_shared<Cubic> (0.42, 0.0, 1.0, 1.0);
  return curve;
}

CurveP
ease_out ()
{
  static const CurveP curve = std::make_shared<Cubic> (0.0, 0.0, 0.58, 1.0);
  return curve;
}

CurveP
ease_in_out ()
{
  static const CurveP curve = std::make_shared<Cubic> (0.42, 0.0, 0.58, 1.0);
  return curve;
}

CurveP
fast_out_slow_in ()
{
  static const CurveP curve = std::make_shared<Cubic> (0.4, 0.0, 0.2, 1.0);
  return curve;
}

CurveP
decelerate ()
{
  static const CurveP curve = std::make_shared<Decelerate>();
  return curve;
}

} // Curves

} // Sheetrock
