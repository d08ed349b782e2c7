// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "simulation.hh"

namespace Sheetrock {

String
Simulation::string () const
{
  return "Simulation";
}

SpringDescription
SpringDescription::with_damping_ratio (double mass, double stiffness, double ratio)
{
  return SpringDescription (mass, stiffness, ratio * 2.0 * sqrt (mass * stiffness));
}

// == SpringSimulation ==
/* The spring equation m*x'' + c*x' + k*x = 0 has three solution families,
 * chosen by the sign of the discriminant c^2 - 4*m*k.
 */
class SpringSimulation::Solution {
public:
  virtual       ~Solution () {}
  virtual double x        (double t) const = 0;
  virtual double dx       (double t) const = 0;
  virtual String kind     () const = 0;
  static Solution* create (const SpringDescription &spring, double distance, double velocity);
};

class CriticalSolution : public SpringSimulation::Solution {
  double r_, c1_, c2_;
public:
  CriticalSolution (const SpringDescription &spring, double distance, double velocity)
  {
    r_ = -spring.damping / (2.0 * spring.mass);
    c1_ = distance;
    c2_ = velocity - r_ * distance;
  }
  virtual double x    (double t) const override { return (c1_ + c2_ * t) * exp (r_ * t); }
  virtual double dx   (double t) const override
  {
    const double power = exp (r_ * t);
    return r_ * (c1_ + c2_ * t) * power + c2_ * power;
  }
  virtual String kind () const override { return "critical"; }
};

class OverdampedSolution : public SpringSimulation::Solution {
  double r1_, r2_, c1_, c2_;
public:
  OverdampedSolution (const SpringDescription &spring, double distance, double velocity)
  {
    const double cmk = spring.damping * spring.damping - 4 * spring.mass * spring.stiffness;
    r1_ = (-spring.damping - sqrt (cmk)) / (2.0 * spring.mass);
    r2_ = (-spring.damping + sqrt (cmk)) / (2.0 * spring.mass);
    c2_ = (velocity - r1_ * distance) / (r2_ - r1_);
    c1_ = distance - c2_;
  }
  virtual double x    (double t) const override { return c1_ * exp (r1_ * t) + c2_ * exp (r2_ * t); }
  virtual double dx   (double t) const override { return c1_ * r1_ * exp (r1_ * t) + c2_ * r2_ * exp (r2_ * t); }
  virtual String kind () const override { return "overdamped"; }
};

class UnderdampedSolution : public SpringSimulation::Solution {
  double w_, r_, c1_, c2_;
public:
  UnderdampedSolution (const SpringDescription &spring, double distance, double velocity)
  {
    w_ = sqrt (4.0 * spring.mass * spring.stiffness - spring.damping * spring.damping) / (2.0 * spring.mass);
    r_ = -(spring.damping / (2.0 * spring.mass));
    c1_ = distance;
    c2_ = (velocity - r_ * distance) / w_;
  }
  virtual double x    (double t) const override
  {
    return exp (r_ * t) * (c1_ * cos (w_ * t) + c2_ * sin (w_ * t));
  }
  virtual double dx   (double t) const override
  {
    const double power = exp (r_ * t);
    const double cosine = cos (w_ * t), sine = sin (w_ * t);
    return power * (c2_ * w_ * cosine - c1_ * w_ * sine) + r_ * power * (c2_ * sine + c1_ * cosine);
  }
  virtual String kind () const override { return "underdamped"; }
};

SpringSimulation::Solution*
SpringSimulation::Solution::create (const SpringDescription &spring, double distance, double velocity)
{
  const double cmk = spring.damping * spring.damping - 4 * spring.mass * spring.stiffness;
  if (cmk == 0.0)
    return new CriticalSolution (spring, distance, velocity);
  if (cmk > 0.0)
    return new OverdampedSolution (spring, distance, velocity);
  return new UnderdampedSolution (spring, distance, velocity);
}

SpringSimulation::SpringSimulation (const SpringDescription &spring, double start, double end, double velocity,
                                    const Tolerance &tolerance) :
  Simulation (tolerance), end_ (end)
{
  SHEETROCK_ASSERT (spring.mass > 0);
  solution_ = std::shared_ptr<Solution> (Solution::create (spring, start - end, velocity));
}

double
SpringSimulation::x (double time) const
{
  return end_ + solution_->x (time);
}

double
SpringSimulation::dx (double time) const
{
  return solution_->dx (time);
}

bool
SpringSimulation::is_done (double time) const
{
  return fabs (x (time) - end_) < tolerance().distance && fabs (dx (time)) < tolerance().velocity;
}

String
SpringSimulation::string () const
{
  return string_format ("SpringSimulation(end: %g, %s)", end_, solution_->kind());
}

// == FrictionSimulation ==
FrictionSimulation::FrictionSimulation (double drag, double position, double velocity,
                                        const Tolerance &tolerance) :
  Simulation (tolerance), drag_ (drag), log_drag_ (log (drag)), position_ (position), velocity_ (velocity)
{
  SHEETROCK_ASSERT (drag > 0 && drag < 1);
}

double
FrictionSimulation::x (double time) const
{
  return position_ + velocity_ * pow (drag_, time) / log_drag_ - velocity_ / log_drag_;
}

double
FrictionSimulation::dx (double time) const
{
  return velocity_ * pow (drag_, time);
}

/// Position at which the motion comes to rest for infinite time.
double
FrictionSimulation::final_x () const
{
  return position_ - velocity_ / log_drag_;
}

bool
FrictionSimulation::is_done (double time) const
{
  return fabs (dx (time)) < tolerance().velocity;
}

String
FrictionSimulation::string () const
{
  return string_format ("FrictionSimulation(drag: %g, position: %g, velocity: %g)", drag_, position_, velocity_);
}

// == BoundedFrictionSimulation ==
BoundedFrictionSimulation::BoundedFrictionSimulation (double drag, double position, double velocity, double min, double max,
                                                      const Tolerance &tolerance) :
  FrictionSimulation (drag, position, velocity, tolerance), min_ (min), max_ (max)
{
  SHEETROCK_ASSERT (min <= max);
}

double
BoundedFrictionSimulation::x (double time) const
{
  return CLAMP (FrictionSimulation::x (time), min_, max_);
}

bool
BoundedFrictionSimulation::is_done (double time) const
{
  if (FrictionSimulation::is_done (time))
    return true;
  const double p = x (time);
  if (velocity_ < 0)
    return fabs (p - min_) < tolerance().distance;
  return fabs (p - max_) < tolerance().distance;
}

} // Sheetrock
