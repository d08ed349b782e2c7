// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_SIMULATION_HH__
#define __SHEETROCK_SIMULATION_HH__

#include <sheetrock-core.hh>

namespace Sheetrock {

/// Thresholds below which a simulation considers position, time or velocity settled.
struct Tolerance {
  double distance, time, velocity;
  explicit Tolerance (double d = 1e-3, double t = 1e-3, double v = 1e-3) : distance (d), time (t), velocity (v) {}
};

class Simulation;
typedef std::shared_ptr<Simulation> SimulationP;

/// A one-dimensional motion as a function of elapsed time in seconds.
class Simulation {
  Tolerance             tolerance_;
protected:
  explicit              Simulation      (const Tolerance &tolerance = Tolerance()) : tolerance_ (tolerance) {}
public:
  virtual              ~Simulation      () {}
  virtual double        x               (double time) const = 0;    ///< Position at @a time.
  virtual double        dx              (double time) const = 0;    ///< Velocity at @a time.
  virtual bool          is_done         (double time) const = 0;    ///< Indicates the motion has come to rest.
  const Tolerance&      tolerance       () const        { return tolerance_; }
  void                  tolerance       (const Tolerance &t) { tolerance_ = t; }
  virtual String        string          () const;
};

/// Physical parameters of a damped spring.
struct SpringDescription {
  double mass, stiffness, damping;
  SpringDescription (double m, double k, double d) : mass (m), stiffness (k), damping (d) {}
  static SpringDescription with_damping_ratio (double mass, double stiffness, double ratio = 1.0);
};

/// Motion of a damped spring that pulls from @a start towards @a end.
class SpringSimulation : public Simulation {
public:
  class Solution;
private:
  std::shared_ptr<Solution> solution_;
  double                    end_;
public:
  explicit       SpringSimulation (const SpringDescription &spring, double start, double end, double velocity,
                                   const Tolerance &tolerance = Tolerance());
  virtual double x                (double time) const override;
  virtual double dx               (double time) const override;
  virtual bool   is_done          (double time) const override;
  virtual String string           () const override;
};

/// Motion with exponentially decaying velocity, @a drag is the fraction of velocity left after one second.
class FrictionSimulation : public Simulation {
protected:
  double         drag_, log_drag_, position_, velocity_;
public:
  explicit       FrictionSimulation (double drag, double position, double velocity,
                                     const Tolerance &tolerance = Tolerance());
  virtual double x                  (double time) const override;
  virtual double dx                 (double time) const override;
  virtual bool   is_done            (double time) const override;
  double         final_x            () const;
  virtual String string             () const override;
};

/// A FrictionSimulation confined to [min, max], finishing once the bound ahead of the motion is reached.
class BoundedFrictionSimulation : public FrictionSimulation {
  double         min_, max_;
public:
  explicit       BoundedFrictionSimulation (double drag, double position, double velocity, double min, double max,
                                            const Tolerance &tolerance = Tolerance());
  virtual double x                         (double time) const override;
  virtual bool   is_done                   (double time) const override;
};

} // Sheetrock

#endif  /* __SHEETROCK_SIMULATION_HH__ */
