// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_PHYSICS_HH__
#define __SHEETROCK_PHYSICS_HH__

#include <sheet/extent.hh>
#include <sheet/metrics.hh>
#include <sheet/simulation.hh>

namespace Sheetrock {

class SheetPhysics;
typedef std::shared_ptr<SheetPhysics> SheetPhysicsP;

/** SheetPhysics decides how a sheet moves after a fling or when it needs to come to rest.
 * Both factory methods may return NULL to decline, the sheet then stays where it is.
 */
class SheetPhysics {
protected:
  SpringDescription     spring_;
  Tolerance             tolerance_;
  explicit              SheetPhysics    (const SpringDescription &spring);
public:
  virtual              ~SheetPhysics    () {}
  virtual SimulationP   create_ballistic_simulation (double velocity, const SheetMetrics &metrics) = 0;
  virtual SimulationP   create_settling_simulation  (const SheetMetrics &metrics) = 0;
  const SpringDescription& spring       () const        { return spring_; }
  const Tolerance&      tolerance       () const        { return tolerance_; }
  virtual String        string          () const = 0;
  static SpringDescription default_spring ();
};

/// Keeps the sheet within its bounds, flings decelerate and stop at the bounds.
class ClampingSheetPhysics : public SheetPhysics {
  double                drag_;
public:
  explicit              ClampingSheetPhysics (const SpringDescription &spring = default_spring(), double drag = 0.135);
  virtual SimulationP   create_ballistic_simulation (double velocity, const SheetMetrics &metrics) override;
  virtual SimulationP   create_settling_simulation  (const SheetMetrics &metrics) override;
  virtual String        string          () const override;
};

/// Moves the sheet between a set of snap extents.
class SnappingSheetPhysics : public SheetPhysics {
  vector<Extent>        snaps_;
  double                fling_threshold_;
  vector<double>        resolve_snaps   (const SheetMetrics &metrics) const;
  double                nearest_snap    (const vector<double> &offsets, double offset) const;
public:
  explicit              SnappingSheetPhysics (const vector<Extent> &snaps,
                                              const SpringDescription &spring = default_spring(),
                                              double fling_threshold = 500);
  virtual SimulationP   create_ballistic_simulation (double velocity, const SheetMetrics &metrics) override;
  virtual SimulationP   create_settling_simulation  (const SheetMetrics &metrics) override;
  const vector<Extent>& snaps           () const        { return snaps_; }
  virtual String        string          () const override;
};

} // Sheetrock

#endif  /* __SHEETROCK_PHYSICS_HH__ */
