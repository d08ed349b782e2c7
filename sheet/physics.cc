// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "physics.hh"
#include <algorithm>

#define PDEBUG(...)     SHEETROCK_KEY_DEBUG ("Physics", __VA_ARGS__)

namespace Sheetrock {

SheetPhysics::SheetPhysics (const SpringDescription &spring) :
  spring_ (spring)
{}

/// A slightly overdamped spring that settles without visible overshoot.
SpringDescription
SheetPhysics::default_spring ()
{
  return SpringDescription::with_damping_ratio (0.5, 100.0, 1.1);
}

// == ClampingSheetPhysics ==
ClampingSheetPhysics::ClampingSheetPhysics (const SpringDescription &spring, double drag) :
  SheetPhysics (spring), drag_ (drag)
{}

SimulationP
ClampingSheetPhysics::create_ballistic_simulation (double velocity, const SheetMetrics &metrics)
{
  const double offset = metrics.offset(), min_offset = metrics.min_offset(), max_offset = metrics.max_offset();
  if (metrics.is_out_of_bounds())
    {
      const double bound = offset < min_offset ? min_offset : max_offset;
      PDEBUG ("clamping: spring back from %g to %g (velocity=%g)", offset, bound, velocity);
      return std::make_shared<SpringSimulation> (spring_, offset, bound, velocity, tolerance_);
    }
  if (fabs (velocity) < tolerance_.velocity)
    return NULL;
  if ((velocity < 0 && offset <= min_offset) || (velocity > 0 && offset >= max_offset))
    return NULL;        // already resting against the bound ahead
  PDEBUG ("clamping: friction from %g (velocity=%g)", offset, velocity);
  return std::make_shared<BoundedFrictionSimulation> (drag_, offset, velocity, min_offset, max_offset, tolerance_);
}

SimulationP
ClampingSheetPhysics::create_settling_simulation (const SheetMetrics &metrics)
{
  if (!metrics.is_out_of_bounds())
    return NULL;
  const double offset = metrics.offset();
  const double bound = offset < metrics.min_offset() ? metrics.min_offset() : metrics.max_offset();
  PDEBUG ("clamping: settle from %g to %g", offset, bound);
  return std::make_shared<SpringSimulation> (spring_, offset, bound, 0.0, tolerance_);
}

String
ClampingSheetPhysics::string () const
{
  return string_format ("ClampingSheetPhysics(drag: %g)", drag_);
}

// == SnappingSheetPhysics ==
SnappingSheetPhysics::SnappingSheetPhysics (const vector<Extent> &snaps, const SpringDescription &spring,
                                            double fling_threshold) :
  SheetPhysics (spring), snaps_ (snaps), fling_threshold_ (fling_threshold)
{
  SHEETROCK_CRITICAL_UNLESS (!snaps_.empty());
}

vector<double>
SnappingSheetPhysics::resolve_snaps (const SheetMetrics &metrics) const
{
  vector<double> offsets;
  for (const Extent &snap : snaps_)
    offsets.push_back (snap.resolve (metrics.content_dimensions()));
  std::sort (offsets.begin(), offsets.end());
  return offsets;
}

double
SnappingSheetPhysics::nearest_snap (const vector<double> &offsets, double offset) const
{
  double nearest = offsets[0];
  for (double snap : offsets)
    if (fabs (snap - offset) < fabs (nearest - offset))
      nearest = snap;
  return nearest;
}

SimulationP
SnappingSheetPhysics::create_ballistic_simulation (double velocity, const SheetMetrics &metrics)
{
  const vector<double> offsets = resolve_snaps (metrics);
  if (offsets.empty())
    return NULL;
  const double offset = metrics.offset();
  double target;
  if (fabs (velocity) < fling_threshold_)
    target = nearest_snap (offsets, offset);
  else if (velocity > 0)
    {
      target = offsets.back();
      for (double snap : offsets)
        if (snap > offset + tolerance_.distance)
          {
            target = snap;
            break;
          }
    }
  else
    {
      target = offsets.front();
      for (auto it = offsets.rbegin(); it != offsets.rend(); ++it)
        if (*it < offset - tolerance_.distance)
          {
            target = *it;
            break;
          }
    }
  if (fabs (target - offset) < tolerance_.distance && fabs (velocity) < tolerance_.velocity)
    return NULL;
  PDEBUG ("snapping: fling from %g to %g (velocity=%g)", offset, target, velocity);
  return std::make_shared<SpringSimulation> (spring_, offset, target, velocity, tolerance_);
}

SimulationP
SnappingSheetPhysics::create_settling_simulation (const SheetMetrics &metrics)
{
  const vector<double> offsets = resolve_snaps (metrics);
  if (offsets.empty())
    return NULL;
  const double offset = metrics.offset();
  const double target = nearest_snap (offsets, offset);
  if (fabs (target - offset) < tolerance_.distance)
    return NULL;
  PDEBUG ("snapping: settle from %g to %g", offset, target);
  return std::make_shared<SpringSimulation> (spring_, offset, target, 0.0, tolerance_);
}

String
SnappingSheetPhysics::string () const
{
  StringVector sv;
  for (const Extent &snap : snaps_)
    sv.push_back (snap.string());
  return string_format ("SnappingSheetPhysics(snaps: [%s], fling_threshold: %g)", string_join (", ", sv), fling_threshold_);
}

} // Sheetrock
