// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_ACTIVITY_HH__
#define __SHEETROCK_ACTIVITY_HH__

#include <sheet/extent.hh>
#include <sheet/curves.hh>
#include <sheet/simulation.hh>
#include <sheet/ticker.hh>
#include <future>

namespace Sheetrock {

class ExtentController;
class SheetActivity;
typedef std::shared_ptr<SheetActivity> SheetActivityP;

/** SheetActivity determines how the offset of a sheet evolves while it is the active activity of an ExtentController.
 * The public lifecycle methods are invoked by the controller only, they run the common
 * behaviour first and then call the protected hook of the same concern.
 * An activity is attached to at most one controller and is unusable after dispose().
 */
class SheetActivity : public virtual std::enable_shared_from_this<SheetActivity> {
  ExtentController     *owner_;
  double                offset_;
  uint                  mounted_ : 1;
  uint                  disposed_ : 1;
  SHEETROCK_CLASS_NON_COPYABLE (SheetActivity);
protected:
  explicit              SheetActivity   ();
  ExtentController&     owner           () const;
  void                  set_offset      (double offset);
  void                  correct_offset  (double offset);
  virtual void          attached        ();
  virtual void          took_over       (SheetActivity &other);
  virtual void          content_dimensions_changed  (const Size *old_content_dimensions);
  virtual void          viewport_dimensions_changed (const ViewportDimensions *old_viewport_dimensions);
  virtual void          dimensions_finalized        (const Size *old_content_dimensions,
                                                     const ViewportDimensions *old_viewport_dimensions);
  virtual void          disposing       ();
public:
  typedef Signal<void ()> SignalChanged;
  virtual              ~SheetActivity   ();
  void                  init_with       (ExtentController &owner);
  void                  take_over       (SheetActivity &other);
  void                  did_change_content_dimensions  (const Size *old_content_dimensions);
  void                  did_change_viewport_dimensions (const ViewportDimensions *old_viewport_dimensions);
  void                  did_finalize_dimensions        (const Size *old_content_dimensions,
                                                        const ViewportDimensions *old_viewport_dimensions);
  void                  dispose         ();
  double                offset          () const        { return offset_; }  ///< Current offset, NaN if none was established yet.
  bool                  mounted         () const        { return mounted_; }
  bool                  disposed        () const        { return disposed_; }
  virtual String        name            () const = 0;
  String                string          () const;
  SignalChanged         sig_changed;    ///< Notification about offset changes.
};

/// An activity that keeps the offset in place.
class IdleSheetActivity : public SheetActivity {
protected:
  virtual void          dimensions_finalized (const Size *old_content_dimensions,
                                              const ViewportDimensions *old_viewport_dimensions) override;
public:
  explicit              IdleSheetActivity    ();
  virtual String        name                 () const override { return "Idle"; }
};

/// An activity that moves the offset along a Simulation, once per frame, until it is done.
class BallisticSheetActivity : public SheetActivity {
  SimulationP           simulation_;
  TickerP               ticker_;
  void                  tick            (double elapsed);
protected:
  virtual void          attached        () override;
  virtual void          dimensions_finalized (const Size *old_content_dimensions,
                                              const ViewportDimensions *old_viewport_dimensions) override;
  virtual void          disposing       () override;
public:
  explicit              BallisticSheetActivity  (const SimulationP &simulation);
  virtual              ~BallisticSheetActivity  ();
  const SimulationP&    simulation      () const        { return simulation_; }
  virtual String        name            () const override { return "Ballistic"; }
};

/// An activity that interpolates the offset towards an Extent over a fixed duration.
class AnimatedSheetActivity : public SheetActivity {
  const double          from_;
  double                to_;
  const Extent          destination_;
  const double          duration_;
  CurveP                curve_;
  TickerP               ticker_;
  std::promise<void>    promise_;
  std::shared_future<void> done_;
  bool                  completed_;
  void                  tick            (double elapsed);
  void                  complete        ();
protected:
  virtual void          attached        () override;
  virtual void          content_dimensions_changed (const Size *old_content_dimensions) override;
  virtual void          disposing       () override;
public:
  explicit              AnimatedSheetActivity   (double from, const Extent &destination, double duration, const CurveP &curve);
  virtual              ~AnimatedSheetActivity   ();
  double                from            () const        { return from_; }
  double                to              () const        { return to_; }
  double                duration        () const        { return duration_; }
  std::shared_future<void> done         () const        { return done_; }  ///< Ready once the animation finished or was superseded.
  virtual String        name            () const override { return "Animated"; }
};

} // Sheetrock

#endif  /* __SHEETROCK_ACTIVITY_HH__ */
