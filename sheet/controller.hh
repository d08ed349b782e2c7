// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_CONTROLLER_HH__
#define __SHEETROCK_CONTROLLER_HH__

#include <sheet/activity.hh>
#include <sheet/metrics.hh>
#include <sheet/physics.hh>

namespace Sheetrock {

class ExtentController;
typedef std::shared_ptr<ExtentController> ExtentControllerP;

/** ExtentController owns the position of a sheet, its bounds and its measured dimensions.
 * The offset is provided by the active SheetActivity, transitions between activities
 * hand over the offset so motion stays continuous. Dimension changes are collected
 * in batches, see mark_dimensions_will_change().
 * The bounds dependent operations go_ballistic(), go_ballistic_with(), settle() and
 * animate_to() require is_measured().
 */
class ExtentController : public MaybeSheetMetrics {
  class MetricsRef : public SheetMetrics {
    const ExtentController &controller_;
  public:
    explicit MetricsRef (const ExtentController &controller) : controller_ (controller) {}
    virtual double                    maybe_offset              () const override { return controller_.maybe_offset(); }
    virtual double                    maybe_min_offset          () const override { return controller_.maybe_min_offset(); }
    virtual double                    maybe_max_offset          () const override { return controller_.maybe_max_offset(); }
    virtual const Size*               maybe_content_dimensions  () const override { return controller_.maybe_content_dimensions(); }
    virtual const ViewportDimensions* maybe_viewport_dimensions () const override { return controller_.maybe_viewport_dimensions(); }
  };
  struct BatchState {
    uint depth;
    bool check_pending;
    BatchState() : depth (0), check_pending (false) {}
  };
  SheetContext                 &context_;
  SheetPhysicsP                 physics_;
  const Extent                  min_extent_, max_extent_, initial_extent_;
  SheetActivityP                activity_;
  size_t                        activity_connection_;
  double                        min_offset_, max_offset_;
  Size                          content_dimensions_;
  ViewportDimensions            viewport_dimensions_;
  Size                          old_content_dimensions_;
  ViewportDimensions            old_viewport_dimensions_;
  uint                          has_content_dimensions_ : 1;
  uint                          has_viewport_dimensions_ : 1;
  uint                          content_changed_ : 1;
  uint                          viewport_changed_ : 1;
  uint                          had_old_content_dimensions_ : 1;
  uint                          had_old_viewport_dimensions_ : 1;
  uint                          disposed_ : 1;
  std::shared_ptr<BatchState>   batch_;
  MetricsRef                    metrics_;
  void                          invalidate_boundary_conditions  ();
  void                          finalize_dimensions             ();
  SHEETROCK_CLASS_NON_COPYABLE (ExtentController);
public:
  explicit                  ExtentController (SheetContext &context, const SheetPhysicsP &physics,
                                              const Extent &min_extent, const Extent &max_extent,
                                              const Extent &initial_extent = Extent::proportional (1.0));
  virtual                  ~ExtentController ();
  // metrics
  virtual double                    maybe_offset              () const override;
  virtual double                    maybe_min_offset          () const override { return min_offset_; }
  virtual double                    maybe_max_offset          () const override { return max_offset_; }
  virtual const Size*               maybe_content_dimensions  () const override;
  virtual const ViewportDimensions* maybe_viewport_dimensions () const override;
  const SheetMetrics&       metrics                 () const        { return metrics_; }
  SheetMetricsSnapshot      snapshot                () const;
  // configuration
  SheetContext&             context                 () const        { return context_; }
  const SheetPhysicsP&      physics                 () const        { return physics_; }
  void                      set_physics             (const SheetPhysicsP &physics);
  const Extent&             min_extent              () const        { return min_extent_; }
  const Extent&             max_extent              () const        { return max_extent_; }
  const Extent&             initial_extent          () const        { return initial_extent_; }
  // dimensions
  void                      apply_new_content_dimensions  (const Size &content_dimensions);
  void                      apply_new_viewport_dimensions (const ViewportDimensions &viewport_dimensions);
  void                      mark_dimensions_will_change   ();
  void                      mark_dimensions_changed       ();
  uint                      dimensions_batch_depth        () const { return batch_->depth; }
  // activities
  SheetActivityP            activity                () const        { return activity_; }
  void                      begin_activity          (const SheetActivityP &activity);
  void                      go_idle                 ();
  void                      go_ballistic            (double velocity);
  void                      go_ballistic_with       (const SimulationP &simulation);
  void                      settle                  ();
  std::shared_future<void>  animate_to              (const Extent &extent, const CurveP &curve = Curves::ease_in_out(),
                                                     double duration = 0.3);
  // lifecycle
  void                      take_over               (ExtentController &other);
  void                      dispose                 ();
  bool                      disposed                () const        { return disposed_; }
  String                    string                  () const;
  Signal<void ()>           sig_changed;            ///< Notification about changes of offset or view offset.
};

/// DimensionsBatch marks the dimensions of a controller as changing for the lifetime of the batch.
class DimensionsBatch {
  ExtentController &controller_;
  SHEETROCK_CLASS_NON_COPYABLE (DimensionsBatch);
public:
  explicit DimensionsBatch  (ExtentController &controller) : controller_ (controller) { controller_.mark_dimensions_will_change(); }
  /*dtor*/ ~DimensionsBatch ()                                                        { controller_.mark_dimensions_changed(); }
};

class ExtentFactory;
typedef std::shared_ptr<ExtentFactory> ExtentFactoryP;

/// ExtentFactory creates the controllers for an ExtentScope.
class ExtentFactory {
public:
  virtual                   ~ExtentFactory  () {}
  virtual ExtentControllerP create          (SheetContext &context) = 0;
};

/** ExtentScope keeps the controller of a host sheet in sync with its factory.
 * When the factory changes, a new controller takes over the state of the current
 * one before the current one is disposed.
 */
class ExtentScope {
  SheetContext         &context_;
  ExtentFactoryP        factory_;
  ExtentControllerP     controller_;
  SHEETROCK_CLASS_NON_COPYABLE (ExtentScope);
public:
  explicit                  ExtentScope     (SheetContext &context, const ExtentFactoryP &factory);
  virtual                  ~ExtentScope     ();
  const ExtentFactoryP&     factory         () const        { return factory_; }
  void                      factory         (const ExtentFactoryP &factory);
  const ExtentControllerP&  controller      () const        { return controller_; }
  Signal<void (const ExtentControllerP&)> sig_controller_changed; ///< Emitted with the new controller, or NULL upon destruction.
};

} // Sheetrock

#endif  /* __SHEETROCK_CONTROLLER_HH__ */
