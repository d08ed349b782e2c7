// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "controller.hh"

#define EDEBUG(...)     SHEETROCK_KEY_DEBUG ("Extent", __VA_ARGS__)

namespace Sheetrock {

static std::shared_future<void>
completed_future ()
{
  std::promise<void> promise;
  promise.set_value();
  return promise.get_future().share();
}

// == ExtentController ==
ExtentController::ExtentController (SheetContext &context, const SheetPhysicsP &physics,
                                    const Extent &min_extent, const Extent &max_extent,
                                    const Extent &initial_extent) :
  context_ (context), physics_ (physics),
  min_extent_ (min_extent), max_extent_ (max_extent), initial_extent_ (initial_extent),
  activity_connection_ (0), min_offset_ (NAN), max_offset_ (NAN),
  has_content_dimensions_ (false), has_viewport_dimensions_ (false),
  content_changed_ (false), viewport_changed_ (false),
  had_old_content_dimensions_ (false), had_old_viewport_dimensions_ (false),
  disposed_ (false), batch_ (std::make_shared<BatchState>()), metrics_ (*this)
{
  SHEETROCK_CRITICAL_UNLESS (physics_ != NULL);
  begin_activity (std::make_shared<IdleSheetActivity>());
}

ExtentController::~ExtentController ()
{
  if (!disposed_)
    {
      SHEETROCK_DIAG ("%p: controller destroyed without dispose()", this);
      dispose();
    }
}

double
ExtentController::maybe_offset () const
{
  return activity_ ? activity_->offset() : NAN;
}

const Size*
ExtentController::maybe_content_dimensions () const
{
  return has_content_dimensions_ ? &content_dimensions_ : NULL;
}

const ViewportDimensions*
ExtentController::maybe_viewport_dimensions () const
{
  return has_viewport_dimensions_ ? &viewport_dimensions_ : NULL;
}

/// Copy the current metrics, which must be measured.
SheetMetricsSnapshot
ExtentController::snapshot () const
{
  return SheetMetricsSnapshot::from (metrics_);
}

void
ExtentController::set_physics (const SheetPhysicsP &physics)
{
  SHEETROCK_ASSERT_RETURN (physics != NULL);
  physics_ = physics;
}

void
ExtentController::invalidate_boundary_conditions ()
{
  min_offset_ = min_extent_.resolve (content_dimensions_);
  max_offset_ = max_extent_.resolve (content_dimensions_);
}

/// Update the measured content size, bounds are resolved against it.
void
ExtentController::apply_new_content_dimensions (const Size &content_dimensions)
{
  SHEETROCK_ASSERT_RETURN (!disposed_);
  if (has_content_dimensions_ && content_dimensions_ == content_dimensions)
    return;
  if (batch_->depth == 0)
    {
      DimensionsBatch batch (*this);
      apply_new_content_dimensions (content_dimensions);
      return;
    }
  const bool had_content_dimensions = has_content_dimensions_;
  const Size old_content_dimensions = content_dimensions_;
  if (!content_changed_)
    {
      content_changed_ = true;
      had_old_content_dimensions_ = had_content_dimensions;
      old_content_dimensions_ = old_content_dimensions;
    }
  content_dimensions_ = content_dimensions;
  has_content_dimensions_ = true;
  invalidate_boundary_conditions();
  EDEBUG ("%p: content %s, bounds [%g, %g]", this, content_dimensions.string(), min_offset_, max_offset_);
  SheetActivityP activity = activity_;
  activity->did_change_content_dimensions (had_content_dimensions ? &old_content_dimensions : NULL);
}

/// Update the viewport, notifies if the offset or view offset changed as a result.
void
ExtentController::apply_new_viewport_dimensions (const ViewportDimensions &viewport_dimensions)
{
  SHEETROCK_ASSERT_RETURN (!disposed_);
  if (has_viewport_dimensions_ && viewport_dimensions_ == viewport_dimensions)
    return;
  if (batch_->depth == 0)
    {
      DimensionsBatch batch (*this);
      apply_new_viewport_dimensions (viewport_dimensions);
      return;
    }
  const bool had_viewport_dimensions = has_viewport_dimensions_;
  const ViewportDimensions old_viewport_dimensions = viewport_dimensions_;
  if (!viewport_changed_)
    {
      viewport_changed_ = true;
      had_old_viewport_dimensions_ = had_viewport_dimensions;
      old_viewport_dimensions_ = old_viewport_dimensions;
    }
  const double old_offset = maybe_offset(), old_view_offset = maybe_view_offset();
  viewport_dimensions_ = viewport_dimensions;
  has_viewport_dimensions_ = true;
  EDEBUG ("%p: viewport %s", this, viewport_dimensions.string());
  SheetActivityP activity = activity_;
  activity->did_change_viewport_dimensions (had_viewport_dimensions ? &old_viewport_dimensions : NULL);
  if (!optional_equals (old_offset, maybe_offset()) || !optional_equals (old_view_offset, maybe_view_offset()))
    sig_changed.emit();
}

/** Open a batch of dimension changes.
 * Batches nest, the active activity is told about the finalized dimensions once the
 * outermost batch is closed with mark_dimensions_changed(). Every batch must be
 * closed within the frame it was opened in.
 */
void
ExtentController::mark_dimensions_will_change ()
{
  SHEETROCK_ASSERT_RETURN (!disposed_);
  if (!batch_->check_pending)
    {
      batch_->check_pending = true;
      std::weak_ptr<BatchState> weak_batch = batch_;
      context_.add_post_frame_callback ([weak_batch] () {
          std::shared_ptr<BatchState> batch = weak_batch.lock();
          if (!batch)
            return;
          batch->check_pending = false;
          if (batch->depth != 0)
            SHEETROCK_CRITICAL ("mark_dimensions_will_change() was called %u times more than mark_dimensions_changed() in a frame",
                                batch->depth);
        });
    }
  batch_->depth++;
}

/// Close a batch opened with mark_dimensions_will_change().
void
ExtentController::mark_dimensions_changed ()
{
  SHEETROCK_ASSERT_RETURN (batch_->depth > 0);
  batch_->depth--;
  if (batch_->depth == 0)
    finalize_dimensions();
}

void
ExtentController::finalize_dimensions ()
{
  if (disposed_)
    return;
  const Size old_content_dimensions = old_content_dimensions_;
  const ViewportDimensions old_viewport_dimensions = old_viewport_dimensions_;
  const bool with_content = content_changed_ && had_old_content_dimensions_;
  const bool with_viewport = viewport_changed_ && had_old_viewport_dimensions_;
  content_changed_ = false;
  viewport_changed_ = false;
  had_old_content_dimensions_ = false;
  had_old_viewport_dimensions_ = false;
  EDEBUG ("%p: dimensions finalized, %s", this, MaybeSheetMetrics::string());
  SheetActivityP activity = activity_;
  activity->did_finalize_dimensions (with_content ? &old_content_dimensions : NULL,
                                     with_viewport ? &old_viewport_dimensions : NULL);
}

/** Make @a activity the active activity.
 * The new activity is attached and connected before it takes over from the
 * outgoing activity, which is disposed last.
 */
void
ExtentController::begin_activity (const SheetActivityP &activity)
{
  SHEETROCK_ASSERT_RETURN (activity != NULL);
  SHEETROCK_ASSERT_RETURN (!disposed_);
  SHEETROCK_ASSERT_RETURN (!activity->mounted() && !activity->disposed());
  SheetActivityP old_activity = activity_;
  if (old_activity)
    old_activity->sig_changed() -= activity_connection_;
  activity_ = activity;
  activity->init_with (*this);
  activity_connection_ = activity->sig_changed() += [this] () { sig_changed.emit(); };
  EDEBUG ("%p: begin %s activity", this, activity->name());
  if (old_activity)
    {
      activity->take_over (*old_activity);
      old_activity->dispose();
    }
}

void
ExtentController::go_idle ()
{
  begin_activity (std::make_shared<IdleSheetActivity>());
}

/// Fling with @a velocity as planned by the physics, or go idle if it declines.
void
ExtentController::go_ballistic (double velocity)
{
  SHEETROCK_ASSERT_RETURN (is_measured());
  SimulationP simulation;
  if (physics_)
    simulation = physics_->create_ballistic_simulation (velocity, metrics_);
  if (simulation)
    go_ballistic_with (simulation);
  else
    go_idle();
}

void
ExtentController::go_ballistic_with (const SimulationP &simulation)
{
  SHEETROCK_ASSERT_RETURN (is_measured());
  begin_activity (std::make_shared<BallisticSheetActivity> (simulation));
}

/// Move to the rest position chosen by the physics, or go idle if it declines.
void
ExtentController::settle ()
{
  SHEETROCK_ASSERT_RETURN (is_measured());
  SimulationP simulation;
  if (physics_)
    simulation = physics_->create_settling_simulation (metrics_);
  if (simulation)
    go_ballistic_with (simulation);
  else
    go_idle();
}

/** Animate the offset towards @a extent.
 * Returns a future that becomes ready when the animation completes or is superseded,
 * the future is ready immediately if the offset already matches @a extent.
 */
std::shared_future<void>
ExtentController::animate_to (const Extent &extent, const CurveP &curve, double duration)
{
  SHEETROCK_ASSERT_RETURN (is_measured(), completed_future());
  const double destination = extent.resolve (content_dimensions_);
  if (maybe_offset() == destination)
    return completed_future();
  auto activity = std::make_shared<AnimatedSheetActivity> (maybe_offset(), extent, duration, curve);
  begin_activity (activity);
  return activity->done();
}

/// Adopt the dimensions and the position of @a other, which this controller replaces.
void
ExtentController::take_over (ExtentController &other)
{
  SHEETROCK_ASSERT_RETURN (&other != this);
  SHEETROCK_ASSERT_RETURN (!other.disposed_ && !disposed_);
  EDEBUG ("%p: take over %p", this, &other);
  DimensionsBatch batch (*this);
  if (other.has_viewport_dimensions_)
    apply_new_viewport_dimensions (other.viewport_dimensions_);
  if (other.has_content_dimensions_)
    apply_new_content_dimensions (other.content_dimensions_);
  const double old_offset = maybe_offset(), old_view_offset = maybe_view_offset();
  SheetActivityP activity = activity_;
  activity->take_over (*other.activity_);
  if (!optional_equals (old_offset, maybe_offset()) || !optional_equals (old_view_offset, maybe_view_offset()))
    sig_changed.emit();
}

/// Dispose the active activity, the controller must not be used afterwards.
void
ExtentController::dispose ()
{
  SHEETROCK_ASSERT_RETURN (!disposed_);
  EDEBUG ("%p: dispose", this);
  disposed_ = true;
  SheetActivityP activity = activity_;
  activity_.reset();
  if (activity)
    {
      activity->sig_changed() -= activity_connection_;
      activity->dispose();
    }
}

String
ExtentController::string () const
{
  return string_format ("ExtentController(activity: %s, metrics: %s)",
                        activity_ ? activity_->string() : "null", MaybeSheetMetrics::string());
}

// == ExtentScope ==
ExtentScope::ExtentScope (SheetContext &context, const ExtentFactoryP &factory) :
  context_ (context), factory_ (factory)
{
  SHEETROCK_ASSERT (factory_ != NULL);
  controller_ = factory_->create (context_);
  SHEETROCK_ASSERT (controller_ != NULL);
}

ExtentScope::~ExtentScope ()
{
  sig_controller_changed.emit (ExtentControllerP());
  if (!controller_->disposed())
    controller_->dispose();
}

/// Replace the factory, a new controller takes over from the current one.
void
ExtentScope::factory (const ExtentFactoryP &factory)
{
  SHEETROCK_ASSERT_RETURN (factory != NULL);
  if (factory == factory_)
    return;
  ExtentControllerP old_controller = controller_;
  ExtentControllerP controller = factory->create (context_);
  SHEETROCK_ASSERT_RETURN (controller != NULL);
  factory_ = factory;
  controller->take_over (*old_controller);
  controller_ = controller;
  sig_controller_changed.emit (controller_);
  old_controller->dispose();
}

} // Sheetrock
