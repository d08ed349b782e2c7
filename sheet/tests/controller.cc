// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <sheetrock-test.hh>
#include <sheet/controller.hh>
#include <unistd.h>
using namespace Sheetrock;

namespace {

/// Records the hooks invoked by the controller.
class RecordingActivity : public SheetActivity {
protected:
  virtual void
  took_over (SheetActivity &other) override
  {
    taken_from = other.name();
  }
  virtual void
  dimensions_finalized (const Size *old_content_dimensions, const ViewportDimensions *old_viewport_dimensions) override
  {
    n_finalized++;
    had_old_content = old_content_dimensions != NULL;
    if (old_content_dimensions)
      old_content = *old_content_dimensions;
  }
  virtual void
  disposing () override
  {
    n_disposed++;
  }
public:
  uint   n_finalized = 0, n_disposed = 0;
  bool   had_old_content = false;
  Size   old_content;
  String taken_from;
  virtual String name () const override { return "Recording"; }
};

/// Stays at a fixed position and never finishes.
class HoldSimulation : public Simulation {
  double position_;
public:
  explicit       HoldSimulation (double position) : position_ (position) {}
  virtual double x              (double) const override { return position_; }
  virtual double dx             (double) const override { return 0; }
  virtual bool   is_done        (double) const override { return false; }
};

struct Fixture {
  FrameScheduler    frames;
  uint64            now;
  ExtentControllerP controller;
  Fixture (const SheetPhysicsP &physics = std::make_shared<ClampingSheetPhysics>()) :
    now (1000000)
  {
    controller = std::make_shared<ExtentController> (frames, physics, Extent::pixels (0), Extent::proportional (1.0));
  }
  ~Fixture ()
  {
    if (controller && !controller->disposed())
      controller->dispose();
  }
  void
  measure ()
  {
    controller->apply_new_content_dimensions (Size (400, 600));
    controller->apply_new_viewport_dimensions (ViewportDimensions (400, 800));
  }
  void
  frame (uint64 usecs = 16000)
  {
    now += usecs;
    frames.pump_frame (now);
  }
  bool
  run_until_idle (uint max_frames = 2000)
  {
    for (uint i = 0; i < max_frames; i++)
      {
        frame();
        if (controller->activity()->name() == "Idle")
          return true;
      }
    return false;
  }
};

static bool
future_ready (const std::shared_future<void> &future)
{
  return future.wait_for (std::chrono::seconds (0)) == std::future_status::ready;
}

} // Anon

static void
test_controller_measure ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  TASSERT (!c.is_measured());
  TASSERT (!c.has_offset());
  TCMP (c.activity()->name(), ==, "Idle");
  TASSERT (c.activity()->mounted());
  uint n_changed = 0;
  c.sig_changed() += [&n_changed] () { n_changed++; };
  c.apply_new_content_dimensions (Size (400, 600));
  TCMP (c.maybe_offset(), ==, 600);       // initial extent
  TCMP (c.maybe_min_offset(), ==, 0);
  TCMP (c.maybe_max_offset(), ==, 600);
  TCMP (n_changed, ==, 1u);
  TASSERT (!c.is_measured());
  c.apply_new_viewport_dimensions (ViewportDimensions (400, 800, EdgeInsets::only_bottom (40)));
  TASSERT (c.is_measured());
  TASSERT (c.is_in_bounds());
  TCMP (c.metrics().view_offset(), ==, 640);
  TCMP (c.snapshot().offset(), ==, 600);
  TCMP (c.dimensions_batch_depth(), ==, 0u);
  TINFO ("%s", c.string());
  // bounds follow the content
  c.apply_new_content_dimensions (Size (400, 1000));
  TCMP (c.maybe_max_offset(), ==, 1000);
  f.frame();
}
REGISTER_TEST ("Controller/Measure", test_controller_measure);

static void
test_controller_viewport_noop ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  c.apply_new_content_dimensions (Size (400, 600));
  uint n_changed = 0;
  c.sig_changed() += [&n_changed] () { n_changed++; };
  const ViewportDimensions viewport (400, 800, EdgeInsets::only_bottom (20));
  c.apply_new_viewport_dimensions (viewport);
  TCMP (n_changed, ==, 1u);
  c.apply_new_viewport_dimensions (ViewportDimensions (400, 800, EdgeInsets::only_bottom (20)));
  TCMP (n_changed, ==, 1u);
  // a change that leaves offset and view offset alone is silent
  c.apply_new_viewport_dimensions (ViewportDimensions (500, 900, EdgeInsets::only_bottom (20)));
  TCMP (n_changed, ==, 1u);
  c.apply_new_viewport_dimensions (ViewportDimensions (500, 900, EdgeInsets::only_bottom (50)));
  TCMP (n_changed, ==, 2u);
  // unchanged content is ignored as well
  auto recorder = std::make_shared<RecordingActivity>();
  c.begin_activity (recorder);
  c.apply_new_content_dimensions (Size (400, 600));
  TCMP (recorder->n_finalized, ==, 0u);
  f.frame();
}
REGISTER_TEST ("Controller/Viewport No-op", test_controller_viewport_noop);

static void
test_controller_batching ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  auto recorder = std::make_shared<RecordingActivity>();
  c.begin_activity (recorder);
  TCMP (recorder->taken_from, ==, "Idle");
  TCMP (recorder->offset(), ==, 600);
  // nested batch finalizes once
  c.mark_dimensions_will_change();
  c.mark_dimensions_will_change();
  TCMP (c.dimensions_batch_depth(), ==, 2u);
  c.apply_new_content_dimensions (Size (400, 700));
  c.apply_new_viewport_dimensions (ViewportDimensions (400, 800, EdgeInsets::only_bottom (300)));
  c.apply_new_content_dimensions (Size (400, 800));
  c.mark_dimensions_changed();
  TCMP (recorder->n_finalized, ==, 0u);
  c.mark_dimensions_changed();
  TCMP (recorder->n_finalized, ==, 1u);
  TASSERT (recorder->had_old_content);
  TASSERT (recorder->old_content == Size (400, 600));        // first old value of the batch
  // single pair finalizes immediately
  c.mark_dimensions_will_change();
  c.mark_dimensions_changed();
  TCMP (recorder->n_finalized, ==, 2u);
  TASSERT (!recorder->had_old_content);
  // outside of a batch, each change finalizes on its own
  c.apply_new_content_dimensions (Size (400, 900));
  TCMP (recorder->n_finalized, ==, 3u);
  TASSERT (recorder->old_content == Size (400, 800));
  {
    DimensionsBatch batch (c);
    c.apply_new_content_dimensions (Size (400, 500));
    c.apply_new_viewport_dimensions (ViewportDimensions (400, 800));
    TCMP (recorder->n_finalized, ==, 3u);
  }
  TCMP (recorder->n_finalized, ==, 4u);
  f.frame();
  TCMP (c.dimensions_batch_depth(), ==, 0u);
}
REGISTER_TEST ("Controller/Batching", test_controller_batching);

static void
test_controller_batch_contracts ()
{
  // closing a batch that was never opened
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.controller->mark_dimensions_changed();
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  // a batch left open at the end of a frame
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.measure();
      f.controller->mark_dimensions_will_change();
      f.frame();
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  TASSERT (Test::trap_stderr().find ("mark_dimensions_will_change") != String::npos);
  // batches closed within the frame pass the check
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.measure();
      f.controller->mark_dimensions_will_change();
      f.controller->mark_dimensions_changed();
      f.frame();
      f.frame();
      _exit (0);
    }
  TASSERT (Test::trap_passed() == true);
}
REGISTER_TEST ("Controller/Batch Contracts", test_controller_batch_contracts);

static void
test_controller_unmeasured_contracts ()
{
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.controller->go_ballistic (100);
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.controller->settle();
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.controller->animate_to (Extent::pixels (10));
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.controller->apply_new_content_dimensions (Size (400, 600));
      f.controller->go_ballistic_with (std::make_shared<HoldSimulation> (0));
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.controller->metrics().offset();
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  // going idle needs no measurements
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.controller->go_idle();
      _exit (0);
    }
  TASSERT (Test::trap_passed() == true);
}
REGISTER_TEST ("Controller/Unmeasured Contracts", test_controller_unmeasured_contracts);

static void
test_controller_takeover_continuity ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  c.go_ballistic_with (std::make_shared<HoldSimulation> (100));
  TCMP (c.activity()->name(), ==, "Ballistic");
  f.frame();
  TCMP (c.maybe_offset(), ==, 100);
  SheetActivityP ballistic = c.activity();
  std::shared_future<void> done = c.animate_to (Extent::pixels (200), Curves::linear(), 0.3);
  auto animated = std::dynamic_pointer_cast<AnimatedSheetActivity> (c.activity());
  TASSERT (animated != NULL);
  TCMP (animated->from(), ==, 100);
  TCMP (animated->to(), ==, 200);
  TCMP (c.maybe_offset(), ==, 100);
  TASSERT (ballistic->disposed());
  TASSERT (!ballistic->mounted());
  TCMP (ballistic->sig_changed.n_handlers(), ==, 0u);
  TCMP (animated->sig_changed.n_handlers(), ==, 1u);
  TASSERT (!future_ready (done));
  f.frame (0);
  TCMP (c.maybe_offset(), ==, 100);
  f.frame (150000);
  TASSERT (nearly_equal (c.maybe_offset(), 150, 1e-6));
  f.frame (150000);
  TCMP (c.maybe_offset(), ==, 200);
  TASSERT (future_ready (done));
  TCMP (c.activity()->name(), ==, "Idle");
  TCMP (c.maybe_offset(), ==, 200);
  TCMP (f.frames.n_active_tickers(), ==, 0u);
}
REGISTER_TEST ("Controller/Takeover Continuity", test_controller_takeover_continuity);

static void
test_controller_begin_contracts ()
{
  // an activity that is already mounted cannot begin again
  if (Test::trap_fork_silent())
    {
      Fixture f;
      f.measure();
      f.controller->begin_activity (f.controller->activity());
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
  TASSERT (Test::trap_stderr().find ("mounted") != String::npos);
  // rejected activities leave the controller intact
  if (Test::trap_fork_silent())
    {
      debug_config_add ("fatal-warnings=0");
      Fixture f;
      f.measure();
      SheetActivityP idle = f.controller->activity();
      f.controller->begin_activity (idle);
      const bool kept = f.controller->activity() == idle && idle->mounted();
      auto used = std::make_shared<RecordingActivity>();
      f.controller->begin_activity (used);
      f.controller->go_idle();
      f.controller->begin_activity (used);
      const bool idle_again = f.controller->activity()->name() == "Idle" && f.controller->activity()->mounted();
      f.controller->apply_new_content_dimensions (Size (400, 700));
      const bool working = f.controller->maybe_max_offset() == 700 && f.controller->is_in_bounds();
      _exit (kept && idle_again && working && used->n_disposed == 1 ? 0 : 1);
    }
  TASSERT (Test::trap_passed() == true);
  TASSERT (Test::trap_stderr().find ("CRITICAL") != String::npos);
}
REGISTER_TEST ("Controller/Begin Activity Contracts", test_controller_begin_contracts);

static void
test_controller_takeover_notifies ()
{
  Fixture f;
  f.measure();
  f.controller->go_ballistic_with (std::make_shared<HoldSimulation> (420));
  f.frame();
  TCMP (f.controller->maybe_offset(), ==, 420);
  // listeners of the new controller learn about the adopted position
  ExtentControllerP next = std::make_shared<ExtentController> (f.frames, std::make_shared<ClampingSheetPhysics>(),
                                                               Extent::pixels (0), Extent::proportional (1.0));
  vector<double> seen;
  next->sig_changed() += [&seen, &next] () { seen.push_back (next->maybe_offset()); };
  next->take_over (*f.controller);
  TCMP (next->maybe_offset(), ==, 420);
  TASSERT (!seen.empty());
  TCMP (seen.back(), ==, 420);
  next->dispose();
  // adopting the position it already has is silent
  Fixture g;
  g.measure();
  ExtentControllerP same = std::make_shared<ExtentController> (g.frames, std::make_shared<ClampingSheetPhysics>(),
                                                               Extent::pixels (0), Extent::proportional (1.0));
  uint n_changed = 0;
  same->sig_changed() += [&n_changed] () { n_changed++; };
  same->take_over (*g.controller);
  TCMP (same->maybe_offset(), ==, 600);
  TCMP (n_changed, ==, 1u);
  same->dispose();
}
REGISTER_TEST ("Controller/Takeover Notifies", test_controller_takeover_notifies);

static void
test_controller_animate_noop ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  c.animate_to (Extent::pixels (150), Curves::linear(), 0.1);
  TASSERT (f.run_until_idle());
  TCMP (c.maybe_offset(), ==, 150);
  SheetActivityP idle = c.activity();
  uint n_changed = 0;
  c.sig_changed() += [&n_changed] () { n_changed++; };
  std::shared_future<void> done = c.animate_to (Extent::pixels (150));
  TASSERT (future_ready (done));
  TASSERT (c.activity() == idle);
  f.frame();
  f.frame();
  TCMP (n_changed, ==, 0u);
  TCMP (c.maybe_offset(), ==, 150);
  // a proportional target that resolves to the current offset
  TASSERT (future_ready (c.animate_to (Extent::proportional (0.25))));
  TASSERT (c.activity() == idle);
  TCMP (n_changed, ==, 0u);
}
REGISTER_TEST ("Controller/Animate No-op", test_controller_animate_noop);

static void
test_controller_animate_supersede ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  std::shared_future<void> first = c.animate_to (Extent::pixels (0), Curves::ease_in_out(), 1.0);
  f.frame (0);
  f.frame (100000);
  const double midway = c.maybe_offset();
  TCMP (midway, <, 600);
  TCMP (midway, >, 0);
  TASSERT (!future_ready (first));
  std::shared_future<void> second = c.animate_to (Extent::proportional (1.0), Curves::linear(), 0.2);
  TASSERT (future_ready (first));
  TASSERT (!future_ready (second));
  auto animated = std::dynamic_pointer_cast<AnimatedSheetActivity> (c.activity());
  TCMP (animated->from(), ==, midway);
  c.go_idle();
  TASSERT (future_ready (second));
  TCMP (c.maybe_offset(), ==, midway);
  // the target follows content changes
  std::shared_future<void> third = c.animate_to (Extent::proportional (1.0), Curves::linear(), 0.2);
  c.apply_new_content_dimensions (Size (400, 1000));
  animated = std::dynamic_pointer_cast<AnimatedSheetActivity> (c.activity());
  TCMP (animated->to(), ==, 1000);
  TASSERT (f.run_until_idle());
  TASSERT (fabs (c.maybe_offset() - 1000) < 1e-6);
  TASSERT (future_ready (third));
}
REGISTER_TEST ("Controller/Animate Supersede", test_controller_animate_supersede);

static void
test_controller_ballistic ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  c.go_ballistic_with (std::make_shared<HoldSimulation> (300));
  f.frame();
  c.go_idle();
  TCMP (c.maybe_offset(), ==, 300);
  uint n_changed = 0;
  c.sig_changed() += [&n_changed] () { n_changed++; };
  // fling upwards stops at the max bound
  c.go_ballistic (1000);
  TCMP (c.activity()->name(), ==, "Ballistic");
  TASSERT (f.run_until_idle());
  TASSERT (fabs (c.maybe_offset() - 600) < 0.01);
  TCMP (n_changed, >, 1u);
  TCMP (f.frames.n_active_tickers(), ==, 0u);
  // declined flings go idle
  SheetActivityP before = c.activity();
  c.go_ballistic (0);
  TCMP (c.activity()->name(), ==, "Idle");
  TASSERT (c.activity() != before);
  c.settle();
  TCMP (c.activity()->name(), ==, "Idle");
  // out of bounds offsets settle back
  c.go_ballistic_with (std::make_shared<HoldSimulation> (750));
  f.frame();
  TASSERT (c.is_out_of_bounds());
  c.settle();
  TCMP (c.activity()->name(), ==, "Ballistic");
  TASSERT (f.run_until_idle());
  TASSERT (fabs (c.maybe_offset() - 600) < 0.01);
}
REGISTER_TEST ("Controller/Ballistic", test_controller_ballistic);

static void
test_controller_ballistic_replans ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  c.go_ballistic_with (std::make_shared<HoldSimulation> (500));
  f.frame();
  // shrinking content leaves the sheet out of bounds, finalization settles it
  c.apply_new_content_dimensions (Size (400, 300));
  TCMP (c.activity()->name(), ==, "Ballistic");
  auto ballistic = std::dynamic_pointer_cast<BallisticSheetActivity> (c.activity());
  TASSERT (ballistic != NULL);
  TASSERT (std::dynamic_pointer_cast<SpringSimulation> (ballistic->simulation()) != NULL);
  TASSERT (f.run_until_idle());
  TASSERT (fabs (c.maybe_offset() - 300) < 0.01);
}
REGISTER_TEST ("Controller/Ballistic Replans", test_controller_ballistic_replans);

static void
test_controller_idle_rescale ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  c.animate_to (Extent::pixels (300), Curves::linear(), 0.1);
  TASSERT (f.run_until_idle());
  TCMP (c.maybe_offset(), ==, 300);
  uint n_changed = 0;
  c.sig_changed() += [&n_changed] () { n_changed++; };
  c.apply_new_content_dimensions (Size (400, 1200));
  TCMP (c.maybe_offset(), ==, 600);
  TCMP (n_changed, ==, 1u);
  c.apply_new_content_dimensions (Size (400, 200));
  TCMP (c.maybe_offset(), ==, 100);
  // the proportional position is clamped into the new bounds
  ExtentController bounded (f.frames, std::make_shared<ClampingSheetPhysics>(), Extent::pixels (50), Extent::pixels (120));
  bounded.apply_new_content_dimensions (Size (400, 100));
  TCMP (bounded.maybe_offset(), ==, 100);
  bounded.apply_new_content_dimensions (Size (400, 200));
  TCMP (bounded.maybe_offset(), ==, 120);
  bounded.dispose();
  f.frame();
}
REGISTER_TEST ("Controller/Idle Rescale", test_controller_idle_rescale);

static void
test_controller_snapping ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  const vector<Extent> snaps = { Extent::pixels (0), Extent::proportional (0.5), Extent::proportional (1.0) };
  c.set_physics (std::make_shared<SnappingSheetPhysics> (snaps));
  TASSERT (std::dynamic_pointer_cast<SnappingSheetPhysics> (c.physics()) != NULL);
  c.settle();
  TCMP (c.activity()->name(), ==, "Idle");
  c.go_ballistic (-1500);
  TASSERT (f.run_until_idle());
  TASSERT (fabs (c.maybe_offset() - 300) < 0.01);
  c.go_ballistic_with (std::make_shared<HoldSimulation> (120));
  f.frame();
  c.settle();
  TASSERT (f.run_until_idle());
  TASSERT (fabs (c.maybe_offset() - 0) < 0.01);
}
REGISTER_TEST ("Controller/Snapping", test_controller_snapping);

static void
test_controller_dispose ()
{
  Fixture f;
  ExtentController &c = *f.controller;
  f.measure();
  auto recorder = std::make_shared<RecordingActivity>();
  c.begin_activity (recorder);
  uint n_changed = 0;
  c.sig_changed() += [&n_changed] () { n_changed++; };
  c.dispose();
  TCMP (recorder->n_disposed, ==, 1u);
  TASSERT (recorder->disposed());
  TASSERT (!recorder->mounted());
  TASSERT (c.disposed());
  TASSERT (c.activity() == NULL);
  TASSERT (!c.has_offset());
  f.controller.reset();
  TCMP (recorder->n_disposed, ==, 1u);
  f.frame();
  TCMP (n_changed, ==, 0u);
  // a dropped controller disposes its activity
  ExtentControllerP dropped = std::make_shared<ExtentController> (f.frames, std::make_shared<ClampingSheetPhysics>(),
                                                                  Extent::pixels (0), Extent::pixels (100));
  auto second = std::make_shared<RecordingActivity>();
  dropped->begin_activity (second);
  dropped.reset();
  TCMP (second->n_disposed, ==, 1u);
  // superseded activities are disposed once
  Fixture g;
  g.measure();
  auto third = std::make_shared<RecordingActivity>();
  g.controller->begin_activity (third);
  g.controller->go_idle();
  g.controller->go_idle();
  TCMP (third->n_disposed, ==, 1u);
  // disposing twice is a contract violation
  if (Test::trap_fork_silent())
    {
      Fixture h;
      h.controller->dispose();
      h.controller->dispose();
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
}
REGISTER_TEST ("Controller/Dispose", test_controller_dispose);

namespace {
class ClampingFactory : public ExtentFactory {
  Extent max_;
public:
  uint n_created = 0;
  explicit ClampingFactory (const Extent &max) : max_ (max) {}
  virtual ExtentControllerP
  create (SheetContext &context) override
  {
    n_created++;
    return std::make_shared<ExtentController> (context, std::make_shared<ClampingSheetPhysics>(), Extent::pixels (0), max_);
  }
};

class FailingFactory : public ExtentFactory {
public:
  virtual ExtentControllerP
  create (SheetContext &context) override
  {
    return ExtentControllerP();
  }
};
} // Anon

static void
test_controller_takeover ()
{
  FrameScheduler frames;
  uint64 now = 1000000;
  ExtentControllerP announced;
  uint n_announced = 0;
  auto factory = std::make_shared<ClampingFactory> (Extent::proportional (1.0));
  ExtentScope scope (frames, factory);
  TCMP (factory->n_created, ==, 1u);
  ExtentControllerP first = scope.controller();
  first->apply_new_content_dimensions (Size (400, 600));
  first->apply_new_viewport_dimensions (ViewportDimensions (400, 800, EdgeInsets::only_bottom (30)));
  first->go_ballistic_with (std::make_shared<HoldSimulation> (420));
  frames.pump_frame (now += 16000);
  TCMP (first->maybe_offset(), ==, 420);
  scope.sig_controller_changed() += [&] (const ExtentControllerP &controller) { announced = controller; n_announced++; };
  // same factory, same controller
  scope.factory (factory);
  TASSERT (scope.controller() == first);
  TCMP (n_announced, ==, 0u);
  // a new factory hands the state over to a new controller
  auto other = std::make_shared<ClampingFactory> (Extent::pixels (500));
  scope.factory (other);
  ExtentControllerP second = scope.controller();
  TASSERT (second != first);
  TASSERT (announced == second);
  TCMP (n_announced, ==, 1u);
  TASSERT (first->disposed());
  TASSERT (second->is_measured());
  TCMP (second->maybe_offset(), ==, 420);
  TCMP (second->maybe_max_offset(), ==, 500);
  TASSERT (*second->maybe_viewport_dimensions() == ViewportDimensions (400, 800, EdgeInsets::only_bottom (30)));
  TCMP (second->metrics().view_offset(), ==, 450);
  TASSERT (scope.factory() == other);
  frames.pump_frame (now += 16000);
  TCMP (second->maybe_offset(), ==, 420);
  // a factory that fails to create a controller is not adopted
  if (Test::trap_fork_silent())
    {
      debug_config_add ("fatal-warnings=0");
      scope.factory (std::make_shared<FailingFactory>());
      _exit (scope.factory() == other && scope.controller() == second && !second->disposed() ? 0 : 1);
    }
  TASSERT (Test::trap_passed() == true);
  TASSERT (Test::trap_stderr().find ("controller != NULL") != String::npos);
  // controllers do not take over from themselves
  if (Test::trap_fork_silent())
    {
      second->take_over (*second);
      _exit (0);
    }
  TASSERT (Test::trap_aborted() == true);
}
REGISTER_TEST ("Controller/Scope Takeover", test_controller_takeover);

int
main (int   argc,
      char *argv[])
{
  init_core_test (__PRETTY_FILE__, &argc, argv);

  return Test::run();
}
