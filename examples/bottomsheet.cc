// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <sheetrock.hh>

namespace {
using namespace Sheetrock;

static const uint64 frame_interval = 16667;     // 60Hz

static uint64
run_frames (FrameScheduler &frames, uint64 now, ExtentController &controller, const char *what)
{
  printout ("%s:\n", what);
  for (uint i = 0; i < 600 && !frames.idle(); i++)
    {
      now += frame_interval;
      frames.pump_frame (now);
      printout ("  %s  %-9s offset=%7.2f  view_offset=%7.2f\n", timestamp_format (now),
                controller.activity()->name(), controller.maybe_offset(), controller.maybe_view_offset());
    }
  return now;
}

extern "C" int
main (int   argc,
      char *argv[])
{
  /* initialize the core with application name */
  init_core ("BottomSheet", &argc, argv);

  /* a sheet that snaps to closed, half open and fully open */
  FrameScheduler frames;
  uint64 now = timestamp_realtime();
  const vector<Extent> snaps = { Extent::pixels (0), Extent::proportional (0.5), Extent::proportional (1.0) };
  ExtentController controller (frames, std::make_shared<SnappingSheetPhysics> (snaps),
                               Extent::pixels (0), Extent::proportional (1.0), Extent::proportional (0.5));

  /* the host measures content and viewport within the same frame */
  {
    DimensionsBatch batch (controller);
    controller.apply_new_content_dimensions (Size (360, 480));
    controller.apply_new_viewport_dimensions (ViewportDimensions (360, 720));
  }
  printout ("measured: %s\n", controller.snapshot().string());
  now = run_frames (frames, now, controller, "layout");

  /* an on-screen keyboard pushes the sheet up */
  controller.apply_new_viewport_dimensions (ViewportDimensions (360, 720, EdgeInsets::only_bottom (260)));
  printout ("keyboard: view_offset=%g\n", controller.maybe_view_offset());
  controller.apply_new_viewport_dimensions (ViewportDimensions (360, 720));

  /* fling upwards, the sheet snaps fully open */
  controller.go_ballistic (1200);
  now = run_frames (frames, now, controller, "fling");

  /* close it with an animation */
  std::shared_future<void> done = controller.animate_to (Extent::pixels (0), Curves::fast_out_slow_in(), 0.25);
  now = run_frames (frames, now, controller, "animate");
  done.wait();

  printout ("final: %s\n", controller.string());
  controller.dispose();
  return 0;
}

} // anon
