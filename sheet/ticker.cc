// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "ticker.hh"

#define FDEBUG(...)     SHEETROCK_KEY_DEBUG ("Frames", __VA_ARGS__)

namespace Sheetrock {

class FrameScheduler::FrameTicker : public Ticker {
  TickSlot      callback_;
  uint64        start_usecs_;
  bool          active_, started_;
public:
  explicit
  FrameTicker (const TickSlot &callback) :
    callback_ (callback), start_usecs_ (0), active_ (false), started_ (false)
  {}
  virtual void
  start () override
  {
    SHEETROCK_ASSERT_RETURN (!active_);
    active_ = true;
    started_ = false;
  }
  virtual void
  stop () override
  {
    active_ = false;
  }
  virtual bool
  active () const override
  {
    return active_;
  }
  void
  tick (uint64 frame_usecs)
  {
    if (!started_)
      {
        start_usecs_ = frame_usecs;
        started_ = true;
      }
    TickSlot callback = callback_;      // the ticker may be stopped or released from within
    callback ((frame_usecs - start_usecs_) / 1000000.0);
  }
};

FrameScheduler::FrameScheduler() :
  frame_usecs_ (0), n_frames_ (0)
{}

FrameScheduler::~FrameScheduler()
{
  if (!post_frame_callbacks_.empty())
    FDEBUG ("%p: discarding %zu post frame callbacks", this, post_frame_callbacks_.size());
}

TickerP
FrameScheduler::create_ticker (const Ticker::TickSlot &tick)
{
  FrameTickerP ticker = std::make_shared<FrameTicker> (tick);
  tickers_.push_back (ticker);
  return ticker;
}

void
FrameScheduler::add_post_frame_callback (const VoidSlot &callback)
{
  post_frame_callbacks_.push_back (callback);
}

/// Number of started tickers that are still referenced.
size_t
FrameScheduler::n_active_tickers () const
{
  size_t n = 0;
  for (const auto &weak : tickers_)
    {
      FrameTickerP ticker = weak.lock();
      if (ticker && ticker->active())
        n++;
    }
  return n;
}

/// Indicates that neither tickers nor post frame callbacks need another frame.
bool
FrameScheduler::idle () const
{
  return n_active_tickers() == 0 && post_frame_callbacks_.empty();
}

/// Render one frame at @a frame_usecs, which must not precede the last frame.
void
FrameScheduler::pump_frame (uint64 frame_usecs)
{
  SHEETROCK_ASSERT_RETURN (frame_usecs >= frame_usecs_);
  frame_usecs_ = frame_usecs;
  n_frames_++;
  // collect live tickers, tickers created during this frame start ticking with the next one
  vector<FrameTickerP> tickers;
  vector<std::weak_ptr<FrameTicker>> alive;
  for (const auto &weak : tickers_)
    {
      FrameTickerP ticker = weak.lock();
      if (ticker)
        {
          tickers.push_back (ticker);
          alive.push_back (ticker);
        }
    }
  tickers_.swap (alive);
  FDEBUG ("frame %llu at %s: %zu tickers", (unsigned long long) n_frames_, timestamp_format (frame_usecs), tickers.size());
  for (FrameTickerP &ticker : tickers)
    if (ticker->active())
      ticker->tick (frame_usecs);
  // callbacks added by post frame callbacks are deferred to the next frame
  vector<VoidSlot> callbacks;
  callbacks.swap (post_frame_callbacks_);
  for (VoidSlot &callback : callbacks)
    callback();
}

} // Sheetrock
