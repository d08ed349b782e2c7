// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_TICKER_HH__
#define __SHEETROCK_TICKER_HH__

#include <sheetrock-core.hh>
#include <functional>

namespace Sheetrock {

class Ticker;
typedef std::shared_ptr<Ticker> TickerP;

/// Ticker invokes its callback once per frame while active, passing seconds elapsed since the first frame after start().
class Ticker {
public:
  typedef std::function<void (double elapsed)> TickSlot;
  virtual      ~Ticker  () {}
  virtual void  start   () = 0;
  virtual void  stop    () = 0;
  virtual bool  active  () const = 0;
};

/// SheetContext is provided by the host, it schedules frames for the activities of a sheet.
class SheetContext {
public:
  typedef std::function<void ()> VoidSlot;
  virtual        ~SheetContext            () {}
  virtual TickerP create_ticker           (const Ticker::TickSlot &tick) = 0;
  virtual void    add_post_frame_callback (const VoidSlot &callback) = 0;   ///< Run @a callback once after the current frame.
};

/** FrameScheduler is a SheetContext driven by explicit calls to pump_frame().
 * Each frame first ticks all active tickers with the frame time, then runs and
 * clears the callbacks added with add_post_frame_callback().
 */
class FrameScheduler : public SheetContext {
  class FrameTicker;
  typedef std::shared_ptr<FrameTicker> FrameTickerP;
  vector<std::weak_ptr<FrameTicker>>   tickers_;
  vector<VoidSlot>                     post_frame_callbacks_;
  uint64                               frame_usecs_;
  uint64                               n_frames_;
  SHEETROCK_CLASS_NON_COPYABLE (FrameScheduler);
public:
  explicit        FrameScheduler          ();
  virtual        ~FrameScheduler          ();
  virtual TickerP create_ticker           (const Ticker::TickSlot &tick) override;
  virtual void    add_post_frame_callback (const VoidSlot &callback) override;
  void            pump_frame              (uint64 frame_usecs);
  uint64          frame_usecs             () const        { return frame_usecs_; }
  uint64          n_frames                () const        { return n_frames_; }
  size_t          n_active_tickers        () const;
  bool            idle                    () const;
};

} // Sheetrock

#endif  /* __SHEETROCK_TICKER_HH__ */
