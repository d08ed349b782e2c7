// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "activity.hh"
#include "controller.hh"

#define ADEBUG(...)     SHEETROCK_KEY_DEBUG ("Activity", __VA_ARGS__)

namespace Sheetrock {

// == SheetActivity ==
SheetActivity::SheetActivity () :
  owner_ (NULL), offset_ (NAN), mounted_ (false), disposed_ (false)
{}

SheetActivity::~SheetActivity ()
{
  SHEETROCK_CRITICAL_UNLESS (!mounted_);
}

ExtentController&
SheetActivity::owner () const
{
  SHEETROCK_ASSERT (owner_ != NULL);
  return *owner_;
}

/// Change the offset and notify sig_changed if it differs from the current one.
void
SheetActivity::set_offset (double offset)
{
  SHEETROCK_ASSERT_RETURN (!disposed_);
  if (optional_equals (offset_, offset))
    return;
  offset_ = offset;
  sig_changed.emit();
}

/// Change the offset without notification.
void
SheetActivity::correct_offset (double offset)
{
  SHEETROCK_ASSERT_RETURN (!disposed_);
  offset_ = offset;
}

/// Attach the activity to @a owner, the activity becomes mounted.
void
SheetActivity::init_with (ExtentController &owner)
{
  SHEETROCK_ASSERT_RETURN (owner_ == NULL && !disposed_);
  owner_ = &owner;
  mounted_ = true;
  ADEBUG ("%s: attached to %p", name(), &owner);
  attached();
}

/// Take over the offset of the outgoing activity @a other.
void
SheetActivity::take_over (SheetActivity &other)
{
  SHEETROCK_ASSERT_RETURN (&other != this);
  if (!std::isnan (other.offset_))
    correct_offset (other.offset_);
  ADEBUG ("%s: took over %s at offset %g", name(), other.name(), offset_);
  took_over (other);
}

/// Establish an initial offset if needed, then notify content_dimensions_changed().
void
SheetActivity::did_change_content_dimensions (const Size *old_content_dimensions)
{
  const Size *content = owner().maybe_content_dimensions();
  if (std::isnan (offset_) && content)
    set_offset (owner().initial_extent().resolve (*content));
  content_dimensions_changed (old_content_dimensions);
}

void
SheetActivity::did_change_viewport_dimensions (const ViewportDimensions *old_viewport_dimensions)
{
  viewport_dimensions_changed (old_viewport_dimensions);
}

/// Called once after all dimension changes of a batch have been applied.
void
SheetActivity::did_finalize_dimensions (const Size *old_content_dimensions,
                                        const ViewportDimensions *old_viewport_dimensions)
{
  dimensions_finalized (old_content_dimensions, old_viewport_dimensions);
}

/// Release all resources, the activity is unmounted afterwards. Repeated calls are ignored.
void
SheetActivity::dispose ()
{
  if (disposed_)
    return;
  ADEBUG ("%s: dispose", name());
  disposing();
  disposed_ = true;
  mounted_ = false;
  owner_ = NULL;
}

void
SheetActivity::attached ()
{}

void
SheetActivity::took_over (SheetActivity &other)
{}

void
SheetActivity::content_dimensions_changed (const Size *old_content_dimensions)
{}

void
SheetActivity::viewport_dimensions_changed (const ViewportDimensions *old_viewport_dimensions)
{}

void
SheetActivity::dimensions_finalized (const Size *old_content_dimensions,
                                     const ViewportDimensions *old_viewport_dimensions)
{}

void
SheetActivity::disposing ()
{}

String
SheetActivity::string () const
{
  return string_format ("%sSheetActivity(offset: %g, mounted: %d)", name(), offset_, int (mounted_));
}

// == IdleSheetActivity ==
IdleSheetActivity::IdleSheetActivity ()
{}

void
IdleSheetActivity::dimensions_finalized (const Size *old_content_dimensions,
                                         const ViewportDimensions *old_viewport_dimensions)
{
  // keep the offset proportional to the content height
  const ExtentController &controller = owner();
  const Size *content = controller.maybe_content_dimensions();
  if (!old_content_dimensions || !content || std::isnan (offset()) ||
      old_content_dimensions->height <= 0 || old_content_dimensions->height == content->height)
    return;
  const double scaled = offset() * content->height / old_content_dimensions->height;
  set_offset (CLAMP (scaled, controller.maybe_min_offset(), controller.maybe_max_offset()));
}

// == BallisticSheetActivity ==
BallisticSheetActivity::BallisticSheetActivity (const SimulationP &simulation) :
  simulation_ (simulation)
{
  SHEETROCK_ASSERT (simulation_ != NULL);
}

BallisticSheetActivity::~BallisticSheetActivity ()
{
  if (ticker_)
    ticker_->stop();
}

void
BallisticSheetActivity::attached ()
{
  ticker_ = owner().context().create_ticker ([this] (double elapsed) { tick (elapsed); });
  ticker_->start();
}

void
BallisticSheetActivity::tick (double elapsed)
{
  SheetActivityP guard = shared_from_this();    // the controller may replace us
  set_offset (simulation_->x (elapsed));
  if (mounted() && simulation_->is_done (elapsed))
    {
      ADEBUG ("Ballistic: %s done after %gs at %g", simulation_->string(), elapsed, offset());
      owner().go_idle();
    }
}

void
BallisticSheetActivity::dimensions_finalized (const Size *old_content_dimensions,
                                              const ViewportDimensions *old_viewport_dimensions)
{
  if (owner().is_out_of_bounds())
    owner().settle();
}

void
BallisticSheetActivity::disposing ()
{
  if (ticker_)
    ticker_->stop();
}

// == AnimatedSheetActivity ==
AnimatedSheetActivity::AnimatedSheetActivity (double from, const Extent &destination, double duration, const CurveP &curve) :
  from_ (from), to_ (NAN), destination_ (destination), duration_ (duration), curve_ (curve), completed_ (false)
{
  SHEETROCK_ASSERT (duration_ >= 0);
  if (!curve_)
    curve_ = Curves::linear();
  done_ = promise_.get_future().share();
}

AnimatedSheetActivity::~AnimatedSheetActivity ()
{
  if (ticker_)
    ticker_->stop();
  complete();
}

void
AnimatedSheetActivity::attached ()
{
  const Size *content = owner().maybe_content_dimensions();
  SHEETROCK_ASSERT_RETURN (content != NULL);
  to_ = destination_.resolve (*content);
  ticker_ = owner().context().create_ticker ([this] (double elapsed) { tick (elapsed); });
  ticker_->start();
}

void
AnimatedSheetActivity::content_dimensions_changed (const Size *old_content_dimensions)
{
  to_ = destination_.resolve (*owner().maybe_content_dimensions());
}

void
AnimatedSheetActivity::tick (double elapsed)
{
  SheetActivityP guard = shared_from_this();    // the controller may replace us
  const double t = duration_ > 0 ? MIN (elapsed / duration_, 1.0) : 1.0;
  set_offset (from_ + (to_ - from_) * curve_->transform (t));
  if (mounted() && t >= 1.0)
    {
      ADEBUG ("Animated: reached %g after %gs", to_, elapsed);
      complete();
      owner().go_idle();
    }
}

void
AnimatedSheetActivity::complete ()
{
  if (completed_)
    return;
  completed_ = true;
  promise_.set_value();
}

void
AnimatedSheetActivity::disposing ()
{
  if (ticker_)
    ticker_->stop();
  complete();
}

} // Sheetrock
