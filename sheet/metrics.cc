// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "metrics.hh"

namespace Sheetrock {

static String
maybe_string (double value)
{
  return std::isnan (value) ? String ("null") : string_format ("%g", value);
}

// == MaybeSheetMetrics ==
double
MaybeSheetMetrics::maybe_view_offset () const
{
  const ViewportDimensions *viewport = maybe_viewport_dimensions();
  return viewport ? maybe_offset() + viewport->insets.bottom : NAN;
}

double
MaybeSheetMetrics::maybe_min_view_offset () const
{
  const ViewportDimensions *viewport = maybe_viewport_dimensions();
  return viewport ? maybe_min_offset() + viewport->insets.bottom : NAN;
}

double
MaybeSheetMetrics::maybe_max_view_offset () const
{
  const ViewportDimensions *viewport = maybe_viewport_dimensions();
  return viewport ? maybe_max_offset() + viewport->insets.bottom : NAN;
}

/// Indicates that offset, both bounds and both dimensions are present.
bool
MaybeSheetMetrics::is_measured () const
{
  return (!std::isnan (maybe_offset()) &&
          !std::isnan (maybe_min_offset()) &&
          !std::isnan (maybe_max_offset()) &&
          maybe_content_dimensions() != NULL &&
          maybe_viewport_dimensions() != NULL);
}

/// Indicates a measured offset within the inclusive bounds.
bool
MaybeSheetMetrics::is_in_bounds () const
{
  if (!is_measured())
    return false;
  const double offset = maybe_offset();
  return offset >= maybe_min_offset() && offset <= maybe_max_offset();
}

bool
MaybeSheetMetrics::is_out_of_bounds () const
{
  return is_measured() && !is_in_bounds();
}

String
MaybeSheetMetrics::string () const
{
  const Size *content = maybe_content_dimensions();
  const ViewportDimensions *viewport = maybe_viewport_dimensions();
  return string_format ("(measured: %s, offset: %s, min_offset: %s, max_offset: %s, "
                        "view_offset: %s, min_view_offset: %s, max_view_offset: %s, "
                        "content_dimensions: %s, viewport_dimensions: %s)",
                        is_measured() ? "true" : "false",
                        maybe_string (maybe_offset()), maybe_string (maybe_min_offset()), maybe_string (maybe_max_offset()),
                        maybe_string (maybe_view_offset()), maybe_string (maybe_min_view_offset()),
                        maybe_string (maybe_max_view_offset()),
                        content ? content->string() : "null",
                        viewport ? viewport->string() : "null");
}

// == SheetMetrics ==
double
SheetMetrics::offset () const
{
  const double v = maybe_offset();
  SHEETROCK_ASSERT (!std::isnan (v));
  return v;
}

double
SheetMetrics::min_offset () const
{
  const double v = maybe_min_offset();
  SHEETROCK_ASSERT (!std::isnan (v));
  return v;
}

double
SheetMetrics::max_offset () const
{
  const double v = maybe_max_offset();
  SHEETROCK_ASSERT (!std::isnan (v));
  return v;
}

const Size&
SheetMetrics::content_dimensions () const
{
  const Size *content = maybe_content_dimensions();
  SHEETROCK_ASSERT (content != NULL);
  return *content;
}

const ViewportDimensions&
SheetMetrics::viewport_dimensions () const
{
  const ViewportDimensions *viewport = maybe_viewport_dimensions();
  SHEETROCK_ASSERT (viewport != NULL);
  return *viewport;
}

double
SheetMetrics::view_offset () const
{
  return offset() + viewport_dimensions().insets.bottom;
}

double
SheetMetrics::min_view_offset () const
{
  return min_offset() + viewport_dimensions().insets.bottom;
}

double
SheetMetrics::max_view_offset () const
{
  return max_offset() + viewport_dimensions().insets.bottom;
}

// == SheetMetricsSnapshot ==
SheetMetricsSnapshot::SheetMetricsSnapshot (double offset, double min_offset, double max_offset,
                                            const Size &content_dimensions,
                                            const ViewportDimensions &viewport_dimensions) :
  offset_ (offset), min_offset_ (min_offset), max_offset_ (max_offset),
  content_dimensions_ (content_dimensions), viewport_dimensions_ (viewport_dimensions)
{
  SHEETROCK_ASSERT (!std::isnan (offset) && !std::isnan (min_offset) && !std::isnan (max_offset));
}

/// Copy all fields of @a metrics, which must be measured.
SheetMetricsSnapshot
SheetMetricsSnapshot::from (const SheetMetrics &metrics)
{
  return SheetMetricsSnapshot (metrics.offset(), metrics.min_offset(), metrics.max_offset(),
                               metrics.content_dimensions(), metrics.viewport_dimensions());
}

SheetMetricsSnapshot
SheetMetricsSnapshot::copy_with_offset (double offset) const
{
  return SheetMetricsSnapshot (offset, min_offset_, max_offset_, content_dimensions_, viewport_dimensions_);
}

SheetMetricsSnapshot
SheetMetricsSnapshot::copy_with_content_dimensions (const Size &content_dimensions) const
{
  return SheetMetricsSnapshot (offset_, min_offset_, max_offset_, content_dimensions, viewport_dimensions_);
}

SheetMetricsSnapshot
SheetMetricsSnapshot::copy_with_viewport_dimensions (const ViewportDimensions &viewport_dimensions) const
{
  return SheetMetricsSnapshot (offset_, min_offset_, max_offset_, content_dimensions_, viewport_dimensions);
}

bool
SheetMetricsSnapshot::operator== (const SheetMetricsSnapshot &other) const
{
  return (offset_ == other.offset_ &&
          min_offset_ == other.min_offset_ &&
          max_offset_ == other.max_offset_ &&
          content_dimensions_ == other.content_dimensions_ &&
          viewport_dimensions_ == other.viewport_dimensions_);
}

size_t
SheetMetricsSnapshot::hash () const
{
  std::hash<double> dhash;
  size_t h = dhash (offset_);
  h = hash_combine (h, dhash (min_offset_));
  h = hash_combine (h, dhash (max_offset_));
  h = hash_combine (h, content_dimensions_.hash());
  return hash_combine (h, viewport_dimensions_.hash());
}

String
SheetMetricsSnapshot::string () const
{
  return string_format ("SheetMetricsSnapshot(offset: %g, min_offset: %g, max_offset: %g, "
                        "content_dimensions: %s, viewport_dimensions: %s)",
                        offset_, min_offset_, max_offset_,
                        content_dimensions_.string(), viewport_dimensions_.string());
}

} // Sheetrock
