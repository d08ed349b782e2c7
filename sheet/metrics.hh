// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_METRICS_HH__
#define __SHEETROCK_METRICS_HH__

#include <sheet/primitives.hh>

namespace Sheetrock {

/** MaybeSheetMetrics is the partial view onto the position and bounds of a sheet.
 * Every primary field may be absent: absent offsets read as NaN, absent dimensions as NULL.
 * Derived view offsets are computed on demand and propagate absence.
 */
class MaybeSheetMetrics {
public:
  virtual                           ~MaybeSheetMetrics          () {}
  virtual double                    maybe_offset                () const = 0;
  virtual double                    maybe_min_offset            () const = 0;
  virtual double                    maybe_max_offset            () const = 0;
  virtual const Size*               maybe_content_dimensions    () const = 0;
  virtual const ViewportDimensions* maybe_viewport_dimensions   () const = 0;
  double                            maybe_view_offset           () const;
  double                            maybe_min_view_offset       () const;
  double                            maybe_max_view_offset       () const;
  bool                              has_offset                  () const { return !std::isnan (maybe_offset()); }
  bool                              is_measured                 () const;
  bool                              is_in_bounds                () const;
  bool                              is_out_of_bounds            () const;
  String                            string                      () const;
};

/** SheetMetrics is the asserted view onto the fields of MaybeSheetMetrics.
 * Reading a field that is absent is a fatal contract violation, callers check is_measured() first.
 */
class SheetMetrics : public MaybeSheetMetrics {
public:
  double                    offset              () const;
  double                    min_offset          () const;
  double                    max_offset          () const;
  const Size&               content_dimensions  () const;
  const ViewportDimensions& viewport_dimensions () const;
  double                    view_offset         () const;
  double                    min_view_offset     () const;
  double                    max_view_offset     () const;
};

/// An immutable, fully populated value copy of SheetMetrics.
class SheetMetricsSnapshot : public SheetMetrics {
  double             offset_, min_offset_, max_offset_;
  Size               content_dimensions_;
  ViewportDimensions viewport_dimensions_;
public:
  explicit                          SheetMetricsSnapshot        (double offset, double min_offset, double max_offset,
                                                                 const Size &content_dimensions,
                                                                 const ViewportDimensions &viewport_dimensions);
  static SheetMetricsSnapshot       from                        (const SheetMetrics &metrics);
  virtual double                    maybe_offset                () const override { return offset_; }
  virtual double                    maybe_min_offset            () const override { return min_offset_; }
  virtual double                    maybe_max_offset            () const override { return max_offset_; }
  virtual const Size*               maybe_content_dimensions    () const override { return &content_dimensions_; }
  virtual const ViewportDimensions* maybe_viewport_dimensions   () const override { return &viewport_dimensions_; }
  SheetMetricsSnapshot              copy_with_offset            (double offset) const;
  SheetMetricsSnapshot              copy_with_content_dimensions  (const Size &content_dimensions) const;
  SheetMetricsSnapshot              copy_with_viewport_dimensions (const ViewportDimensions &viewport_dimensions) const;
  bool                              operator==                  (const SheetMetricsSnapshot &other) const;
  bool                              operator!=                  (const SheetMetricsSnapshot &other) const { return !operator== (other); }
  size_t                            hash                        () const;
  String                            string                      () const;
};

} // Sheetrock

namespace std {
template<> struct hash<Sheetrock::SheetMetricsSnapshot> {
  size_t operator() (const Sheetrock::SheetMetricsSnapshot &s) const { return s.hash(); }
};
} // std

#endif  /* __SHEETROCK_METRICS_HH__ */
