// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_SERIES_INVERSION_H
#define __LEVELSCAN_SERIES_INVERSION_H 1

#include <string>
#include "BarSeries.h"

namespace mkc_levelscan
{
  enum class InversionMode
  {
    MIRROR,
    NEGATE
  };

  // Case-insensitive "mirror" / "negate"; throws InvalidInputException otherwise
  InversionMode getInversionModeFromString (const std::string& modeString);

  std::string inversionModeToString (InversionMode mode);

  /**
   * @brief Price p becomes -p; high and low swap roles.
   *
   * new high = -old low, new low = -old high. Timestamps and volume are kept.
   * Applying it twice reproduces the input exactly. An empty series yields an
   * empty series.
   */
  BarSeries NegateSeries (const BarSeries& series);

  /**
   * @brief Price p becomes 2M - p where M is the median close of the series.
   *
   * M is computed once from the finite closes before any price is transformed,
   * and high and low swap roles as for NegateSeries. The result is only
   * guaranteed positive when every input price is <= 2M; prices above 2M
   * map to negative values and are left that way.
   *
   * @throws InvalidInputException if the series is empty or has no finite close.
   */
  BarSeries MirrorSeries (const BarSeries& series);

  // Reflects around a caller supplied pivot instead of the median close
  BarSeries MirrorSeries (const BarSeries& series, double pivot);

  BarSeries InvertSeries (const BarSeries& series, InversionMode mode);

  /**
   * @brief Inverts a series and the prices that refer to it consistently.
   *
   * The scanner looks for a breakout *above* a level, so detecting the
   * inverse pattern requires inverting both the bars and the level with the
   * same transform. For mirror mode the pivot is fixed when the inverter is
   * constructed; invertPrice() and invert() both use it, so a level
   * transformed here always matches the series transformed here. Passing an
   * untransformed level with an inverted series silently produces
   * meaningless signals.
   */
  class SeriesInverter
  {
  public:
    SeriesInverter (const BarSeries& referenceSeries, InversionMode mode);

    BarSeries invert (const BarSeries& series) const;

    // negate: -price, mirror: 2M - price
    double invertPrice (double price) const;

    InversionMode getMode() const
    {
      return mMode;
    }

    // Median close for mirror mode, zero for negate
    double getPivot() const
    {
      return mPivot;
    }

  private:
    InversionMode mMode;
    double mPivot;
  };
}

#endif
