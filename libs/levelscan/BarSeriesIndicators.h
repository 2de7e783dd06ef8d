// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_BAR_SERIES_INDICATORS_H
#define __LEVELSCAN_BAR_SERIES_INDICATORS_H 1

#include <vector>
#include "BarSeries.h"
#include "IndicatorSeries.h"

namespace mkc_levelscan
{
  constexpr int kDefaultAtrPeriod = 14;

  /**
   * @brief Calculates the true range of every bar in a series.
   *
   * TR[i] = max(high[i] - low[i], |high[i] - close[i-1]|, |low[i] - close[i-1]|)
   * and TR[0] = high[0] - low[0]. When the previous close is NaN the bar's own
   * range is used; when high or low is NaN the true range is NaN.
   *
   * @param series The input bar series.
   * @return An IndicatorSeries named "TR" aligned with the input.
   * @throws InvalidInputException if the series is empty.
   */
  IndicatorSeries TrueRangeSeries (const BarSeries& series);

  /**
   * @brief Calculates the Average True Range as a simple rolling mean.
   *
   * ATR[i] is the arithmetic mean of TR[i-period+1] .. TR[i]. Positions with
   * fewer than @p period true range values (i < period - 1) are undefined
   * (NaN), as is any window containing an undefined true range.
   *
   * @param series The input bar series.
   * @param period Lookback length N.
   * @return An IndicatorSeries named "ATR" of the same length as the input.
   * @throws InvalidInputException if period <= 0 or the series is empty.
   */
  IndicatorSeries AverageTrueRangeSeries (const BarSeries& series, int period = kDefaultAtrPeriod);

  /**
   * @brief Calculates the median of a vector of doubles.
   *
   * For an even number of elements the two middle values are averaged.
   *
   * @throws std::domain_error if the input vector is empty.
   */
  double Median (const std::vector<double>& values);
}

#endif
