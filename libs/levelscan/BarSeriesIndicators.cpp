// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BarSeriesIndicators.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace mkc_levelscan
{
  IndicatorSeries TrueRangeSeries (const BarSeries& series)
  {
    if (series.isEmpty())
      throw InvalidInputException("TrueRangeSeries: series is empty");

    std::vector<double> trueRange;
    trueRange.reserve(series.getNumEntries());

    double prevClose = std::numeric_limits<double>::quiet_NaN();
    for (auto it = series.beginRandomAccess(); it != series.endRandomAccess(); ++it)
      {
	const double high = it->getHighValue();
	const double low = it->getLowValue();
	double range = high - low;

	if (std::isfinite(range) && std::isfinite(prevClose))
	  range = std::max({range, std::fabs(high - prevClose), std::fabs(low - prevClose)});

	trueRange.push_back(range);
	prevClose = it->getCloseValue();
      }

    return IndicatorSeries("TR", std::move(trueRange));
  }

  IndicatorSeries AverageTrueRangeSeries (const BarSeries& series, int period)
  {
    if (period <= 0)
      throw InvalidInputException("AverageTrueRangeSeries: period must be positive, got " +
				  std::to_string(period));

    if (series.isEmpty())
      throw InvalidInputException("AverageTrueRangeSeries: series is empty");

    const IndicatorSeries trueRangeSeries = TrueRangeSeries(series);
    const std::vector<double>& trueRange = trueRangeSeries.getValues();
    const std::size_t n = trueRange.size();
    const std::size_t window = static_cast<std::size_t>(period);

    std::vector<double> atr(n, std::numeric_limits<double>::quiet_NaN());

    // Each window is summed from scratch so an undefined true range only
    // affects the windows that contain it.
    for (std::size_t i = window - 1; i < n; ++i)
      {
	double sum = 0.0;
	for (std::size_t j = i + 1 - window; j <= i; ++j)
	  sum += trueRange[j];

	atr[i] = sum / static_cast<double>(window);
      }

    return IndicatorSeries("ATR", std::move(atr));
  }

  double Median (const std::vector<double>& values)
  {
    typedef std::vector<double>::size_type vec_size_type;

    std::vector<double> sortedVector (values);
    std::sort (sortedVector.begin(), sortedVector.end());

    vec_size_type size = sortedVector.size();
    if (size == 0)
      throw std::domain_error ("Cannot take median of empty series");

    vec_size_type mid = size / 2;

    if ((size % 2) == 0)
      return (sortedVector[mid] + sortedVector[mid - 1]) / 2.0;
    else
      return sortedVector[mid];
  }
}
