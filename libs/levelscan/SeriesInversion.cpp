// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SeriesInversion.h"
#include "BarSeriesIndicators.h"
#include <algorithm>
#include <cmath>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace mkc_levelscan
{
  namespace
  {
    double medianClose (const BarSeries& series)
    {
      if (series.isEmpty())
	throw InvalidInputException("MirrorSeries: cannot compute median close of an empty series");

      std::vector<double> closes(series.getCloseValues());
      closes.erase(std::remove_if(closes.begin(), closes.end(),
				  [](double c) { return !std::isfinite(c); }),
		   closes.end());

      if (closes.empty())
	throw InvalidInputException("MirrorSeries: series has no finite close to take the median of");

      return Median(closes);
    }

    template <class PriceTransform>
    BarSeries transformBars (const BarSeries& series, PriceTransform transform)
    {
      std::vector<OHLCBar> bars;
      bars.reserve(series.getNumEntries());

      // The transform is decreasing, so the old low becomes the new high
      for (auto it = series.beginRandomAccess(); it != series.endRandomAccess(); ++it)
	bars.emplace_back(it->getDateTime(),
			  transform(it->getOpenValue()),
			  transform(it->getLowValue()),
			  transform(it->getHighValue()),
			  transform(it->getCloseValue()),
			  it->getVolumeValue());

      return BarSeries(bars);
    }
  }

  InversionMode getInversionModeFromString (const std::string& modeString)
  {
    std::string upperCaseModeStr = boost::to_upper_copy(boost::trim_copy(modeString));

    if (upperCaseModeStr == std::string("MIRROR"))
      return InversionMode::MIRROR;
    else if (upperCaseModeStr == std::string("NEGATE"))
      return InversionMode::NEGATE;
    else
      throw InvalidInputException("getInversionModeFromString - inversion mode " + modeString +
				  " not recognized (expected mirror or negate)");
  }

  std::string inversionModeToString (InversionMode mode)
  {
    return (mode == InversionMode::MIRROR) ? std::string("mirror") : std::string("negate");
  }

  BarSeries NegateSeries (const BarSeries& series)
  {
    return transformBars(series, [](double price) { return -price; });
  }

  BarSeries MirrorSeries (const BarSeries& series)
  {
    return MirrorSeries(series, medianClose(series));
  }

  BarSeries MirrorSeries (const BarSeries& series, double pivot)
  {
    const double twicePivot = 2.0 * pivot;
    return transformBars(series, [twicePivot](double price) { return twicePivot - price; });
  }

  BarSeries InvertSeries (const BarSeries& series, InversionMode mode)
  {
    if (mode == InversionMode::NEGATE)
      return NegateSeries(series);

    return MirrorSeries(series);
  }

  SeriesInverter::SeriesInverter (const BarSeries& referenceSeries, InversionMode mode)
    : mMode(mode),
      mPivot((mode == InversionMode::MIRROR) ? medianClose(referenceSeries) : 0.0)
  {}

  BarSeries SeriesInverter::invert (const BarSeries& series) const
  {
    if (mMode == InversionMode::NEGATE)
      return NegateSeries(series);

    return MirrorSeries(series, mPivot);
  }

  double SeriesInverter::invertPrice (double price) const
  {
    if (mMode == InversionMode::NEGATE)
      return -price;

    return 2.0 * mPivot - price;
  }
}
