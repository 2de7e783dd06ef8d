// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BarSeries.h"
#include <algorithm>
#include <iterator>
#include <string>

namespace mkc_levelscan
{
  BarSeries::BarSeries()
    : mBars()
  {}

  BarSeries::BarSeries (const std::vector<OHLCBar>& bars)
    : mBars()
  {
    mBars.reserve(bars.size());
    for (const auto& bar : bars)
      addEntry(bar);
  }

  void BarSeries::addEntry (const OHLCBar& entry)
  {
    if (!mBars.empty() && entry.getDateTime() <= mBars.back().getDateTime())
      throw BarSeriesException("BarSeries::addEntry - bar at " +
			       boost::posix_time::to_simple_string(entry.getDateTime()) +
			       " is not after last bar at " +
			       boost::posix_time::to_simple_string(mBars.back().getDateTime()));

    mBars.push_back(entry);
  }

  const OHLCBar& BarSeries::getEntry (std::size_t index) const
  {
    if (index >= mBars.size())
      throw BarSeriesException("BarSeries::getEntry - index " + std::to_string(index) +
			       " out of range for series of " + std::to_string(mBars.size()) + " bars");

    return mBars[index];
  }

  const ptime& BarSeries::getFirstDateTime() const
  {
    if (mBars.empty())
      throw BarSeriesException("BarSeries::getFirstDateTime - series is empty");

    return mBars.front().getDateTime();
  }

  const ptime& BarSeries::getLastDateTime() const
  {
    if (mBars.empty())
      throw BarSeriesException("BarSeries::getLastDateTime - series is empty");

    return mBars.back().getDateTime();
  }

  std::vector<double> BarSeries::getCloseValues() const
  {
    std::vector<double> closes;
    closes.reserve(mBars.size());
    std::transform(mBars.begin(), mBars.end(), std::back_inserter(closes),
		   [](const OHLCBar& bar) { return bar.getCloseValue(); });
    return closes;
  }

  bool operator==(const BarSeries& lhs, const BarSeries& rhs)
  {
    if (lhs.getNumEntries() != rhs.getNumEntries())
      return false;

    return std::equal(lhs.beginRandomAccess(), lhs.endRandomAccess(), rhs.beginRandomAccess());
  }

  bool operator!=(const BarSeries& lhs, const BarSeries& rhs)
  {
    return !(lhs == rhs);
  }
}
