// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_BAR_SERIES_H
#define __LEVELSCAN_BAR_SERIES_H 1

#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "OHLCBar.h"

namespace mkc_levelscan
{
  /**
   * @brief Ordered sequence of OHLC bars addressed by position 0..n-1.
   *
   * Timestamps are strictly increasing; a bar that would break the ordering
   * is rejected with BarSeriesException. The series owns copies of its bars
   * and is never modified by the scanner or the inversion transforms, which
   * always build new series.
   */
  class BarSeries
  {
  public:
    typedef std::vector<OHLCBar>::const_iterator ConstRandomAccessIterator;

    BarSeries();

    /**
     * @brief Builds a series from bars already in time order.
     * @throws BarSeriesException if timestamps are not strictly increasing.
     */
    explicit BarSeries (const std::vector<OHLCBar>& bars);

    BarSeries (const BarSeries& rhs) = default;
    BarSeries (BarSeries&& rhs) = default;
    BarSeries& operator=(const BarSeries& rhs) = default;
    BarSeries& operator=(BarSeries&& rhs) = default;
    ~BarSeries() = default;

    void addEntry (const OHLCBar& entry);

    std::size_t getNumEntries() const
    {
      return mBars.size();
    }

    bool isEmpty() const
    {
      return mBars.empty();
    }

    // Throws BarSeriesException when index is out of range
    const OHLCBar& getEntry (std::size_t index) const;

    double getOpenValue (std::size_t index) const
    {
      return getEntry(index).getOpenValue();
    }

    double getHighValue (std::size_t index) const
    {
      return getEntry(index).getHighValue();
    }

    double getLowValue (std::size_t index) const
    {
      return getEntry(index).getLowValue();
    }

    double getCloseValue (std::size_t index) const
    {
      return getEntry(index).getCloseValue();
    }

    const ptime& getDateTime (std::size_t index) const
    {
      return getEntry(index).getDateTime();
    }

    const ptime& getFirstDateTime() const;
    const ptime& getLastDateTime() const;

    std::vector<double> getCloseValues() const;

    ConstRandomAccessIterator beginRandomAccess() const
    {
      return mBars.begin();
    }

    ConstRandomAccessIterator endRandomAccess() const
    {
      return mBars.end();
    }

  private:
    std::vector<OHLCBar> mBars;
  };

  bool operator==(const BarSeries& lhs, const BarSeries& rhs);
  bool operator!=(const BarSeries& lhs, const BarSeries& rhs);
}

#endif
