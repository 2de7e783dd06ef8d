// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_OHLC_BAR_H
#define __LEVELSCAN_OHLC_BAR_H 1

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "LevelScanException.h"

namespace mkc_levelscan
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  //
  // class OHLCBar
  //
  // One time step of market data. Finite prices must satisfy
  // high >= max(open, close, low) and low <= min(open, close, high);
  // NaN components are accepted and left for the scanner to skip.
  //

  class OHLCBar
  {
  public:
    OHLCBar (const ptime& barDateTime,
	     double open,
	     double high,
	     double low,
	     double close,
	     double volume = 0.0);

    OHLCBar (const boost::gregorian::date& barDate,
	     double open,
	     double high,
	     double low,
	     double close,
	     double volume = 0.0);

    OHLCBar (const OHLCBar& rhs) = default;
    OHLCBar& operator=(const OHLCBar& rhs) = default;
    ~OHLCBar() = default;

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    boost::gregorian::date getDateValue() const
    {
      return mDateTime.date();
    }

    double getOpenValue() const
    {
      return mOpen;
    }

    double getHighValue() const
    {
      return mHigh;
    }

    double getLowValue() const
    {
      return mLow;
    }

    double getCloseValue() const
    {
      return mClose;
    }

    double getVolumeValue() const
    {
      return mVolume;
    }

    // True when open, high, low and close are all finite
    bool hasFinitePrices() const;

  private:
    ptime mDateTime;
    double mOpen;
    double mHigh;
    double mLow;
    double mClose;
    double mVolume;
  };

  bool operator==(const OHLCBar& lhs, const OHLCBar& rhs);
  bool operator!=(const OHLCBar& lhs, const OHLCBar& rhs);

  std::string priceToString(double price);
}

#endif
