// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "OHLCBar.h"
#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>

namespace mkc_levelscan
{
  std::string priceToString(double price)
  {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << price;
    return oss.str();
  }

  OHLCBar::OHLCBar (const ptime& barDateTime,
		    double open,
		    double high,
		    double low,
		    double close,
		    double volume)
    : mDateTime(barDateTime),
      mOpen(open),
      mHigh(high),
      mLow(low),
      mClose(close),
      mVolume(volume)
  {
    // Comparisons against NaN are false, so incomplete bars pass through
    if (high < open)
      throw BarException(std::string ("BarException: on - ") +boost::posix_time::to_simple_string (mDateTime) +std::string (" high of ") +priceToString (high) +std::string(" is less than open of ") +priceToString (open));

    if (high < low)
      throw BarException(std::string ("BarException: on - ") +boost::posix_time::to_simple_string (mDateTime) +std::string (" high of ") +priceToString (high) +std::string(" is less than low of ") +priceToString (low));

    if (high < close)
      throw BarException(std::string ("BarException: on - ") +boost::posix_time::to_simple_string (mDateTime) +std::string (" high of ") +priceToString (high) +std::string(" is less than close of ") +priceToString (close));

    if (low > open)
      throw BarException(std::string ("BarException: on - ") +boost::posix_time::to_simple_string (mDateTime) +std::string (" low of ") +priceToString (low) +std::string (" is greater than open of ") +priceToString (open));

    if (low > close)
      throw BarException(std::string ("BarException: on - ") +boost::posix_time::to_simple_string (mDateTime) +std::string (" low of ") +priceToString (low) +std::string (" is greater than close of ") +priceToString (close));
  }

  OHLCBar::OHLCBar (const boost::gregorian::date& barDate,
		    double open,
		    double high,
		    double low,
		    double close,
		    double volume)
    : OHLCBar (ptime(barDate, time_duration(0, 0, 0)),
	       open, high, low, close, volume)
  {}

  bool OHLCBar::hasFinitePrices() const
  {
    return std::isfinite(mOpen) && std::isfinite(mHigh) &&
      std::isfinite(mLow) && std::isfinite(mClose);
  }

  bool operator==(const OHLCBar& lhs, const OHLCBar& rhs)
  {
    return ((lhs.getDateTime() == rhs.getDateTime()) &&
	    (lhs.getOpenValue() == rhs.getOpenValue()) &&
	    (lhs.getHighValue() == rhs.getHighValue()) &&
	    (lhs.getLowValue() == rhs.getLowValue()) &&
	    (lhs.getCloseValue() == rhs.getCloseValue()) &&
	    (lhs.getVolumeValue() == rhs.getVolumeValue()));
  }

  bool operator!=(const OHLCBar& lhs, const OHLCBar& rhs)
  {
    return !(lhs == rhs);
  }
}
