// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ScanParameters.h"
#include "LevelScanException.h"
#include <cmath>
#include <sstream>

namespace mkc_levelscan
{
  ScanParameters::ScanParameters (double tolerance,
				  int maxRetestWindow,
				  int takeoffWindow,
				  double takeoffPct,
				  bool atrEnabled,
				  double atrMultiplier,
				  int atrPeriod)
    : mTolerance(tolerance),
      mMaxRetestWindow(maxRetestWindow),
      mTakeoffWindow(takeoffWindow),
      mTakeoffPct(takeoffPct),
      mAtrEnabled(atrEnabled),
      mAtrMultiplier(atrMultiplier),
      mAtrPeriod(atrPeriod)
  {
    if (!std::isfinite(tolerance) || tolerance <= 0.0)
      throw InvalidInputException("ScanParameters: tolerance must be finite and > 0, got " +
				  priceToString(tolerance));

    if (maxRetestWindow <= 0)
      throw InvalidInputException("ScanParameters: max retest window must be positive, got " +
				  std::to_string(maxRetestWindow));

    if (takeoffWindow <= 0)
      throw InvalidInputException("ScanParameters: takeoff window must be positive, got " +
				  std::to_string(takeoffWindow));

    if (!std::isfinite(takeoffPct) || takeoffPct < 0.0)
      throw InvalidInputException("ScanParameters: takeoff percent must be finite and >= 0, got " +
				  priceToString(takeoffPct));

    if (atrPeriod <= 0)
      throw InvalidInputException("ScanParameters: ATR period must be positive, got " +
				  std::to_string(atrPeriod));

    if (atrEnabled && (!std::isfinite(atrMultiplier) || atrMultiplier < 0.0))
      throw InvalidInputException("ScanParameters: ATR multiplier must be finite and >= 0, got " +
				  priceToString(atrMultiplier));
  }

  std::string ScanParameters::toString() const
  {
    std::ostringstream oss;
    oss << "Tolerance: +/-" << mTolerance * 100.0 << "%"
	<< "  Max retest bars: " << mMaxRetestWindow
	<< "  Max takeoff bars: " << mTakeoffWindow
	<< "  Takeoff > " << mTakeoffPct * 100.0 << "%";

    if (mAtrEnabled)
      oss << "  ATR filter ON (" << mAtrPeriod << " bars x " << mAtrMultiplier << ")";
    else
      oss << "  ATR filter OFF";

    return oss.str();
  }

  bool operator==(const ScanParameters& lhs, const ScanParameters& rhs)
  {
    return ((lhs.getTolerance() == rhs.getTolerance()) &&
	    (lhs.getMaxRetestWindow() == rhs.getMaxRetestWindow()) &&
	    (lhs.getTakeoffWindow() == rhs.getTakeoffWindow()) &&
	    (lhs.getTakeoffPct() == rhs.getTakeoffPct()) &&
	    (lhs.isAtrEnabled() == rhs.isAtrEnabled()) &&
	    (lhs.getAtrMultiplier() == rhs.getAtrMultiplier()) &&
	    (lhs.getAtrPeriod() == rhs.getAtrPeriod()));
  }

  bool operator!=(const ScanParameters& lhs, const ScanParameters& rhs)
  {
    return !(lhs == rhs);
  }
}
