// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_SCAN_PARAMETERS_H
#define __LEVELSCAN_SCAN_PARAMETERS_H 1

#include <string>
#include "BarSeriesIndicators.h"

namespace mkc_levelscan
{
  /**
   * @brief Immutable configuration for one breakout/retest/takeoff scan.
   *
   * All values are validated on construction; an out of range value raises
   * InvalidInputException, so a constructed object is always usable.
   *
   * - tolerance: fractional half-width of the retest zone around the level (> 0)
   * - maxRetestWindow: bars after the breakout in which the retest must occur (>= 1)
   * - takeoffWindow: bars after the retest in which the takeoff must occur (>= 1)
   * - takeoffPct: minimum fractional move above the level for a takeoff (>= 0)
   * - atrEnabled / atrMultiplier / atrPeriod: optional volatility-scaled
   *   takeoff threshold level + ATR * atrMultiplier
   */
  class ScanParameters
  {
  public:
    static constexpr double kDefaultTolerance = 0.001;
    static constexpr int kDefaultMaxRetestWindow = 20;
    static constexpr int kDefaultTakeoffWindow = 20;
    static constexpr double kDefaultTakeoffPct = 0.005;
    static constexpr bool kDefaultAtrEnabled = true;
    static constexpr double kDefaultAtrMultiplier = 1.0;

    ScanParameters (double tolerance = kDefaultTolerance,
		    int maxRetestWindow = kDefaultMaxRetestWindow,
		    int takeoffWindow = kDefaultTakeoffWindow,
		    double takeoffPct = kDefaultTakeoffPct,
		    bool atrEnabled = kDefaultAtrEnabled,
		    double atrMultiplier = kDefaultAtrMultiplier,
		    int atrPeriod = kDefaultAtrPeriod);

    ScanParameters (const ScanParameters& rhs) = default;
    ScanParameters& operator=(const ScanParameters& rhs) = default;
    ~ScanParameters() = default;

    double getTolerance() const
    {
      return mTolerance;
    }

    int getMaxRetestWindow() const
    {
      return mMaxRetestWindow;
    }

    int getTakeoffWindow() const
    {
      return mTakeoffWindow;
    }

    double getTakeoffPct() const
    {
      return mTakeoffPct;
    }

    bool isAtrEnabled() const
    {
      return mAtrEnabled;
    }

    double getAtrMultiplier() const
    {
      return mAtrMultiplier;
    }

    int getAtrPeriod() const
    {
      return mAtrPeriod;
    }

    std::string toString() const;

  private:
    double mTolerance;
    int mMaxRetestWindow;
    int mTakeoffWindow;
    double mTakeoffPct;
    bool mAtrEnabled;
    double mAtrMultiplier;
    int mAtrPeriod;
  };

  bool operator==(const ScanParameters& lhs, const ScanParameters& rhs);
  bool operator!=(const ScanParameters& lhs, const ScanParameters& rhs);
}

#endif
