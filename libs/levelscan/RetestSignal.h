// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_RETEST_SIGNAL_H
#define __LEVELSCAN_RETEST_SIGNAL_H 1

#include <cmath>
#include <cstddef>
#include <ostream>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_levelscan
{
  using boost::posix_time::ptime;

  //
  // class RetestSignal
  //
  // One completed breakout -> retest -> takeoff occurrence. Created by the
  // scanner only after all three phases are confirmed and never modified
  // afterwards.
  //

  class RetestSignal
  {
  public:
    RetestSignal (std::size_t breakoutIndex,
		  const ptime& breakoutTime,
		  std::size_t retestIndex,
		  const ptime& retestTime,
		  std::size_t takeoffIndex,
		  const ptime& takeoffTime,
		  double level,
		  double retestLow,
		  double takeoffClose,
		  double atrAtTakeoff)
      : mBreakoutIndex(breakoutIndex),
	mBreakoutTime(breakoutTime),
	mRetestIndex(retestIndex),
	mRetestTime(retestTime),
	mTakeoffIndex(takeoffIndex),
	mTakeoffTime(takeoffTime),
	mLevel(level),
	mRetestLow(retestLow),
	mTakeoffClose(takeoffClose),
	mReturnFromLevel((takeoffClose - level) / std::fabs(level)),
	mAtrAtTakeoff(atrAtTakeoff)
    {}

    RetestSignal (const RetestSignal& rhs) = default;
    RetestSignal& operator=(const RetestSignal& rhs) = default;
    ~RetestSignal() = default;

    std::size_t getBreakoutIndex() const { return mBreakoutIndex; }
    const ptime& getBreakoutTime() const { return mBreakoutTime; }
    std::size_t getRetestIndex() const { return mRetestIndex; }
    const ptime& getRetestTime() const { return mRetestTime; }
    std::size_t getTakeoffIndex() const { return mTakeoffIndex; }
    const ptime& getTakeoffTime() const { return mTakeoffTime; }
    double getLevel() const { return mLevel; }
    double getRetestLow() const { return mRetestLow; }
    double getTakeoffClose() const { return mTakeoffClose; }

    // (takeoff close - level) / |level|, equal to close / level - 1 for a
    // positive level and still positive for a takeoff on negated prices
    double getReturnFromLevel() const { return mReturnFromLevel; }

    double getReturnFromLevelPct() const
    {
      return mReturnFromLevel * 100.0;
    }

    std::size_t getBarsToRetest() const
    {
      return mRetestIndex - mBreakoutIndex;
    }

    std::size_t getBarsToTakeoff() const
    {
      return mTakeoffIndex - mRetestIndex;
    }

    // NaN when the ATR filter was off or ATR was undefined at the takeoff bar
    double getAtrAtTakeoff() const { return mAtrAtTakeoff; }

  private:
    std::size_t mBreakoutIndex;
    ptime mBreakoutTime;
    std::size_t mRetestIndex;
    ptime mRetestTime;
    std::size_t mTakeoffIndex;
    ptime mTakeoffTime;
    double mLevel;
    double mRetestLow;
    double mTakeoffClose;
    double mReturnFromLevel;
    double mAtrAtTakeoff;
  };

  // Compares every field; NaN ATR values compare equal to each other
  bool operator==(const RetestSignal& lhs, const RetestSignal& rhs);
  bool operator!=(const RetestSignal& lhs, const RetestSignal& rhs);

  std::ostream& operator<<(std::ostream& os, const RetestSignal& signal);
}

#endif
