// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "RetestSignal.h"
#include <cmath>

namespace mkc_levelscan
{
  static bool sameValue (double lhs, double rhs)
  {
    return (lhs == rhs) || (std::isnan(lhs) && std::isnan(rhs));
  }

  bool operator==(const RetestSignal& lhs, const RetestSignal& rhs)
  {
    return ((lhs.getBreakoutIndex() == rhs.getBreakoutIndex()) &&
	    (lhs.getBreakoutTime() == rhs.getBreakoutTime()) &&
	    (lhs.getRetestIndex() == rhs.getRetestIndex()) &&
	    (lhs.getRetestTime() == rhs.getRetestTime()) &&
	    (lhs.getTakeoffIndex() == rhs.getTakeoffIndex()) &&
	    (lhs.getTakeoffTime() == rhs.getTakeoffTime()) &&
	    (lhs.getLevel() == rhs.getLevel()) &&
	    (lhs.getRetestLow() == rhs.getRetestLow()) &&
	    (lhs.getTakeoffClose() == rhs.getTakeoffClose()) &&
	    sameValue(lhs.getAtrAtTakeoff(), rhs.getAtrAtTakeoff()));
  }

  bool operator!=(const RetestSignal& lhs, const RetestSignal& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const RetestSignal& signal)
  {
    os << "breakout " << signal.getBreakoutIndex()
       << " (" << boost::posix_time::to_simple_string(signal.getBreakoutTime()) << ")"
       << ", retest " << signal.getRetestIndex()
       << " (" << boost::posix_time::to_simple_string(signal.getRetestTime()) << ")"
       << ", takeoff " << signal.getTakeoffIndex()
       << " (" << boost::posix_time::to_simple_string(signal.getTakeoffTime()) << ")"
       << ", level " << signal.getLevel()
       << ", close " << signal.getTakeoffClose()
       << ", return " << signal.getReturnFromLevelPct() << "%";
    return os;
  }
}
