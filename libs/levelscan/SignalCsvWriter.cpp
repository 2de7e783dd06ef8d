// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SignalCsvWriter.h"
#include "LevelScanException.h"
#include <cmath>
#include <iomanip>
#include <limits>

namespace mkc_levelscan
{
  const char* const SignalCsvWriter::kHeader =
    "breakout_index,breakout_time,retest_index,retest_time,takeoff_index,takeoff_time,"
    "level,retest_low,takeoff_close,return_from_level,return_from_level_pct,"
    "bars_to_retest,bars_to_takeoff,atr_at_takeoff";

  SignalCsvWriter::SignalCsvWriter (const std::string& fileName,
				    const std::vector<RetestSignal>& signals)
    : mFileName(fileName),
      mCsvFile(fileName),
      mSignals(signals)
  {
    if (!mCsvFile.is_open())
      throw LevelScanException("SignalCsvWriter: cannot open " + fileName + " for writing");
  }

  void SignalCsvWriter::writeFile()
  {
    writeSignals(mCsvFile, mSignals);
    mCsvFile.flush();

    if (!mCsvFile)
      throw LevelScanException("SignalCsvWriter: error writing " + mFileName);
  }

  void SignalCsvWriter::writeSignals (std::ostream& os, const std::vector<RetestSignal>& signals)
  {
    const std::streamsize oldPrecision = os.precision(std::numeric_limits<double>::max_digits10);

    os << kHeader << "\n";

    for (const auto& signal : signals)
      {
	os << signal.getBreakoutIndex() << ","
	   << boost::posix_time::to_iso_extended_string(signal.getBreakoutTime()) << ","
	   << signal.getRetestIndex() << ","
	   << boost::posix_time::to_iso_extended_string(signal.getRetestTime()) << ","
	   << signal.getTakeoffIndex() << ","
	   << boost::posix_time::to_iso_extended_string(signal.getTakeoffTime()) << ","
	   << signal.getLevel() << ","
	   << signal.getRetestLow() << ","
	   << signal.getTakeoffClose() << ","
	   << signal.getReturnFromLevel() << ","
	   << signal.getReturnFromLevelPct() << ","
	   << signal.getBarsToRetest() << ","
	   << signal.getBarsToTakeoff() << ",";

	if (std::isfinite(signal.getAtrAtTakeoff()))
	  os << signal.getAtrAtTakeoff();

	os << "\n";
      }

    os.precision(oldPrecision);
  }
}
