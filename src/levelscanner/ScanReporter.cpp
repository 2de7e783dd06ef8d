#include "ScanReporter.h"
#include <cmath>
#include <iomanip>
#include <boost/date_time/posix_time/posix_time.hpp>

using boost::posix_time::to_iso_extended_string;

namespace levelscanner
{
  void ScanReporter::reportDataRange(const std::string& fileName,
                                     const BarSeries& series,
                                     std::size_t rowsDropped) const
  {
    mOut << "[Data] " << fileName << ": " << series.getNumEntries() << " bars";
    if (!series.isEmpty())
      mOut << " from " << to_iso_extended_string(series.getFirstDateTime())
           << " to " << to_iso_extended_string(series.getLastDateTime());
    mOut << std::endl;

    if (rowsDropped > 0)
      mOut << "[Data] " << rowsDropped << " row(s) dropped (missing values, bad prices or duplicate timestamps)" << std::endl;
  }

  void ScanReporter::reportParameters(double level, const ScanParameters& parameters) const
  {
    const std::streamsize oldPrecision = mOut.precision(10);

    mOut << "[Scan] Level: " << level << std::endl;
    mOut << "[Scan] " << parameters.toString() << std::endl;

    mOut.precision(oldPrecision);
  }

  void ScanReporter::reportLastAtr(const IndicatorSeries& atr, int period) const
  {
    auto lastAtr = atr.getLastDefinedValue();
    if (!lastAtr)
      {
        mOut << "[ATR] Not enough bars for an ATR value" << std::endl;
        return;
      }

    const std::ios_base::fmtflags oldFlags = mOut.flags();
    const std::streamsize oldPrecision = mOut.precision(4);

    mOut << "[ATR] Last ATR(" << period << "): " << std::fixed << *lastAtr << std::endl;

    mOut.flags(oldFlags);
    mOut.precision(oldPrecision);
  }

  void ScanReporter::reportSignals(const std::vector<RetestSignal>& signals) const
  {
    if (signals.empty())
      {
        mOut << "No breakout -> retest -> takeoff sequences found with the current settings." << std::endl;
        return;
      }

    mOut << "Found " << signals.size() << " breakout -> retest -> takeoff sequence(s)" << std::endl;

    const std::ios_base::fmtflags oldFlags = mOut.flags();
    const std::streamsize oldPrecision = mOut.precision();

    mOut << std::left
         << std::setw(21) << "Breakout"
         << std::setw(21) << "Retest"
         << std::setw(21) << "Takeoff"
         << std::right
         << std::setw(12) << "Level"
         << std::setw(12) << "RetestLow"
         << std::setw(13) << "TakeoffClose"
         << std::setw(10) << "Return%"
         << std::setw(8) << "Bars R"
         << std::setw(8) << "Bars T"
         << std::setw(10) << "ATR"
         << std::endl;

    mOut << std::fixed;
    for (const auto& signal : signals)
      {
        mOut << std::left
             << std::setw(21) << to_iso_extended_string(signal.getBreakoutTime())
             << std::setw(21) << to_iso_extended_string(signal.getRetestTime())
             << std::setw(21) << to_iso_extended_string(signal.getTakeoffTime())
             << std::right << std::setprecision(2)
             << std::setw(12) << signal.getLevel()
             << std::setw(12) << signal.getRetestLow()
             << std::setw(13) << signal.getTakeoffClose()
             << std::setw(10) << signal.getReturnFromLevelPct()
             << std::setw(8) << signal.getBarsToRetest()
             << std::setw(8) << signal.getBarsToTakeoff();

        if (std::isnan(signal.getAtrAtTakeoff()))
          mOut << std::setw(10) << "-";
        else
          mOut << std::setw(10) << signal.getAtrAtTakeoff();

        mOut << std::endl;
      }

    mOut.flags(oldFlags);
    mOut.precision(oldPrecision);
  }
}
