#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "BarSeries.h"
#include "IndicatorSeries.h"
#include "RetestSignal.h"
#include "ScanParameters.h"

namespace levelscanner
{
  using mkc_levelscan::BarSeries;
  using mkc_levelscan::IndicatorSeries;
  using mkc_levelscan::RetestSignal;
  using mkc_levelscan::ScanParameters;

  /**
   * @brief Console report for a levelscanner run
   *
   * All output goes to the stream given at construction, which is either
   * std::cout or a TeeStream that also writes the log file.
   */
  class ScanReporter
  {
  public:
    explicit ScanReporter(std::ostream& os)
      : mOut(os)
    {}

    void reportDataRange(const std::string& fileName,
                         const BarSeries& series,
                         std::size_t rowsDropped) const;

    void reportParameters(double level, const ScanParameters& parameters) const;

    // Last defined ATR value, or a note that the series is too short
    void reportLastAtr(const IndicatorSeries& atr, int period) const;

    void reportSignals(const std::vector<RetestSignal>& signals) const;

  private:
    std::ostream& mOut;
  };
}
