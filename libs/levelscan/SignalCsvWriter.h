// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_SIGNAL_CSV_WRITER_H
#define __LEVELSCAN_SIGNAL_CSV_WRITER_H 1

#include <fstream>
#include <ostream>
#include <string>
#include <vector>
#include "RetestSignal.h"

namespace mkc_levelscan
{
  /**
   * @brief Writes detected signals as CSV.
   *
   * One header row followed by one row per signal, in result order.
   * Timestamps use ISO extended format, prices and returns are written with
   * enough digits to round-trip a double, and an undefined ATR is written as
   * an empty field. An empty result produces a header-only file.
   */
  class SignalCsvWriter
  {
  public:
    static const char* const kHeader;

    // Throws LevelScanException if the file cannot be created
    SignalCsvWriter (const std::string& fileName,
		     const std::vector<RetestSignal>& signals);

    // ofstream is not copyable
    SignalCsvWriter (const SignalCsvWriter& rhs) = delete;
    SignalCsvWriter& operator=(const SignalCsvWriter& rhs) = delete;

    ~SignalCsvWriter() = default;

    void writeFile();

    static void writeSignals (std::ostream& os, const std::vector<RetestSignal>& signals);

  private:
    std::string mFileName;
    std::ofstream mCsvFile;
    const std::vector<RetestSignal>& mSignals;
  };
}

#endif
