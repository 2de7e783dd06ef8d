// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_CSV_SCAN_COLLECTOR_H
#define __LEVELSCAN_CSV_SCAN_COLLECTOR_H 1

#include <fstream>
#include <mutex>
#include <string>
#include "IScanObserver.h"

namespace mkc_levelscan
{
  // Appends one CSV row per resolved breakout candidate. The header is
  // written only when the file is new or empty.
  class CsvScanCollector : public IScanObserver
  {
  public:
    explicit CsvScanCollector(const std::string& filepath);
    ~CsvScanCollector();

    void onCandidateResolved(const ScanDiagnosticRecord& record) override;

  private:
    void writeHeaderIfNeeded();

    std::string m_filepath;
    std::ofstream m_ofs;
    std::mutex m_mutex;
    bool m_headerWritten = false;
  };
}

#endif
