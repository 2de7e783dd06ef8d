// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "CsvScanCollector.h"
#include "LevelScanException.h"
#include <filesystem>
#include <iomanip>
#include <limits>
#include <system_error>

namespace mkc_levelscan
{
  CsvScanCollector::CsvScanCollector(const std::string& filepath)
    : m_filepath(filepath)
  {
    std::error_code ec;
    if (std::filesystem::exists(m_filepath, ec) && std::filesystem::file_size(m_filepath, ec) > 0 && !ec)
      m_headerWritten = true;

    m_ofs.open(m_filepath, std::ios::out | std::ios::app);
    if (!m_ofs.is_open())
      throw LevelScanException("Failed to open scan diagnostics file: " + m_filepath);

    if (!m_headerWritten)
      writeHeaderIfNeeded();
  }

  CsvScanCollector::~CsvScanCollector()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_ofs.is_open()) m_ofs.close();
  }

  void CsvScanCollector::writeHeaderIfNeeded()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_headerWritten) return;

    m_ofs << "Outcome,Level,BreakoutIndex,BreakoutTime,RetestIndex,TakeoffIndex,LastBarExamined\n";
    m_ofs.flush();
    m_headerWritten = true;
  }

  void CsvScanCollector::onCandidateResolved(const ScanDiagnosticRecord& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_ofs.is_open()) return;

    m_ofs << candidateOutcomeToString(r.getOutcome()) << ","
	  << std::setprecision(std::numeric_limits<double>::max_digits10) << r.getLevel() << ","
	  << r.getBreakoutIndex() << ","
	  << boost::posix_time::to_iso_extended_string(r.getBreakoutTime()) << ",";

    if (r.getRetestIndex())
      m_ofs << *r.getRetestIndex();
    m_ofs << ",";

    if (r.getTakeoffIndex())
      m_ofs << *r.getTakeoffIndex();
    m_ofs << ",";

    m_ofs << r.getLastBarExamined() << "\n";
    m_ofs.flush();
  }
}
