// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_SCAN_DIAGNOSTIC_RECORD_H
#define __LEVELSCAN_SCAN_DIAGNOSTIC_RECORD_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_levelscan
{
  enum class CandidateOutcome
  {
    COMPLETED,   // takeoff confirmed, signal emitted
    NO_RETEST,   // retest window expired (or data ended) without a retest
    NO_TAKEOFF   // takeoff window expired (or data ended) without a takeoff
  };

  std::string candidateOutcomeToString (CandidateOutcome outcome);

  // Fate of one breakout candidate, reported to an IScanObserver
  class ScanDiagnosticRecord
  {
  public:
    ScanDiagnosticRecord (CandidateOutcome outcome,
			  double level,
			  std::size_t breakoutIndex,
			  const boost::posix_time::ptime& breakoutTime,
			  std::optional<std::size_t> retestIndex,
			  std::optional<std::size_t> takeoffIndex,
			  std::size_t lastBarExamined)
      : m_outcome(outcome),
	m_level(level),
	m_breakoutIndex(breakoutIndex),
	m_breakoutTime(breakoutTime),
	m_retestIndex(retestIndex),
	m_takeoffIndex(takeoffIndex),
	m_lastBarExamined(lastBarExamined)
    {}

    ScanDiagnosticRecord() = delete;

    CandidateOutcome getOutcome() const { return m_outcome; }
    double getLevel() const { return m_level; }
    std::size_t getBreakoutIndex() const { return m_breakoutIndex; }
    const boost::posix_time::ptime& getBreakoutTime() const { return m_breakoutTime; }
    const std::optional<std::size_t>& getRetestIndex() const { return m_retestIndex; }
    const std::optional<std::size_t>& getTakeoffIndex() const { return m_takeoffIndex; }
    std::size_t getLastBarExamined() const { return m_lastBarExamined; }

  private:
    CandidateOutcome m_outcome;
    double m_level;
    std::size_t m_breakoutIndex;
    boost::posix_time::ptime m_breakoutTime;
    std::optional<std::size_t> m_retestIndex;
    std::optional<std::size_t> m_takeoffIndex;
    std::size_t m_lastBarExamined;
  };
}

#endif
