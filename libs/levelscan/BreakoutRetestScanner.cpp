// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BreakoutRetestScanner.h"
#include "BarSeriesIndicators.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace mkc_levelscan
{
  namespace
  {
    enum class ScanState
    {
      SEEKING_BREAKOUT,
      SEEKING_RETEST,
      SEEKING_TAKEOFF
    };
  }

  BreakoutRetestScanner::BreakoutRetestScanner (const ScanParameters& parameters)
    : BreakoutRetestScanner(parameters, nullptr)
  {}

  BreakoutRetestScanner::BreakoutRetestScanner (const ScanParameters& parameters,
						std::shared_ptr<IScanObserver> observer)
    : mParameters(parameters),
      mObserver(std::move(observer))
  {}

  std::vector<RetestSignal> BreakoutRetestScanner::scan (const BarSeries& series, double level) const
  {
    validateInput(series, level);

    if (!mParameters.isAtrEnabled())
      return runScan(series, level, nullptr);

    IndicatorSeries atr(AverageTrueRangeSeries(series, mParameters.getAtrPeriod()));
    return runScan(series, level, &atr);
  }

  std::vector<RetestSignal> BreakoutRetestScanner::scan (const BarSeries& series,
							 double level,
							 const IndicatorSeries& atr) const
  {
    validateInput(series, level);

    if (!mParameters.isAtrEnabled())
      return runScan(series, level, nullptr);

    if (atr.getNumEntries() != series.getNumEntries())
      throw InvalidInputException("BreakoutRetestScanner: ATR series has " + std::to_string(atr.getNumEntries()) +
				  " values but the bar series has " + std::to_string(series.getNumEntries()) + " bars");

    return runScan(series, level, &atr);
  }

  void BreakoutRetestScanner::validateInput (const BarSeries& series, double level) const
  {
    if (series.getNumEntries() < 2)
      throw InvalidInputException("BreakoutRetestScanner: at least 2 bars are required, got " +
				  std::to_string(series.getNumEntries()));

    if (!std::isfinite(level))
      throw InvalidInputException("BreakoutRetestScanner: level must be a finite number");
  }

  void BreakoutRetestScanner::notify (const ScanDiagnosticRecord& record) const
  {
    if (mObserver)
      mObserver->onCandidateResolved(record);
  }

  std::vector<RetestSignal> BreakoutRetestScanner::runScan (const BarSeries& series,
							    double level,
							    const IndicatorSeries* atr) const
  {
    const std::size_t numBars = series.getNumEntries();
    // Offsets scale with |level| so a negated series keeps zoneLow <= zoneHigh
    // and a takeoff threshold above the level
    const double levelMagnitude = std::fabs(level);
    const double zoneHigh = level + levelMagnitude * mParameters.getTolerance();
    const double zoneLow = level - levelMagnitude * mParameters.getTolerance();
    const double pctThreshold = level + levelMagnitude * mParameters.getTakeoffPct();
    const std::size_t maxRetestWindow = static_cast<std::size_t>(mParameters.getMaxRetestWindow());
    const std::size_t takeoffWindow = static_cast<std::size_t>(mParameters.getTakeoffWindow());

    std::vector<RetestSignal> signals;

    ScanState state = ScanState::SEEKING_BREAKOUT;
    std::size_t breakoutIndex = 0;
    std::size_t retestIndex = 0;
    std::size_t deadline = 0;
    std::size_t i = 1;

    // Abandons the open candidate and rewinds to the bar after its breakout
    auto abandonCandidate = [&](CandidateOutcome outcome) {
      std::optional<std::size_t> retest;
      if (state == ScanState::SEEKING_TAKEOFF)
	retest = retestIndex;

      notify(ScanDiagnosticRecord(outcome, level, breakoutIndex,
				  series.getDateTime(breakoutIndex),
				  retest, std::nullopt,
				  std::min(deadline, numBars - 1)));

      state = ScanState::SEEKING_BREAKOUT;
      i = breakoutIndex + 1;
    };

    while (i < numBars || state != ScanState::SEEKING_BREAKOUT)
      {
	if (state == ScanState::SEEKING_BREAKOUT)
	  {
	    if (series.getCloseValue(i) > level && series.getCloseValue(i - 1) <= level)
	      {
		breakoutIndex = i;
		deadline = i + maxRetestWindow;
		state = ScanState::SEEKING_RETEST;
	      }

	    ++i;
	  }
	else if (state == ScanState::SEEKING_RETEST)
	  {
	    if (i > deadline || i >= numBars)
	      {
		abandonCandidate(CandidateOutcome::NO_RETEST);
		continue;
	      }

	    const double low = series.getLowValue(i);
	    if (low <= zoneHigh && low >= zoneLow && series.getCloseValue(i) > level)
	      {
		retestIndex = i;
		deadline = i + takeoffWindow;
		state = ScanState::SEEKING_TAKEOFF;
	      }

	    ++i;
	  }
	else
	  {
	    if (i > deadline || i >= numBars)
	      {
		abandonCandidate(CandidateOutcome::NO_TAKEOFF);
		continue;
	      }

	    double threshold = pctThreshold;
	    double atrValue = std::numeric_limits<double>::quiet_NaN();
	    if (atr != nullptr)
	      {
		atrValue = atr->getValue(i);
		// Undefined ATR fails only the ATR branch of the threshold
		if (std::isfinite(atrValue))
		  threshold = std::max(threshold, level + atrValue * mParameters.getAtrMultiplier());
	      }

	    const double close = series.getCloseValue(i);
	    if (close > threshold)
	      {
		signals.emplace_back(breakoutIndex, series.getDateTime(breakoutIndex),
				     retestIndex, series.getDateTime(retestIndex),
				     i, series.getDateTime(i),
				     level,
				     series.getLowValue(retestIndex),
				     close,
				     atrValue);

		notify(ScanDiagnosticRecord(CandidateOutcome::COMPLETED, level, breakoutIndex,
					    series.getDateTime(breakoutIndex),
					    retestIndex, i, i));

		state = ScanState::SEEKING_BREAKOUT;
	      }

	    ++i;
	  }
      }

    return signals;
  }

  std::vector<RetestSignal> ScanForRetests (const BarSeries& series,
					    double level,
					    const ScanParameters& parameters)
  {
    return BreakoutRetestScanner(parameters).scan(series, level);
  }

  std::vector<RetestSignal> ScanForRetests (const BarSeries& series,
					    double level,
					    const ScanParameters& parameters,
					    const IndicatorSeries& atr)
  {
    return BreakoutRetestScanner(parameters).scan(series, level, atr);
  }
}
