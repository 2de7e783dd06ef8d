// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_BREAKOUT_RETEST_SCANNER_H
#define __LEVELSCAN_BREAKOUT_RETEST_SCANNER_H 1

#include <memory>
#include <vector>
#include "BarSeries.h"
#include "IndicatorSeries.h"
#include "IScanObserver.h"
#include "RetestSignal.h"
#include "ScanParameters.h"

namespace mkc_levelscan
{
  /**
   * @brief Single forward pass state machine that finds breakout -> retest ->
   * takeoff sequences around a fixed price level.
   *
   * States, evaluated bar by bar in index order:
   *
   * 1. SEEKING_BREAKOUT: bar i is a breakout when close[i] > level and
   *    close[i-1] <= level. The retest deadline becomes i + maxRetestWindow.
   * 2. SEEKING_RETEST (bars breakout+1 .. deadline): the first bar with
   *    level - |level|*tol <= low <= level + |level|*tol and close > level is
   *    the retest.
   *    The takeoff deadline becomes retest + takeoffWindow.
   * 3. SEEKING_TAKEOFF (bars retest+1 .. deadline): the first bar whose close
   *    strictly exceeds max(level + |level|*takeoffPct, level + ATR*atrMultiplier)
   *    is the takeoff; a signal is emitted and the breakout search continues
   *    at takeoff+1. The ATR term only applies when the filter is enabled and
   *    ATR is defined at that bar; otherwise the percentage threshold alone
   *    decides.
   *
   * When a deadline passes, or the data ends, with a candidate still open the
   * candidate is abandoned and the breakout search resumes at breakout+1,
   * so breakouts that occurred while the candidate was open are re-evaluated.
   *
   * Zone and threshold offsets use |level|, which matches the percentage
   * rules for a positive level and keeps them meaningful on negated prices.
   * Signals therefore never overlap: each breakout lies after the previous
   * signal's takeoff.
   *
   * A scan keeps all of its state in locals. Scanning the same inputs again
   * yields the same signals, and one scanner may be shared between threads as
   * long as its observer tolerates concurrent calls.
   */
  class BreakoutRetestScanner
  {
  public:
    explicit BreakoutRetestScanner (const ScanParameters& parameters);

    BreakoutRetestScanner (const ScanParameters& parameters,
			   std::shared_ptr<IScanObserver> observer);

    BreakoutRetestScanner (const BreakoutRetestScanner& rhs) = default;
    BreakoutRetestScanner& operator=(const BreakoutRetestScanner& rhs) = default;
    ~BreakoutRetestScanner() = default;

    /**
     * @brief Scans a series, computing ATR itself when the filter is enabled.
     * @throws InvalidInputException if the series has fewer than 2 bars or
     *         the level is not finite.
     */
    std::vector<RetestSignal> scan (const BarSeries& series, double level) const;

    /**
     * @brief Scans a series using a pre-computed ATR series.
     *
     * The ATR series is ignored when the filter is disabled.
     * @throws InvalidInputException as above, or if the ATR series length
     *         differs from the bar series length.
     */
    std::vector<RetestSignal> scan (const BarSeries& series,
				    double level,
				    const IndicatorSeries& atr) const;

    const ScanParameters& getParameters() const
    {
      return mParameters;
    }

  private:
    void validateInput (const BarSeries& series, double level) const;

    std::vector<RetestSignal> runScan (const BarSeries& series,
				       double level,
				       const IndicatorSeries* atr) const;

    void notify (const ScanDiagnosticRecord& record) const;

  private:
    ScanParameters mParameters;
    std::shared_ptr<IScanObserver> mObserver;
  };

  // Convenience entry points equivalent to BreakoutRetestScanner(parameters).scan(...)
  std::vector<RetestSignal> ScanForRetests (const BarSeries& series,
					    double level,
					    const ScanParameters& parameters);

  std::vector<RetestSignal> ScanForRetests (const BarSeries& series,
					    double level,
					    const ScanParameters& parameters,
					    const IndicatorSeries& atr);
}

#endif
