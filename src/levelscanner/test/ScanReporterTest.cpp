#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include "ScanReporter.h"
#include "TestUtils.h"

using namespace mkc_levelscan;
using namespace levelscanner;

namespace
{
  std::vector<RetestSignal> createSignals()
  {
    std::vector<RetestSignal> signals;
    signals.emplace_back (1, barTime (1), 3, barTime (3), 4, barTime (4), 100.0, 99.8, 103.5,
			  std::numeric_limits<double>::quiet_NaN());
    signals.emplace_back (7, barTime (7), 8, barTime (8), 11, barTime (11), 100.0, 100.2, 104.0, 2.25);
    return signals;
  }
}

TEST_CASE ("ScanReporter leaves the stream format unchanged", "[ScanReporter]")
{
  std::ostringstream os;
  os.precision (6);
  const std::ios_base::fmtflags flags = os.flags();

  ScanReporter reporter (os);

  reporter.reportParameters (60000.123456789, ScanParameters());
  REQUIRE (os.precision() == 6);

  IndicatorSeries atr ("ATR", {std::numeric_limits<double>::quiet_NaN(), 1.23456});
  reporter.reportLastAtr (atr, 14);
  REQUIRE (os.precision() == 6);
  REQUIRE (os.flags() == flags);

  reporter.reportSignals (createSignals());
  REQUIRE (os.precision() == 6);
  REQUIRE (os.flags() == flags);

  std::ostringstream check;
  check.precision (6);
  check << 1.0 / 3.0;
  os.str ("");
  os << 1.0 / 3.0;
  REQUIRE (os.str() == check.str());
}

TEST_CASE ("ScanReporter output", "[ScanReporter]")
{
  std::ostringstream os;
  ScanReporter reporter (os);

  SECTION ("Parameters")
    {
      reporter.reportParameters (60000.5, ScanParameters());

      REQUIRE (os.str().find ("[Scan] Level: 60000.5") != std::string::npos);
      REQUIRE (os.str().find ("ATR filter ON (14 bars x 1)") != std::string::npos);
    }

  SECTION ("Last ATR")
    {
      IndicatorSeries atr ("ATR", {std::numeric_limits<double>::quiet_NaN(), 1.23456});
      reporter.reportLastAtr (atr, 14);

      REQUIRE (os.str() == "[ATR] Last ATR(14): 1.2346\n");
    }

  SECTION ("ATR still in warm-up")
    {
      IndicatorSeries atr ("ATR", {std::numeric_limits<double>::quiet_NaN()});
      reporter.reportLastAtr (atr, 14);

      REQUIRE (os.str() == "[ATR] Not enough bars for an ATR value\n");
    }

  SECTION ("Signal table")
    {
      reporter.reportSignals (createSignals());
      const std::string report = os.str();

      REQUIRE (report.find ("Found 2 breakout -> retest -> takeoff sequence(s)") != std::string::npos);
      REQUIRE (report.find ("2024-01-02T00:00:00") != std::string::npos);
      REQUIRE (report.find ("103.50") != std::string::npos);
      REQUIRE (report.find ("3.50") != std::string::npos);
      REQUIRE (report.find ("2.25") != std::string::npos);
    }

  SECTION ("No signals")
    {
      reporter.reportSignals (std::vector<RetestSignal>());

      REQUIRE (os.str() == "No breakout -> retest -> takeoff sequences found with the current settings.\n");
    }
}

TEST_CASE ("ScanReporter data range", "[ScanReporter]")
{
  std::ostringstream os;
  ScanReporter reporter (os);

  BarSeries series = createSeries ({99.0, 101.0, 100.5}, {98.0, 100.5, 100.2});
  reporter.reportDataRange ("bars.csv", series, 2);

  const std::string report = os.str();
  REQUIRE (report.find ("[Data] bars.csv: 3 bars from 2024-01-01T00:00:00 to 2024-01-03T00:00:00") != std::string::npos);
  REQUIRE (report.find ("2 row(s) dropped") != std::string::npos);
}
