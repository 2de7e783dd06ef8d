#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include "SignalCsvWriter.h"
#include "LevelScanException.h"
#include "TestUtils.h"

using namespace mkc_levelscan;
using namespace Catch;

namespace
{
  // Keeps empty trailing fields
  std::vector<std::string> splitFields (const std::string& line)
  {
    std::vector<std::string> fields;
    boost::split (fields, line, boost::is_any_of (","));
    return fields;
  }

  std::vector<std::string> readLines (std::istream& in)
  {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline (in, line))
      lines.push_back (line);
    return lines;
  }
}

TEST_CASE ("SignalCsvWriter writes one row per signal", "[SignalCsvWriter]")
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  std::vector<RetestSignal> signals;
  signals.emplace_back (1, barTime (1), 3, barTime (3), 4, barTime (4), 100.0, 99.8, 103.5, nan);
  signals.emplace_back (7, barTime (7), 8, barTime (8), 11, barTime (11), 100.0, 100.2, 104.0, 2.25);

  std::ostringstream os;
  SignalCsvWriter::writeSignals (os, signals);

  std::istringstream in (os.str());
  std::vector<std::string> lines = readLines (in);

  REQUIRE (lines.size() == 3);
  REQUIRE (lines[0] == SignalCsvWriter::kHeader);
  REQUIRE (splitFields (lines[0]).size() == 14);

  std::vector<std::string> first = splitFields (lines[1]);
  REQUIRE (first.size() == 14);
  REQUIRE (first[0] == "1");
  REQUIRE (first[1] == "2024-01-02T00:00:00");
  REQUIRE (first[2] == "3");
  REQUIRE (first[3] == "2024-01-04T00:00:00");
  REQUIRE (first[4] == "4");
  REQUIRE (first[5] == "2024-01-05T00:00:00");
  REQUIRE (std::stod (first[6]) == 100.0);
  // Full precision survives the round trip
  REQUIRE (std::stod (first[7]) == 99.8);
  REQUIRE (std::stod (first[8]) == 103.5);
  REQUIRE (std::stod (first[9]) == Approx (0.035));
  REQUIRE (std::stod (first[10]) == Approx (3.5));
  REQUIRE (first[11] == "2");
  REQUIRE (first[12] == "1");
  REQUIRE (first[13].empty());

  std::vector<std::string> second = splitFields (lines[2]);
  REQUIRE (second[0] == "7");
  REQUIRE (second[11] == "1");
  REQUIRE (second[12] == "3");
  REQUIRE (std::stod (second[13]) == 2.25);
}

TEST_CASE ("SignalCsvWriter with no signals writes only the header", "[SignalCsvWriter]")
{
  std::vector<RetestSignal> signals;
  std::string fileName = uniqueTempFileName();

  {
    SignalCsvWriter writer (fileName, signals);
    writer.writeFile();
  }

  std::ifstream in (fileName);
  REQUIRE (in.is_open());
  std::vector<std::string> lines = readLines (in);
  std::remove (fileName.c_str());

  REQUIRE (lines.size() == 1);
  REQUIRE (lines[0] == SignalCsvWriter::kHeader);
}

TEST_CASE ("SignalCsvWriter reports an unwritable path", "[SignalCsvWriter]")
{
  std::vector<RetestSignal> signals;
  REQUIRE_THROWS_AS (SignalCsvWriter ("/nonexistent/levelscan/signals.csv", signals), LevelScanException);
}
