#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <string>
#include "BarSeriesCsvReader.h"
#include "TestUtils.h"

using namespace mkc_levelscan;
using namespace boost::gregorian;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;

TEST_CASE ("parseBarDateTime formats", "[BarSeriesCsvReader]")
{
  const ptime midnight (date (2024, Jan, 5), time_duration (0, 0, 0));
  const ptime afternoon (date (2024, Jan, 5), time_duration (14, 30, 0));

  REQUIRE (parseBarDateTime ("20240105") == midnight);
  REQUIRE (parseBarDateTime ("2024-01-05") == midnight);
  REQUIRE (parseBarDateTime (" 2024-01-05 ") == midnight);
  REQUIRE (parseBarDateTime ("2024-01-05 14:30:00") == afternoon);
  REQUIRE (parseBarDateTime ("2024-01-05T14:30:00") == afternoon);
  REQUIRE (parseBarDateTime ("2024-01-05 14:30") == afternoon);
  REQUIRE (parseBarDateTime ("2024-01-05T14:30:00Z") == afternoon);
  REQUIRE (parseBarDateTime ("2024-01-05 14:30:00-05:00") == afternoon);
  REQUIRE (parseBarDateTime ("2024-01-05T14:30:00+01:00") == afternoon);

  REQUIRE_THROWS_AS (parseBarDateTime ("garbage"), BarDataException);
  REQUIRE_THROWS_AS (parseBarDateTime ("2024-13-45"), BarDataException);
  REQUIRE_THROWS_AS (parseBarDateTime (""), BarDataException);
}

TEST_CASE ("BarSeriesCsvReader reads daily bars", "[BarSeriesCsvReader]")
{
  std::string fileName = writeTempFile (
    "Date,Open,High,Low,Close,Adj Close,Volume\n"
    "2024-01-04,182.15,183.09,180.88,181.91,181.50,71983600\n"
    "2024-01-02,187.15,188.44,183.89,185.64,185.20,82488700\n"
    "2024-01-03,184.22,185.88,183.43,184.25,183.80,58414500\n"
    "2024-01-03,1.00,2.00,0.50,1.50,1.50,100\n"
    "2024-01-05,,182.76,180.17,181.18,181.00,62303300\n"
    "2024-01-08,182.09,185.60,181.50,180.00,180.00,59144500\n"
    "20240109,183.92,185.15,182.73,185.14,185.00,42841800\n");

  BarSeriesCsvReader reader (fileName);
  reader.readFile();
  std::remove (fileName.c_str());

  auto series = reader.getTimeSeries();

  // Missing open, close below low and a duplicate timestamp are dropped
  REQUIRE (reader.getNumRowsRead() == 7);
  REQUIRE (reader.getNumRowsDropped() == 3);
  REQUIRE (series->getNumEntries() == 4);

  REQUIRE (series->getEntry (0) == createBar ("20240102", 187.15, 188.44, 183.89, 185.64, 82488700));
  // First row for a repeated timestamp wins
  REQUIRE (series->getEntry (1) == createBar ("20240103", 184.22, 185.88, 183.43, 184.25, 58414500));
  REQUIRE (series->getEntry (2) == createBar ("20240104", 182.15, 183.09, 180.88, 181.91, 71983600));
  REQUIRE (series->getEntry (3) == createBar ("20240109", 183.92, 185.15, 182.73, 185.14, 42841800));
}

TEST_CASE ("BarSeriesCsvReader reads intraday bars without volume", "[BarSeriesCsvReader]")
{
  std::string fileName = writeTempFile (
    "Datetime,Open,High,Low,Close\n"
    "2024-03-11 09:30:00-04:00,100,101,99.5,100.5\n"
    "2024-03-11T09:45:00-04:00,100.5,102,100,101.5\n"
    "2024-03-11 10:00,101.5,101.8,100.9,101\n");

  BarSeriesCsvReader reader (fileName);
  reader.readFile();
  std::remove (fileName.c_str());

  auto series = reader.getTimeSeries();

  REQUIRE (series->getNumEntries() == 3);
  REQUIRE (series->getDateTime (0) == ptime (date (2024, Mar, 11), time_duration (9, 30, 0)));
  REQUIRE (series->getDateTime (1) == ptime (date (2024, Mar, 11), time_duration (9, 45, 0)));
  REQUIRE (series->getDateTime (2) == ptime (date (2024, Mar, 11), time_duration (10, 0, 0)));
  REQUIRE (series->getCloseValue (1) == 101.5);
  REQUIRE (series->getEntry (2).getVolumeValue() == 0.0);
}

TEST_CASE ("BarSeriesCsvReader errors", "[BarSeriesCsvReader]")
{
  SECTION ("Missing file")
    {
      REQUIRE_THROWS_AS (BarSeriesCsvReader ("/nonexistent/levelscan/bars.csv"), BarDataException);
    }

  SECTION ("Missing price column")
    {
      std::string fileName = writeTempFile ("Date,Open,High,Close\n2024-01-02,1,2,1.5\n");
      BarSeriesCsvReader reader (fileName);

      REQUIRE_THROWS_AS (reader.readFile(), BarDataException);
      std::remove (fileName.c_str());
    }

  SECTION ("Missing timestamp column")
    {
      std::string fileName = writeTempFile ("Open,High,Low,Close\n1,2,0.5,1.5\n");
      BarSeriesCsvReader reader (fileName);

      REQUIRE_THROWS_AS (reader.readFile(), BarDataException);
      std::remove (fileName.c_str());
    }

  SECTION ("Unparsable timestamp")
    {
      std::string fileName = writeTempFile ("Date,Open,High,Low,Close\nyesterday,1,2,0.5,1.5\n");
      BarSeriesCsvReader reader (fileName);

      REQUIRE_THROWS_AS (reader.readFile(), BarDataException);
      std::remove (fileName.c_str());
    }
}
