#include <catch2/catch_test_macros.hpp>
#include "BarSeries.h"
#include "LevelScanException.h"
#include "TestUtils.h"

using namespace mkc_levelscan;
using namespace boost::gregorian;

TEST_CASE ("BarSeries operations", "[BarSeries]")
{
  auto entry0 = createBar ("20240102", 187.15, 188.44, 183.89, 185.64, 82488700);
  auto entry1 = createBar ("20240103", 184.22, 185.88, 183.43, 184.25, 58414500);
  auto entry2 = createBar ("20240104", 182.15, 183.09, 180.88, 181.91, 71983600);
  auto entry3 = createBar ("20240105", 181.99, 182.76, 180.17, 181.18, 62303300);

  BarSeries series;
  REQUIRE (series.isEmpty());
  REQUIRE (series.getNumEntries() == 0);

  series.addEntry (entry0);
  series.addEntry (entry1);
  series.addEntry (entry2);
  series.addEntry (entry3);

  REQUIRE_FALSE (series.isEmpty());
  REQUIRE (series.getNumEntries() == 4);
  REQUIRE (series.getEntry (2) == entry2);
  REQUIRE (series.getOpenValue (0) == 187.15);
  REQUIRE (series.getHighValue (1) == 185.88);
  REQUIRE (series.getLowValue (2) == 180.88);
  REQUIRE (series.getCloseValue (3) == 181.18);
  REQUIRE (series.getDateTime (1) == entry1.getDateTime());
  REQUIRE (series.getFirstDateTime() == entry0.getDateTime());
  REQUIRE (series.getLastDateTime() == entry3.getDateTime());

  std::vector<double> closes (series.getCloseValues());
  std::vector<double> expectedCloses{185.64, 184.25, 181.91, 181.18};
  REQUIRE (closes == expectedCloses);

  SECTION ("Iteration visits bars in time order")
    {
      std::size_t count = 0;
      for (auto it = series.beginRandomAccess(); it != series.endRandomAccess(); ++it)
	{
	  REQUIRE (*it == series.getEntry (count));
	  ++count;
	}

      REQUIRE (count == 4);
    }

  SECTION ("Equality")
    {
      BarSeries copy (std::vector<OHLCBar>{entry0, entry1, entry2, entry3});
      REQUIRE (copy == series);

      BarSeries shorter (std::vector<OHLCBar>{entry0, entry1});
      REQUIRE (shorter != series);
    }

  SECTION ("Out of range index throws")
    {
      REQUIRE_THROWS_AS (series.getEntry (4), BarSeriesException);
      REQUIRE_THROWS_AS (series.getCloseValue (10), BarSeriesException);
    }

  SECTION ("Entries must be strictly increasing in time")
    {
      REQUIRE_THROWS_AS (series.addEntry (entry1), BarSeriesException);
      REQUIRE_THROWS_AS (series.addEntry (entry3), BarSeriesException);
      REQUIRE (series.getNumEntries() == 4);
    }
}

TEST_CASE ("Empty BarSeries has no date range", "[BarSeries]")
{
  BarSeries series;

  REQUIRE_THROWS_AS (series.getFirstDateTime(), BarSeriesException);
  REQUIRE_THROWS_AS (series.getLastDateTime(), BarSeriesException);
  REQUIRE (series.getCloseValues().empty());
}

TEST_CASE ("BarSeries constructor rejects unordered bars", "[BarSeries]")
{
  auto entry0 = createBar ("20240102", 10.0, 11.0, 9.0, 10.5);
  auto entry1 = createBar ("20240103", 10.5, 12.0, 10.0, 11.5);

  REQUIRE_THROWS_AS (BarSeries (std::vector<OHLCBar>{entry1, entry0}), BarSeriesException);
  REQUIRE_THROWS_AS (BarSeries (std::vector<OHLCBar>{entry0, entry0}), BarSeriesException);
}
