#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <string>
#include "ScanParameters.h"

using namespace mkc_levelscan;

TEST_CASE ("ScanParameters defaults", "[ScanParameters]")
{
  ScanParameters params;

  REQUIRE (params.getTolerance() == 0.001);
  REQUIRE (params.getMaxRetestWindow() == 20);
  REQUIRE (params.getTakeoffWindow() == 20);
  REQUIRE (params.getTakeoffPct() == 0.005);
  REQUIRE (params.isAtrEnabled());
  REQUIRE (params.getAtrMultiplier() == 1.0);
  REQUIRE (params.getAtrPeriod() == 14);
}

TEST_CASE ("ScanParameters accessors and equality", "[ScanParameters]")
{
  ScanParameters params (0.01, 5, 7, 0.03, false, 2.5, 10);

  REQUIRE (params.getTolerance() == 0.01);
  REQUIRE (params.getMaxRetestWindow() == 5);
  REQUIRE (params.getTakeoffWindow() == 7);
  REQUIRE (params.getTakeoffPct() == 0.03);
  REQUIRE_FALSE (params.isAtrEnabled());
  REQUIRE (params.getAtrMultiplier() == 2.5);
  REQUIRE (params.getAtrPeriod() == 10);

  ScanParameters same (0.01, 5, 7, 0.03, false, 2.5, 10);
  ScanParameters different (0.01, 5, 7, 0.03, true, 2.5, 10);

  REQUIRE (params == same);
  REQUIRE (params != different);

  SECTION ("Summary string")
    {
      REQUIRE (params.toString().find ("ATR filter OFF") != std::string::npos);
      REQUIRE (different.toString().find ("ATR filter ON (10 bars x 2.5)") != std::string::npos);
    }
}

TEST_CASE ("ScanParameters validation", "[ScanParameters]")
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  SECTION ("Tolerance must be positive and finite")
    {
      REQUIRE_THROWS_AS (ScanParameters (0.0), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (-0.001), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (nan), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (inf), InvalidInputException);
    }

  SECTION ("Windows must be at least one bar")
    {
      REQUIRE_THROWS_AS (ScanParameters (0.001, 0), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (0.001, 20, 0), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (0.001, -1, 20), InvalidInputException);
      REQUIRE_NOTHROW (ScanParameters (0.001, 1, 1));
    }

  SECTION ("Takeoff percent may be zero but not negative")
    {
      REQUIRE_NOTHROW (ScanParameters (0.001, 20, 20, 0.0));
      REQUIRE_THROWS_AS (ScanParameters (0.001, 20, 20, -0.01), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (0.001, 20, 20, nan), InvalidInputException);
    }

  SECTION ("ATR settings")
    {
      REQUIRE_THROWS_AS (ScanParameters (0.001, 20, 20, 0.005, true, -1.0), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (0.001, 20, 20, 0.005, true, nan), InvalidInputException);
      REQUIRE_THROWS_AS (ScanParameters (0.001, 20, 20, 0.005, true, 1.0, 0), InvalidInputException);

      // Multiplier is irrelevant when the filter is off
      REQUIRE_NOTHROW (ScanParameters (0.001, 20, 20, 0.005, false, nan));
    }
}
