#include "TestUtils.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace mkc_levelscan;
using namespace boost::gregorian;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;

OHLCBar
createBar (const std::string& dateString,
	   double open,
	   double high,
	   double low,
	   double close,
	   double volume)
{
  return OHLCBar (from_undelimited_string (dateString), open, high, low, close, volume);
}

ptime
barTime (std::size_t index)
{
  return ptime (date (2024, Jan, 1) + days (static_cast<long>(index)), time_duration (0, 0, 0));
}

BarSeries
createSeries (const std::vector<double>& closes,
	      const std::vector<double>& lows)
{
  std::vector<double> highs;
  highs.reserve (closes.size());

  for (std::size_t i = 0; i < closes.size(); ++i)
    highs.push_back (std::max (closes[i], lows[i]) + 0.5);

  return createSeries (closes, highs, lows);
}

BarSeries
createSeries (const std::vector<double>& closes,
	      const std::vector<double>& highs,
	      const std::vector<double>& lows)
{
  if (closes.size() != highs.size() || closes.size() != lows.size())
    throw std::invalid_argument ("createSeries: closes, highs and lows differ in length");

  BarSeries series;
  for (std::size_t i = 0; i < closes.size(); ++i)
    series.addEntry (OHLCBar (barTime (i), closes[i], highs[i], lows[i], closes[i]));

  return series;
}

std::string
uniqueTempFileName()
{
  char tmpl[] = "/tmp/levelscan-XXXXXX";
  int fd = mkstemp (tmpl);
  if (fd < 0)
    throw std::runtime_error ("uniqueTempFileName: mkstemp failed");

  ::close (fd);
  std::remove (tmpl);
  return std::string (tmpl);
}

std::string
writeTempFile (const std::string& contents)
{
  std::string fileName (uniqueTempFileName());

  std::ofstream out (fileName);
  out << contents;
  out.close();

  return fileName;
}
