// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BarSeriesCsvReader.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace mkc_levelscan
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  namespace
  {
    bool allDigits (const std::string& s)
    {
      return !s.empty() && std::all_of(s.begin(), s.end(),
				       [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    // Empty or non numeric fields yield false, matching a dropped row
    bool parsePrice (const std::string& field, double& value)
    {
      const std::string trimmed = boost::trim_copy(field);
      if (trimmed.empty())
	return false;

      try
	{
	  value = boost::lexical_cast<double>(trimmed);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  return false;
	}

      return std::isfinite(value);
    }
  }

  ptime parseBarDateTime (const std::string& dateTimeString)
  {
    std::string s = boost::trim_copy(dateTimeString);

    try
      {
	if (s.size() == 8 && allDigits(s))
	  return ptime(boost::gregorian::from_undelimited_string(s), time_duration(0, 0, 0));

	if (s.size() == 10)
	  return ptime(boost::gregorian::from_simple_string(s), time_duration(0, 0, 0));

	if (s.size() > 10 && (s[10] == 'T' || s[10] == ' '))
	  {
	    std::string datePart = s.substr(0, 10);
	    std::string timePart = s.substr(11);

	    if (!timePart.empty() && (timePart.back() == 'Z' || timePart.back() == 'z'))
	      timePart.pop_back();

	    std::string::size_type offsetPos = timePart.find_first_of("+-");
	    if (offsetPos != std::string::npos)
	      timePart.erase(offsetPos);

	    if (std::count(timePart.begin(), timePart.end(), ':') == 1)
	      timePart += ":00";

	    return ptime(boost::gregorian::from_simple_string(datePart),
			 boost::posix_time::duration_from_string(timePart));
	  }
      }
    catch (const std::exception& e)
      {
	throw BarDataException("parseBarDateTime - cannot parse timestamp '" + dateTimeString +
			       "': " + e.what());
      }

    throw BarDataException("parseBarDateTime - unrecognized timestamp '" + dateTimeString + "'");
  }

  BarSeriesCsvReader::BarSeriesCsvReader (const std::string& fileName)
    : mFileName(fileName),
      mTimeSeries(std::make_shared<BarSeries>()),
      mNumRowsRead(0),
      mNumRowsDropped(0)
  {
    std::ifstream fin(mFileName);
    if (!fin.is_open())
      throw BarDataException("Cannot open file: " + mFileName);
  }

  void BarSeriesCsvReader::readFile()
  {
    std::vector<OHLCBar> bars;
    mNumRowsRead = 0;
    mNumRowsDropped = 0;

    try
      {
	io::CSVReader<7, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>> csvFile(mFileName);

	csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
			    "Date", "Datetime", "Open", "High", "Low", "Close", "Volume");

	if (!csvFile.has_column("Date") && !csvFile.has_column("Datetime"))
	  throw BarDataException("BarSeriesCsvReader: " + mFileName + " has neither a Date nor a Datetime column");

	for (const char* column : {"Open", "High", "Low", "Close"})
	  if (!csvFile.has_column(column))
	    throw BarDataException("BarSeriesCsvReader: " + mFileName + " is missing the " +
				   std::string(column) + " column");

	const bool hasVolume = csvFile.has_column("Volume");

	std::string dateString, dateTimeString;
	std::string openString, highString, lowString, closeString, volumeString;

	while (true)
	  {
	    dateString.clear();
	    dateTimeString.clear();
	    volumeString.clear();

	    if (!csvFile.read_row(dateString, dateTimeString, openString, highString,
				  lowString, closeString, volumeString))
	      break;

	    ++mNumRowsRead;

	    double openPrice, highPrice, lowPrice, closePrice;
	    if (!parsePrice(openString, openPrice) || !parsePrice(highString, highPrice) ||
		!parsePrice(lowString, lowPrice) || !parsePrice(closeString, closePrice))
	      {
		++mNumRowsDropped;
		continue;
	      }

	    double volume = 0.0;
	    if (hasVolume && !parsePrice(volumeString, volume))
	      volume = 0.0;

	    const ptime barTime = parseBarDateTime(dateString.empty() ? dateTimeString : dateString);

	    try
	      {
		bars.emplace_back(barTime, openPrice, highPrice, lowPrice, closePrice, volume);
	      }
	    catch (const BarException& e)
	      {
		std::cout << "OHLC Error: " << e.what() << " (row skipped)" << std::endl;
		++mNumRowsDropped;
	      }
	  }
      }
    catch (const io::error::base& e)
      {
	throw BarDataException("BarSeriesCsvReader: error reading " + mFileName + ": " + e.what());
      }

    std::stable_sort(bars.begin(), bars.end(),
		     [](const OHLCBar& lhs, const OHLCBar& rhs) {
		       return lhs.getDateTime() < rhs.getDateTime();
		     });

    auto last = std::unique(bars.begin(), bars.end(),
			    [](const OHLCBar& lhs, const OHLCBar& rhs) {
			      return lhs.getDateTime() == rhs.getDateTime();
			    });
    mNumRowsDropped += static_cast<std::size_t>(std::distance(last, bars.end()));
    bars.erase(last, bars.end());

    mTimeSeries = std::make_shared<BarSeries>(bars);
  }
}
