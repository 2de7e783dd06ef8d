// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_BAR_SERIES_CSV_READER_H
#define __LEVELSCAN_BAR_SERIES_CSV_READER_H 1

#include <memory>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BarSeries.h"

namespace mkc_levelscan
{
  /**
   * @brief Parses a bar timestamp.
   *
   * Accepts YYYYMMDD, YYYY-MM-DD, YYYY-MM-DD HH:MM and YYYY-MM-DD HH:MM:SS[.fff].
   * A 'T' date/time separator is allowed and a trailing UTC offset
   * ("Z", "+01:00", "-0500") is discarded.
   *
   * @throws BarDataException if the string is not a valid timestamp.
   */
  boost::posix_time::ptime parseBarDateTime (const std::string& dateTimeString);

  /**
   * @brief Reads OHLC bars from a CSV file with a header row.
   *
   * Required columns are Date (or Datetime), Open, High, Low and Close;
   * Volume is optional and other columns are ignored. Rows with empty or
   * non numeric prices are dropped, rows whose prices are inconsistent are
   * reported on std::cout and dropped. The surviving rows are sorted by
   * timestamp and duplicate timestamps are removed, keeping the first row
   * read, so the resulting series is always strictly ordered.
   */
  class BarSeriesCsvReader
  {
  public:
    // Throws BarDataException if the file cannot be opened
    explicit BarSeriesCsvReader (const std::string& fileName);

    BarSeriesCsvReader (const BarSeriesCsvReader& rhs) = default;
    BarSeriesCsvReader& operator=(const BarSeriesCsvReader& rhs) = default;
    ~BarSeriesCsvReader() = default;

    // Throws BarDataException for a missing required column or unreadable file
    void readFile();

    const std::string& getFileName() const
    {
      return mFileName;
    }

    std::shared_ptr<BarSeries> getTimeSeries() const
    {
      return mTimeSeries;
    }

    std::size_t getNumRowsRead() const
    {
      return mNumRowsRead;
    }

    // Rows dropped for missing values, bad prices or duplicate timestamps
    std::size_t getNumRowsDropped() const
    {
      return mNumRowsDropped;
    }

  private:
    std::string mFileName;
    std::shared_ptr<BarSeries> mTimeSeries;
    std::size_t mNumRowsRead;
    std::size_t mNumRowsDropped;
  };
}

#endif
