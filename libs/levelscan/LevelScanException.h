// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_EXCEPTION_H
#define __LEVELSCAN_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_levelscan
{
  // Base of every exception raised by the level scanner library
  class LevelScanException : public std::runtime_error
  {
  public:
    LevelScanException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~LevelScanException() = default;
  };

  /**
   * @brief Caller contract violation: bad parameters, empty or too short
   * series, mismatched indicator length, non-finite level.
   *
   * Never recovered from inside the library; the call fails before any
   * output is produced.
   */
  class InvalidInputException : public LevelScanException
  {
  public:
    explicit InvalidInputException(const std::string& msg)
      : LevelScanException(msg) {}
  };

  // A single bar whose finite prices violate the high/low invariant
  class BarException : public LevelScanException
  {
  public:
    explicit BarException(const std::string& msg)
      : LevelScanException(msg) {}
  };

  // Out of order or duplicate timestamps, out of range positions
  class BarSeriesException : public LevelScanException
  {
  public:
    explicit BarSeriesException(const std::string& msg)
      : LevelScanException(msg) {}
  };

  // Unreadable or malformed historic data files
  class BarDataException : public LevelScanException
  {
  public:
    explicit BarDataException(const std::string& msg)
      : LevelScanException(msg) {}
  };

  class ScanConfigurationException : public LevelScanException
  {
  public:
    explicit ScanConfigurationException(const std::string& msg)
      : LevelScanException(msg) {}
  };

} // namespace mkc_levelscan

#endif // __LEVELSCAN_EXCEPTION_H
