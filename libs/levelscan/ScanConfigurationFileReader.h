// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_SCAN_CONFIGURATION_FILE_READER_H
#define __LEVELSCAN_SCAN_CONFIGURATION_FILE_READER_H 1

#include <optional>
#include <string>
#include "ScanParameters.h"
#include "SeriesInversion.h"

namespace mkc_levelscan
{
  // Settings for one scan run as read from a configuration file
  class ScanConfiguration
  {
  public:
    ScanConfiguration (std::optional<double> level,
		       const ScanParameters& parameters,
		       std::optional<InversionMode> inversionMode)
      : mLevel(level),
	mParameters(parameters),
	mInversionMode(inversionMode)
    {}

    ScanConfiguration (const ScanConfiguration& rhs) = default;
    ScanConfiguration& operator=(const ScanConfiguration& rhs) = default;
    ~ScanConfiguration() = default;

    const std::optional<double>& getLevel() const
    {
      return mLevel;
    }

    const ScanParameters& getParameters() const
    {
      return mParameters;
    }

    const std::optional<InversionMode>& getInversionMode() const
    {
      return mInversionMode;
    }

  private:
    std::optional<double> mLevel;
    ScanParameters mParameters;
    std::optional<InversionMode> mInversionMode;
  };

  /**
   * @brief Reads a one row CSV configuration file.
   *
   * Header columns (all optional, any order):
   * Level,Tolerance,MaxRetestWindow,TakeoffWindow,TakeoffPct,UseAtr,AtrMultiplier,AtrPeriod,Invert
   *
   * Missing or empty values take the ScanParameters defaults. Values that
   * cannot be converted, or that ScanParameters rejects, raise
   * ScanConfigurationException.
   */
  class ScanConfigurationFileReader
  {
  public:
    explicit ScanConfigurationFileReader (const std::string& configFileName);

    ScanConfiguration readConfigurationFile() const;

    const std::string& getFileName() const
    {
      return mConfigFileName;
    }

  private:
    std::string mConfigFileName;
  };

  // "true"/"false", "yes"/"no", "1"/"0", case-insensitive
  bool parseBooleanSetting (const std::string& value);
}

#endif
