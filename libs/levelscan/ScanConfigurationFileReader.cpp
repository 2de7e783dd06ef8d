// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ScanConfigurationFileReader.h"
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <typeinfo>
#include "csv.h"

namespace mkc_levelscan
{
  template <class T>
  static T tryCast(const std::string& settingName, const std::string& inputString)
  {
    try
    {
      return boost::lexical_cast<T>(boost::trim_copy(inputString));
    }
    catch (const boost::bad_lexical_cast& e)
    {
      throw ScanConfigurationException("Cannot convert " + settingName + " value '" + inputString +
				       "' to " + typeid(T).name() + ": " + e.what());
    }
  }

  bool parseBooleanSetting (const std::string& value)
  {
    const std::string lower = boost::to_lower_copy(boost::trim_copy(value));

    if (lower == "true" || lower == "yes" || lower == "1")
      return true;
    else if (lower == "false" || lower == "no" || lower == "0")
      return false;
    else
      throw ScanConfigurationException("Cannot interpret '" + value + "' as a boolean setting");
  }

  ScanConfigurationFileReader::ScanConfigurationFileReader (const std::string& configFileName)
    : mConfigFileName(configFileName)
  {}

  ScanConfiguration ScanConfigurationFileReader::readConfigurationFile() const
  {
    boost::filesystem::path configPath (mConfigFileName);
    if (!boost::filesystem::exists (configPath))
      throw ScanConfigurationException("Scan configuration file " + configPath.string() + " does not exist");

    std::string level, tolerance, maxRetestWindow, takeoffWindow, takeoffPct;
    std::string useAtr, atrMultiplier, atrPeriod, invert;

    try
      {
	io::CSVReader<9, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>> csvConfigFile(mConfigFileName);

	csvConfigFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
				  "Level", "Tolerance", "MaxRetestWindow", "TakeoffWindow", "TakeoffPct",
				  "UseAtr", "AtrMultiplier", "AtrPeriod", "Invert");

	if (!csvConfigFile.read_row(level, tolerance, maxRetestWindow, takeoffWindow, takeoffPct,
				    useAtr, atrMultiplier, atrPeriod, invert))
	  throw ScanConfigurationException("Scan configuration file " + mConfigFileName + " has no settings row");
      }
    catch (const io::error::base& e)
      {
	throw ScanConfigurationException("Error reading scan configuration file " + mConfigFileName + ": " + e.what());
      }

    auto isSet = [](const std::string& s) { return !boost::trim_copy(s).empty(); };

    std::optional<double> levelValue;
    if (isSet(level))
      levelValue = tryCast<double>("Level", level);

    std::optional<InversionMode> inversionMode;

    try
      {
	if (isSet(invert))
	  inversionMode = getInversionModeFromString(invert);

	ScanParameters parameters(isSet(tolerance) ? tryCast<double>("Tolerance", tolerance) : ScanParameters::kDefaultTolerance,
				  isSet(maxRetestWindow) ? tryCast<int>("MaxRetestWindow", maxRetestWindow) : ScanParameters::kDefaultMaxRetestWindow,
				  isSet(takeoffWindow) ? tryCast<int>("TakeoffWindow", takeoffWindow) : ScanParameters::kDefaultTakeoffWindow,
				  isSet(takeoffPct) ? tryCast<double>("TakeoffPct", takeoffPct) : ScanParameters::kDefaultTakeoffPct,
				  isSet(useAtr) ? parseBooleanSetting(useAtr) : ScanParameters::kDefaultAtrEnabled,
				  isSet(atrMultiplier) ? tryCast<double>("AtrMultiplier", atrMultiplier) : ScanParameters::kDefaultAtrMultiplier,
				  isSet(atrPeriod) ? tryCast<int>("AtrPeriod", atrPeriod) : kDefaultAtrPeriod);

	return ScanConfiguration(levelValue, parameters, inversionMode);
      }
    catch (const InvalidInputException& e)
      {
	throw ScanConfigurationException("Invalid setting in " + mConfigFileName + ": " + e.what());
      }
  }
}
