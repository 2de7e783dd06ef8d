#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <boost/program_options.hpp>
#include "ScanParameters.h"
#include "SeriesInversion.h"

namespace levelscanner
{
  using mkc_levelscan::ScanParameters;
  using mkc_levelscan::InversionMode;

  /**
   * @brief Everything one levelscanner run needs, merged from the
   * configuration file and the command line (command line wins).
   */
  class RunConfiguration
  {
  public:
    RunConfiguration(const std::string& dataFileName,
                     double level,
                     const ScanParameters& parameters,
                     std::optional<InversionMode> inversionMode,
                     const std::string& outputFileName,
                     const std::string& diagnosticsFileName,
                     const std::string& logFileName,
                     bool verbose)
      : mDataFileName(dataFileName),
        mLevel(level),
        mParameters(parameters),
        mInversionMode(inversionMode),
        mOutputFileName(outputFileName),
        mDiagnosticsFileName(diagnosticsFileName),
        mLogFileName(logFileName),
        mVerbose(verbose)
    {}

    const std::string& getDataFileName() const { return mDataFileName; }
    double getLevel() const { return mLevel; }
    const ScanParameters& getParameters() const { return mParameters; }
    const std::optional<InversionMode>& getInversionMode() const { return mInversionMode; }

    // Empty when the corresponding file was not requested
    const std::string& getOutputFileName() const { return mOutputFileName; }
    const std::string& getDiagnosticsFileName() const { return mDiagnosticsFileName; }
    const std::string& getLogFileName() const { return mLogFileName; }

    bool isVerbose() const { return mVerbose; }

  private:
    std::string mDataFileName;
    double mLevel;
    ScanParameters mParameters;
    std::optional<InversionMode> mInversionMode;
    std::string mOutputFileName;
    std::string mDiagnosticsFileName;
    std::string mLogFileName;
    bool mVerbose;
  };

  /**
   * @brief Command line handling for levelscanner
   */
  class CommandLineParser
  {
  public:
    CommandLineParser();

    /**
     * @brief Parse the command line (and the configuration file it names)
     * @return The merged configuration, or std::nullopt when help was requested
     * @throws boost::program_options::error for malformed options
     * @throws std::invalid_argument when no data file or level is given
     */
    std::optional<RunConfiguration> parse(int argc, char** argv) const;

    void printUsage(std::ostream& os) const;

  private:
    boost::program_options::options_description mOptions;
  };
}
