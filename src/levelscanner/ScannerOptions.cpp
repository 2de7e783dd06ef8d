#include "ScannerOptions.h"
#include "ScanConfigurationFileReader.h"
#include <stdexcept>

namespace po = boost::program_options;

using namespace mkc_levelscan;

namespace levelscanner
{
  CommandLineParser::CommandLineParser()
    : mOptions("Options")
  {
    mOptions.add_options()
      ("help,h", "Show help message")
      ("data,d", po::value<std::string>(), "CSV file of bars (Date or Datetime, Open, High, Low, Close[, Volume])")
      ("config,c", po::value<std::string>(), "CSV scan configuration file (one header row, one settings row)")
      ("level,l", po::value<double>(), "Key level (your line in the sand)")
      ("tolerance", po::value<double>(), "Retest tolerance as a fraction of the level (0.001 = 0.1%)")
      ("max-retest-window", po::value<int>(), "Max bars after the breakout to find the retest")
      ("takeoff-window", po::value<int>(), "Max bars after the retest to confirm the takeoff")
      ("takeoff-pct", po::value<double>(), "Min takeoff above the level as a fraction (0.005 = 0.5%)")
      ("no-atr", "Do not require the ATR-based thrust")
      ("atr-mult", po::value<double>(), "ATR multiplier for the takeoff threshold")
      ("atr-period", po::value<int>(), "ATR lookback in bars")
      ("invert", po::value<std::string>(), "Invert the series and level before scanning (mirror or negate)")
      ("output,o", po::value<std::string>(), "Write the detected signals to this CSV file")
      ("diagnostics", po::value<std::string>(), "Append one row per breakout candidate to this CSV file")
      ("log-file", po::value<std::string>(), "Mirror console output to this file")
      ("verbose,v", "Verbose output");
  }

  void CommandLineParser::printUsage(std::ostream& os) const
  {
    os << "Level Retest Scanner - find breakout -> retest -> takeoff sequences around a key level\n\n";
    os << "Usage: levelscanner --data <bars.csv> [--level <price> | --config <scan.csv>] [options]\n\n";
    os << mOptions << std::endl;

    os << "\nExamples:\n";
    os << "  levelscanner --data BTC-USD.csv --level 60000 --tolerance 0.001 --output retest_signals.csv\n";
    os << "  levelscanner --data NQ.csv --config scan.csv --invert mirror\n";
  }

  std::optional<RunConfiguration> CommandLineParser::parse(int argc, char** argv) const
  {
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, mOptions), vm);
    po::notify(vm);

    if (vm.count("help"))
      return std::nullopt;

    if (!vm.count("data"))
      throw std::invalid_argument("A bar data file is required (--data)");

    std::optional<double> level;
    ScanParameters base;
    std::optional<InversionMode> inversionMode;

    if (vm.count("config"))
      {
        ScanConfigurationFileReader reader(vm["config"].as<std::string>());
        ScanConfiguration fileConfig = reader.readConfigurationFile();

        level = fileConfig.getLevel();
        base = fileConfig.getParameters();
        inversionMode = fileConfig.getInversionMode();
      }

    if (vm.count("level"))
      level = vm["level"].as<double>();

    if (!level)
      throw std::invalid_argument("A key level is required (--level or Level in the configuration file)");

    if (vm.count("invert"))
      inversionMode = getInversionModeFromString(vm["invert"].as<std::string>());

    ScanParameters parameters(vm.count("tolerance") ? vm["tolerance"].as<double>() : base.getTolerance(),
                              vm.count("max-retest-window") ? vm["max-retest-window"].as<int>() : base.getMaxRetestWindow(),
                              vm.count("takeoff-window") ? vm["takeoff-window"].as<int>() : base.getTakeoffWindow(),
                              vm.count("takeoff-pct") ? vm["takeoff-pct"].as<double>() : base.getTakeoffPct(),
                              vm.count("no-atr") ? false : base.isAtrEnabled(),
                              vm.count("atr-mult") ? vm["atr-mult"].as<double>() : base.getAtrMultiplier(),
                              vm.count("atr-period") ? vm["atr-period"].as<int>() : base.getAtrPeriod());

    auto optionalString = [&vm](const char* name) {
      return vm.count(name) ? vm[name].as<std::string>() : std::string();
    };

    return RunConfiguration(vm["data"].as<std::string>(),
                            *level,
                            parameters,
                            inversionMode,
                            optionalString("output"),
                            optionalString("diagnostics"),
                            optionalString("log-file"),
                            vm.count("verbose") > 0);
  }
}
