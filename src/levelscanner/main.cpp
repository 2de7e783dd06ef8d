#include <fstream>
#include <iostream>
#include <memory>
#include <boost/program_options.hpp>

#include "ScannerOptions.h"
#include "ScanReporter.h"
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

#include "BarSeriesCsvReader.h"
#include "BarSeriesIndicators.h"
#include "BreakoutRetestScanner.h"
#include "CsvScanCollector.h"
#include "NullScanCollector.h"
#include "SeriesInversion.h"
#include "SignalCsvWriter.h"

namespace po = boost::program_options;

using namespace mkc_levelscan;
using namespace levelscanner;

namespace
{
  int runScanner(const RunConfiguration& config, std::ostream& out)
  {
    out << "Level Retest Scanner run started " << utils::getRunTimestamp() << std::endl;

    BarSeriesCsvReader reader(config.getDataFileName());
    reader.readFile();
    BarSeries series = *reader.getTimeSeries();

    ScanReporter reporter(out);
    reporter.reportDataRange(config.getDataFileName(), series, reader.getNumRowsDropped());

    double level = config.getLevel();
    if (config.getInversionMode())
      {
        SeriesInverter inverter(series, *config.getInversionMode());
        series = inverter.invert(series);
        level = inverter.invertPrice(config.getLevel());

        out << "[Invert] Series and level inverted (" << inversionModeToString(inverter.getMode())
            << ", pivot " << inverter.getPivot() << "): level "
            << config.getLevel() << " -> " << level << std::endl;
      }

    const ScanParameters& parameters = config.getParameters();
    reporter.reportParameters(level, parameters);

    std::shared_ptr<IScanObserver> observer;
    if (!config.getDiagnosticsFileName().empty())
      {
        observer = std::make_shared<CsvScanCollector>(config.getDiagnosticsFileName());
        if (config.isVerbose())
          out << "[Diagnostics] Appending candidate outcomes to " << config.getDiagnosticsFileName() << std::endl;
      }
    else
      observer = std::make_shared<NullScanCollector>();

    BreakoutRetestScanner scanner(parameters, observer);

    std::vector<RetestSignal> signals;
    if (parameters.isAtrEnabled() && !series.isEmpty())
      {
        IndicatorSeries atr = AverageTrueRangeSeries(series, parameters.getAtrPeriod());
        reporter.reportLastAtr(atr, parameters.getAtrPeriod());
        signals = scanner.scan(series, level, atr);
      }
    else
      signals = scanner.scan(series, level);

    reporter.reportSignals(signals);

    if (!config.getOutputFileName().empty())
      {
        SignalCsvWriter writer(config.getOutputFileName(), signals);
        writer.writeFile();
        out << "Signals written to " << config.getOutputFileName() << std::endl;
      }

    return 0;
  }
}

int main(int argc, char** argv)
{
  CommandLineParser parser;

  std::optional<RunConfiguration> config;
  try
    {
      config = parser.parse(argc, argv);
    }
  catch (const po::error& e)
    {
      std::cerr << "Error: " << e.what() << std::endl << std::endl;
      parser.printUsage(std::cerr);
      return 1;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }

  if (!config)
    {
      parser.printUsage(std::cout);
      return 0;
    }

  try
    {
      if (!config->getLogFileName().empty())
        {
          std::ofstream logFile(config->getLogFileName(), std::ios::app);
          if (!logFile)
            {
              std::cerr << "Error: unable to open log file " << config->getLogFileName() << std::endl;
              return 1;
            }

          utils::TeeStream out(std::cout, logFile);
          return runScanner(*config, out);
        }

      return runScanner(*config, std::cout);
    }
  catch (const std::exception& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
}
