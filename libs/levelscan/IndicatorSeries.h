// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_INDICATOR_SERIES_H
#define __LEVELSCAN_INDICATOR_SERIES_H 1

#include <optional>
#include <string>
#include <vector>

namespace mkc_levelscan
{
  //
  // class IndicatorSeries
  //
  // Derived values aligned position by position with a BarSeries.
  // NaN marks an undefined value (warm-up bars, bars with missing prices).
  //

  class IndicatorSeries
  {
  public:
    IndicatorSeries (const std::string& name, std::vector<double> values);

    IndicatorSeries (const IndicatorSeries& rhs) = default;
    IndicatorSeries& operator=(const IndicatorSeries& rhs) = default;
    ~IndicatorSeries() = default;

    const std::string& getName() const
    {
      return mName;
    }

    std::size_t getNumEntries() const
    {
      return mValues.size();
    }

    // Throws std::out_of_range for a bad index
    double getValue (std::size_t index) const;

    bool isDefined (std::size_t index) const;

    std::size_t getNumDefined() const;

    std::optional<double> getLastDefinedValue() const;

    const std::vector<double>& getValues() const
    {
      return mValues;
    }

  private:
    std::string mName;
    std::vector<double> mValues;
  };
}

#endif
