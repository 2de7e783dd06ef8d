// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "IndicatorSeries.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace mkc_levelscan
{
  IndicatorSeries::IndicatorSeries (const std::string& name, std::vector<double> values)
    : mName(name),
      mValues(std::move(values))
  {}

  double IndicatorSeries::getValue (std::size_t index) const
  {
    if (index >= mValues.size())
      throw std::out_of_range("IndicatorSeries " + mName + ": index " + std::to_string(index) +
			      " out of range");

    return mValues[index];
  }

  bool IndicatorSeries::isDefined (std::size_t index) const
  {
    return std::isfinite(getValue(index));
  }

  std::size_t IndicatorSeries::getNumDefined() const
  {
    return static_cast<std::size_t>(std::count_if(mValues.begin(), mValues.end(),
						  [](double v) { return std::isfinite(v); }));
  }

  std::optional<double> IndicatorSeries::getLastDefinedValue() const
  {
    auto it = std::find_if(mValues.rbegin(), mValues.rend(),
			   [](double v) { return std::isfinite(v); });
    if (it == mValues.rend())
      return std::nullopt;

    return *it;
  }
}
