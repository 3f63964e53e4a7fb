/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "math/Statistics.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>

namespace SEASCALE::Math::Statistics
{
namespace
{
// Units: unitless
// Meaning: largest per-tail trim that still keeps at least one value
constexpr double kMaxTrimFraction = 0.4999;
} // namespace

double Mean(const std::vector<double>& values)
{
  if (values.empty())
    return 0.0;

  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  return sum / static_cast<double>(values.size());
}

double Median(const std::vector<double>& values)
{
  if (values.empty())
    return 0.0;

  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end());

  const std::size_t mid = sorted.size() / 2;
  if (sorted.size() % 2 == 0)
    return 0.5 * (sorted[mid - 1] + sorted[mid]);

  return sorted[mid];
}

std::vector<double> TrimSorted(const std::vector<double>& values, double fraction)
{
  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end());

  const double clamped = std::clamp(fraction, 0.0, kMaxTrimFraction);
  const auto drop =
      static_cast<std::size_t>(std::floor(clamped * static_cast<double>(sorted.size())));
  if (drop == 0)
    return sorted;

  return std::vector<double>(sorted.begin() + static_cast<std::ptrdiff_t>(drop),
                             sorted.end() - static_cast<std::ptrdiff_t>(drop));
}

double TrimmedMean(const std::vector<double>& values, double fraction)
{
  if (values.empty())
    return 0.0;

  if (values.size() <= 2)
    return Mean(values);

  const std::vector<double> trimmed = TrimSorted(values, fraction);
  if (trimmed.empty())
    return Median(values);

  return Mean(trimmed);
}

double StdDev(const std::vector<double>& values)
{
  if (values.empty())
    return 0.0;

  const double mean = Mean(values);

  double sum2 = 0.0;
  for (double value : values)
  {
    const double delta = value - mean;
    sum2 += delta * delta;
  }

  return std::sqrt(sum2 / static_cast<double>(values.size()));
}

double SampleStdDev(const std::vector<double>& values)
{
  if (values.size() < 2)
    return 0.0;

  const double mean = Mean(values);

  double sum2 = 0.0;
  for (double value : values)
  {
    const double delta = value - mean;
    sum2 += delta * delta;
  }

  return std::sqrt(sum2 / static_cast<double>(values.size() - 1));
}

double Rms(const std::vector<double>& values)
{
  if (values.empty())
    return 0.0;

  double sum2 = 0.0;
  for (double value : values)
    sum2 += value * value;

  return std::sqrt(sum2 / static_cast<double>(values.size()));
}
} // namespace SEASCALE::Math::Statistics
