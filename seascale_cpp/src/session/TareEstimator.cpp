/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "session/TareEstimator.h"

#include "math/Statistics.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace SEASCALE::Session
{
namespace
{
// Units: unitless
// Meaning: ratio of a 95% half-width to its 1-sigma equivalent
constexpr double kSigmaPer95 = 2.0;
} // namespace

void TareEstimator::AddTareSample(double value_g, double stamp_ms)
{
  if (!std::isfinite(value_g) || value_g < 0.0)
    throw std::invalid_argument("Tare reading must be a finite, non-negative number");

  m_samples.push_back(TareSample{stamp_ms, value_g});
}

void TareEstimator::RemoveTareSample(std::size_t index)
{
  if (index >= m_samples.size())
    return;

  m_samples.erase(m_samples.begin() + static_cast<std::ptrdiff_t>(index));
}

void TareEstimator::Clear()
{
  m_samples.clear();
}

TareEstimate TareEstimator::Estimate() const
{
  TareEstimate estimate{};
  estimate.count = m_samples.size();
  estimate.provenance = TareEstimate::Provenance::Estimated;

  if (m_samples.empty())
    return estimate;

  if (m_samples.size() == 1)
  {
    // A single reading gives a bias but no spread
    estimate.bias_g = m_samples.front().reading_g;
    return estimate;
  }

  std::vector<double> readings;
  readings.reserve(m_samples.size());
  for (const TareSample& sample : m_samples)
    readings.push_back(sample.reading_g);

  const auto [minIt, maxIt] = std::minmax_element(readings.begin(), readings.end());

  estimate.bias_g = Math::Statistics::Median(readings);
  estimate.uncertainty_95_g = (*maxIt - *minIt) / 2.0;
  estimate.sigma_g = estimate.uncertainty_95_g / kSigmaPer95;

  return estimate;
}

TareEstimate TareEstimator::ManualEstimate(double bias_g, double uncertainty95_g)
{
  TareEstimate estimate{};
  estimate.count = 0;
  estimate.bias_g = bias_g;
  estimate.uncertainty_95_g = uncertainty95_g;
  estimate.sigma_g = uncertainty95_g / kSigmaPer95;
  estimate.provenance = TareEstimate::Provenance::UserEntered;

  return estimate;
}
} // namespace SEASCALE::Session
