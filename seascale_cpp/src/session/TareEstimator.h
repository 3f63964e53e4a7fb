/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "session/SessionTypes.h"

#include <cstddef>
#include <vector>

namespace SEASCALE::Session
{
/*!
 * \brief Empty-scale bias and tare uncertainty from repeated readings
 *
 * Bias is the median of the readings. The 95% uncertainty is the half range
 * (max - min) / 2, a conservative bound for the handful of readings an
 * operator takes.
 */
class TareEstimator
{
public:
  /*!
   * \brief Record one empty-scale reading
   *
   * \throws std::invalid_argument for NaN, infinite or negative values
   */
  void AddTareSample(double value_g, double stamp_ms);

  /*!
   * \brief Remove the reading at index, no-op when out of range
   */
  void RemoveTareSample(std::size_t index);

  void Clear();

  const std::vector<TareSample>& Samples() const { return m_samples; }
  std::size_t Count() const { return m_samples.size(); }

  TareEstimate Estimate() const;

  /*!
   * \brief Estimate from operator-entered values
   *
   * \param bias_g Bias in grams
   * \param uncertainty95_g 95% tare uncertainty in grams
   */
  static TareEstimate ManualEstimate(double bias_g, double uncertainty95_g);

private:
  std::vector<TareSample> m_samples;
};
} // namespace SEASCALE::Session
