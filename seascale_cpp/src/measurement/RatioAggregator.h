/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "measurement/MeasurementTypes.h"

namespace SEASCALE::Measurement
{
/*!
 * \brief Relative change between a base and a final session
 *
 * The 1-sigma uncertainty of the ratio is propagated to first order,
 * treating the two sessions as independent:
 *
 *   d(ratio)/dW_base  = W_final / W_base^2
 *   d(ratio)/dW_final = -1 / W_base
 *
 * The 95% band uses the Student-t factor of the weaker session.
 */
class RatioAggregator
{
public:
  /*!
   * \brief Combine two session results
   *
   * A base fixed value that is not positive and finite yields a zeroed result
   * with an explanatory note.
   */
  static RatioResult Compute(const SessionResult& base, const SessionResult& final);
};
} // namespace SEASCALE::Measurement
