/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <cstddef>

namespace SEASCALE::Math
{
/*!
 * \brief Two-sided 95% coverage factors from a Student-t table
 *
 * Degrees of freedom are df = n - 1. Tabulated rows are
 * df = 1..10, 12, 15, 20, 25, 30 and infinity; other df values are linearly
 * interpolated between the bracketing rows. Between df = 30 and df = 100 the
 * factor falls linearly from 2.042 to 1.960, and stays at 1.960 beyond.
 */
class ConfidenceTable
{
public:
  /*!
   * \brief Coverage factor k for a sample count
   *
   * \param n Sample count (after trimming)
   *
   * \return k such that k * sigma spans a 95% interval. For n <= 1 this is
   *         the fixed fallback 2.0, see IsFallback().
   */
  static double KFromN(std::size_t n);

  /*!
   * \brief True when KFromN(n) is the fixed fallback, not a table value
   */
  static bool IsFallback(std::size_t n);

  /*!
   * \brief Sample count that bounds the confidence of a two-session result
   */
  static std::size_t EffectiveN(std::size_t nBase, std::size_t nFinal);

  // Units: unitless
  static constexpr double FallbackK() { return 2.0; }

  // Units: unitless
  static constexpr double AsymptoticK() { return 1.960; }
};
} // namespace SEASCALE::Math
