/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "math/ConfidenceTable.h"

#include <algorithm>
#include <array>

namespace SEASCALE::Math
{
namespace
{
struct TableRow
{
  // Units: degrees of freedom
  double df;

  // Units: unitless
  double t;
};

// Two-sided 95% Student-t quantiles. The df = infinity row is handled by the
// large-df branch in KFromN().
constexpr std::array<TableRow, 15> kTable{{
    {1.0, 12.706},
    {2.0, 4.303},
    {3.0, 3.182},
    {4.0, 2.776},
    {5.0, 2.571},
    {6.0, 2.447},
    {7.0, 2.365},
    {8.0, 2.306},
    {9.0, 2.262},
    {10.0, 2.228},
    {12.0, 2.179},
    {15.0, 2.131},
    {20.0, 2.086},
    {25.0, 2.060},
    {30.0, 2.042},
}};

// Units: degrees of freedom
constexpr double kLastTabulatedDf = 30.0;

// Units: degrees of freedom
// Meaning: df at and above which the asymptotic value is used directly
constexpr double kAsymptoticDf = 100.0;
} // namespace

double ConfidenceTable::KFromN(std::size_t n)
{
  if (IsFallback(n))
    return FallbackK();

  const double df = static_cast<double>(n - 1);

  if (df >= kAsymptoticDf)
    return AsymptoticK();

  if (df >= kLastTabulatedDf)
  {
    const double t30 = kTable.back().t;
    const double slope = (t30 - AsymptoticK()) / (kAsymptoticDf - kLastTabulatedDf);
    return std::max(AsymptoticK(), t30 - (df - kLastTabulatedDf) * slope);
  }

  for (std::size_t i = 0; i + 1 < kTable.size(); ++i)
  {
    const TableRow& low = kTable[i];
    const TableRow& high = kTable[i + 1];
    if (df < low.df || df > high.df)
      continue;

    if (df == low.df)
      return low.t;
    if (df == high.df)
      return high.t;

    return low.t + (df - low.df) * (high.t - low.t) / (high.df - low.df);
  }

  return kTable.front().t;
}

bool ConfidenceTable::IsFallback(std::size_t n)
{
  return n <= 1;
}

std::size_t ConfidenceTable::EffectiveN(std::size_t nBase, std::size_t nFinal)
{
  return std::min(nBase, nFinal);
}
} // namespace SEASCALE::Math
