/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <vector>

namespace SEASCALE::Math
{
/*!
 * \brief Descriptive statistics over plain sample vectors
 *
 * Every function returns 0 for an empty input instead of NaN.
 */
namespace Statistics
{
double Mean(const std::vector<double>& values);
double Median(const std::vector<double>& values);

/*!
 * \brief Sort and drop floor(n * fraction) values from each end
 *
 * \param values Samples in any order
 * \param fraction Fraction trimmed from each tail, clamped to [0, 0.5)
 *
 * \return The kept values in ascending order
 */
std::vector<double> TrimSorted(const std::vector<double>& values, double fraction);

/*!
 * \brief Mean after trimming both tails
 *
 * Fewer than three values are averaged without trimming. If trimming
 * removes everything, the median is returned.
 */
double TrimmedMean(const std::vector<double>& values, double fraction = 0.1);

/*!
 * \brief Population standard deviation (divides by n)
 */
double StdDev(const std::vector<double>& values);

/*!
 * \brief Sample standard deviation (divides by n - 1)
 *
 * Returns 0 for fewer than two values.
 */
double SampleStdDev(const std::vector<double>& values);

double Rms(const std::vector<double>& values);
} // namespace Statistics
} // namespace SEASCALE::Math
