/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <Eigen/Core>

namespace SEASCALE::Math
{
using Vector3 = Eigen::Vector3d;

double Dot(const Vector3& a, const Vector3& b);
double Magnitude(const Vector3& v);

/*!
 * \brief Scale a vector to unit length
 *
 * The zero vector maps to the zero vector.
 */
Vector3 Normalize(const Vector3& v);

double DegToRad(double deg);
double RadToDeg(double rad);
} // namespace SEASCALE::Math
