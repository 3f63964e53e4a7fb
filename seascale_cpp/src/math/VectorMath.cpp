/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "math/VectorMath.h"

namespace SEASCALE::Math
{
namespace
{
// Units: unitless
constexpr double kPi = 3.14159265358979323846;
} // namespace

double Dot(const Vector3& a, const Vector3& b)
{
  return a.dot(b);
}

double Magnitude(const Vector3& v)
{
  return v.norm();
}

Vector3 Normalize(const Vector3& v)
{
  const double norm = Magnitude(v);
  if (norm == 0.0)
    return Vector3::Zero();

  return v / norm;
}

double DegToRad(double deg)
{
  return deg * kPi / 180.0;
}

double RadToDeg(double rad)
{
  return rad * 180.0 / kPi;
}
} // namespace SEASCALE::Math
