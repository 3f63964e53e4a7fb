/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "math/VectorMath.h"

#include <optional>

namespace SEASCALE::IMU
{
using Vector3 = Math::Vector3;

/*!
 * \brief One accelerometer event as delivered by the sensor host
 */
struct RawInertialSample
{
  /*!
   * \brief Specific force including gravity, absent while the sensor is silent
   *
   * Units: m/s^2
   */
  std::optional<Vector3> accel_incl_gravity_mps2;

  /*!
   * \brief Rotation rate, carried but not used for orientation
   *
   * Units: deg/s
   */
  std::optional<Vector3> rotation_rate_dps;

  /*!
   * \brief Interval reported by the sensor host
   *
   * Units: milliseconds
   */
  std::optional<double> interval_ms;

  /*!
   * \brief Monotonic capture time
   *
   * Units: milliseconds
   */
  double stamp_ms{0.0};
};

/*!
 * \brief Gravity-referenced quantities derived from one raw sample
 */
struct ProcessedSample
{
  /*!
   * \brief Linear acceleration projected on the unit gravity direction
   *
   * Units: m/s^2
   */
  double a_z_mps2{0.0};

  /*!
   * \brief Roll derived from the unit gravity vector
   *
   * Units: degrees
   */
  double roll_deg{0.0};

  /*!
   * \brief Pitch derived from the unit gravity vector
   *
   * Units: degrees
   */
  double pitch_deg{0.0};

  /*!
   * \brief Low-pass filtered gravity estimate
   *
   * Units: m/s^2
   */
  Vector3 g_est_mps2{Vector3::Zero()};

  /*!
   * \brief Unit gravity direction, zero when g_est is zero
   *
   * Units: unitless
   */
  Vector3 g_unit{Vector3::Zero()};

  /*!
   * \brief Raw acceleration minus the gravity estimate
   *
   * Units: m/s^2
   */
  Vector3 a_lin_mps2{Vector3::Zero()};

  /*!
   * \brief Capture time of the source sample
   *
   * Units: milliseconds
   */
  double stamp_ms{0.0};
};

/*!
 * \brief Live motion-quality snapshot, recomputed per processed sample
 */
struct LiveMetrics
{
  // Units: m/s^2
  double a_z_mps2{0.0};

  // Units: degrees
  double roll_deg{0.0};

  // Units: degrees
  double pitch_deg{0.0};

  // Units: m/s^2
  double rms_az_mps2{0.0};

  // Units: degrees
  double rms_roll_deg{0.0};

  // Units: degrees
  double rms_pitch_deg{0.0};

  /*!
   * \brief Mean device rate over recent intervals, 0 when unknown
   *
   * Units: Hz
   */
  double sampling_rate_hz{0.0};

  /*!
   * \brief True when all three RMS values are below their thresholds
   */
  bool is_stable{false};

  /*!
   * \brief Soft companion to is_stable
   *
   * Units: unitless, [0, 1]
   */
  double confidence{0.0};
};
} // namespace SEASCALE::IMU
