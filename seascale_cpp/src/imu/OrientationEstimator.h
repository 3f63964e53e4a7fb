/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "imu/ImuTypes.h"
#include "imu/RingWindow.h"
#include "measurement/MeasurementConfig.h"

#include <cstddef>
#include <deque>

namespace SEASCALE::IMU
{
/*!
 * \brief Accelerometer-only gravity, tilt and vertical-motion estimator
 *
 * Gravity is tracked with a first-order low-pass filter:
 *
 *   g_est <- alpha * g_est + (1 - alpha) * a
 *
 * The remaining linear acceleration is projected on the unit gravity
 * direction to give the vertical acceleration a_z that perturbs a scale
 * reading. Roll and pitch come from the unit gravity vector only, so they
 * assume a static or slowly accelerating platform and carry no heading.
 *
 * Not thread safe. Feed samples from a single context.
 */
class OrientationEstimator
{
public:
  struct Output
  {
    /*!
     * \brief True when sample and metrics are populated
     *
     * False for a silent sensor and for the seeding sample.
     */
    bool has_sample{false};

    ProcessedSample sample{};
    LiveMetrics metrics{};
  };

  explicit OrientationEstimator(const Measurement::MeasurementConfig& cfg);

  Output Process(const RawInertialSample& raw);

  /*!
   * \brief Swap thresholds and filter coefficients
   *
   * A change of window length or rate ceiling re-sizes the RMS windows, which
   * clears them.
   */
  void UpdateConfig(const Measurement::MeasurementConfig& cfg);

  void Reset();

  bool IsInitialized() const { return m_initialized; }
  const Vector3& GravityEstimate() const { return m_gEst; }
  const Measurement::MeasurementConfig& GetConfig() const { return m_cfg; }

private:
  static std::size_t WindowCapacity(const Measurement::MeasurementConfig& cfg);

  void RecordInterval(double stamp_ms);
  double SamplingRateHz() const;
  LiveMetrics ComputeMetrics() const;

  Measurement::MeasurementConfig m_cfg;

  Vector3 m_gEst{Vector3::Zero()};
  bool m_initialized{false};

  RingWindow m_azWindow;
  RingWindow m_rollWindow;
  RingWindow m_pitchWindow;

  double m_lastStampMs{0.0};
  bool m_hasLastStamp{false};
  std::deque<double> m_intervalsMs;
};
} // namespace SEASCALE::IMU
