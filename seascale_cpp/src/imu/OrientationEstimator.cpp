/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "imu/OrientationEstimator.h"

#include "math/VectorMath.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace SEASCALE::IMU
{
namespace
{
// Units: milliseconds per second
constexpr double kMsPerSecond = 1000.0;

double ChannelConfidence(double rms, double threshold)
{
  // Units: unitless
  // Meaning: RMS at which a channel scores zero, as a multiple of its threshold
  const double zero_score_mult = 2.0;

  const double denom = zero_score_mult * threshold;
  if (denom <= 0.0)
    return 0.0;

  return std::max(0.0, 1.0 - rms / denom);
}
} // namespace

OrientationEstimator::OrientationEstimator(const Measurement::MeasurementConfig& cfg)
  : m_cfg(cfg),
    m_azWindow(WindowCapacity(cfg)),
    m_rollWindow(WindowCapacity(cfg)),
    m_pitchWindow(WindowCapacity(cfg))
{
}

std::size_t OrientationEstimator::WindowCapacity(const Measurement::MeasurementConfig& cfg)
{
  const double samples = std::ceil(std::max(cfg.max_sample_rate_hz, 1.0) *
                                   std::max(cfg.live_window_duration_s, 0.0));
  return std::max<std::size_t>(static_cast<std::size_t>(samples), 1);
}

OrientationEstimator::Output OrientationEstimator::Process(const RawInertialSample& raw)
{
  Output out{};

  if (!raw.accel_incl_gravity_mps2)
    return out;

  const Vector3& accel = *raw.accel_incl_gravity_mps2;

  if (!m_initialized)
  {
    // Seed directly so the filter does not start from a zero-gravity bias
    m_gEst = accel;
    m_initialized = true;
    m_lastStampMs = raw.stamp_ms;
    m_hasLastStamp = true;
    return out;
  }

  const double alpha = m_cfg.gravity_filter_alpha;
  m_gEst = alpha * m_gEst + (1.0 - alpha) * accel;

  ProcessedSample& sample = out.sample;
  sample.g_est_mps2 = m_gEst;
  sample.a_lin_mps2 = accel - m_gEst;
  sample.g_unit = Math::Normalize(m_gEst);
  sample.a_z_mps2 = Math::Dot(sample.a_lin_mps2, sample.g_unit);

  const Vector3& u = sample.g_unit;
  sample.pitch_deg = Math::RadToDeg(std::atan2(-u.x(), std::hypot(u.y(), u.z())));
  sample.roll_deg = Math::RadToDeg(std::atan2(u.y(), u.z()));
  sample.stamp_ms = raw.stamp_ms;

  m_azWindow.Push(sample.a_z_mps2, raw.stamp_ms);
  m_rollWindow.Push(sample.roll_deg, raw.stamp_ms);
  m_pitchWindow.Push(sample.pitch_deg, raw.stamp_ms);

  RecordInterval(raw.stamp_ms);

  out.metrics = ComputeMetrics();
  out.has_sample = true;

  return out;
}

void OrientationEstimator::UpdateConfig(const Measurement::MeasurementConfig& cfg)
{
  const std::size_t capacity = WindowCapacity(cfg);

  m_cfg = cfg;

  if (capacity != m_azWindow.Capacity())
  {
    m_azWindow = RingWindow(capacity);
    m_rollWindow = RingWindow(capacity);
    m_pitchWindow = RingWindow(capacity);
  }

  while (m_intervalsMs.size() > m_cfg.rate_history_size)
    m_intervalsMs.pop_front();
}

void OrientationEstimator::Reset()
{
  m_gEst = Vector3::Zero();
  m_initialized = false;

  m_azWindow.Clear();
  m_rollWindow.Clear();
  m_pitchWindow.Clear();

  m_lastStampMs = 0.0;
  m_hasLastStamp = false;
  m_intervalsMs.clear();
}

void OrientationEstimator::RecordInterval(double stamp_ms)
{
  if (m_hasLastStamp)
  {
    m_intervalsMs.push_back(stamp_ms - m_lastStampMs);
    while (m_intervalsMs.size() > m_cfg.rate_history_size)
      m_intervalsMs.pop_front();
  }

  m_lastStampMs = stamp_ms;
  m_hasLastStamp = true;
}

double OrientationEstimator::SamplingRateHz() const
{
  if (m_intervalsMs.empty())
    return 0.0;

  const double mean_interval_ms =
      std::accumulate(m_intervalsMs.begin(), m_intervalsMs.end(), 0.0) /
      static_cast<double>(m_intervalsMs.size());

  if (mean_interval_ms <= 0.0)
    return 0.0;

  return kMsPerSecond / mean_interval_ms;
}

LiveMetrics OrientationEstimator::ComputeMetrics() const
{
  const double window_ms = m_cfg.live_window_duration_s * kMsPerSecond;

  LiveMetrics metrics{};

  metrics.rms_az_mps2 = m_azWindow.RmsInWindow(window_ms);
  metrics.rms_roll_deg = m_rollWindow.RmsInWindow(window_ms);
  metrics.rms_pitch_deg = m_pitchWindow.RmsInWindow(window_ms);

  metrics.a_z_mps2 = m_azWindow.Latest();
  metrics.roll_deg = m_rollWindow.Latest();
  metrics.pitch_deg = m_pitchWindow.Latest();

  metrics.sampling_rate_hz = SamplingRateHz();

  metrics.is_stable = metrics.rms_az_mps2 < m_cfg.t_az_rms_mps2 &&
                      metrics.rms_roll_deg < m_cfg.t_roll_rms_deg &&
                      metrics.rms_pitch_deg < m_cfg.t_pitch_rms_deg;

  const double az_conf = ChannelConfidence(metrics.rms_az_mps2, m_cfg.t_az_rms_mps2);
  const double roll_conf = ChannelConfidence(metrics.rms_roll_deg, m_cfg.t_roll_rms_deg);
  const double pitch_conf = ChannelConfidence(metrics.rms_pitch_deg, m_cfg.t_pitch_rms_deg);

  metrics.confidence = std::clamp((az_conf + roll_conf + pitch_conf) / 3.0, 0.0, 1.0);

  return metrics;
}
} // namespace SEASCALE::IMU
