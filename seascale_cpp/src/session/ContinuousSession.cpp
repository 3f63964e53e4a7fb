/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "session/ContinuousSession.h"

#include "math/Statistics.h"
#include "session/IScaleReadingSource.h"

#include <cmath>

namespace SEASCALE::Session
{
namespace
{
// Units: milliseconds per second
constexpr double kMsPerSecond = 1000.0;
} // namespace

ContinuousSession::ContinuousSession(const Measurement::MeasurementConfig& cfg,
                                     IScaleReadingSource& scale)
  : m_scale(scale), m_pendingConfig(cfg), m_sessionConfig(cfg)
{
}

void ContinuousSession::Start(double stamp_ms)
{
  if (m_active)
    return;

  m_sessionConfig = m_pendingConfig;

  m_active = true;
  m_samples.clear();
  m_startMs = stamp_ms;
  m_lastPollMs = 0.0;
  m_hasPolled = false;
  m_heldReading = 0.0;
}

SessionData ContinuousSession::Stop(double stamp_ms)
{
  SessionData data{};

  if (!m_active)
    return data;

  m_active = false;

  std::vector<double> az;
  std::vector<double> roll;
  std::vector<double> pitch;
  az.reserve(m_samples.size());
  roll.reserve(m_samples.size());
  pitch.reserve(m_samples.size());

  std::size_t goodCount = 0;
  for (const SessionSample& sample : m_samples)
  {
    az.push_back(sample.a_z_mps2);
    roll.push_back(sample.roll_deg);
    pitch.push_back(sample.pitch_deg);
    if (sample.is_good)
      ++goodCount;
  }

  data.start_ms = m_startMs;
  data.end_ms = stamp_ms;
  data.duration_s = (stamp_ms - m_startMs) / kMsPerSecond;
  data.rms_az_mps2 = Math::Statistics::Rms(az);
  data.rms_roll_deg = Math::Statistics::Rms(roll);
  data.rms_pitch_deg = Math::Statistics::Rms(pitch);
  if (!m_samples.empty())
  {
    data.percent_good =
        100.0 * static_cast<double>(goodCount) / static_cast<double>(m_samples.size());
  }
  data.samples = m_samples;

  return data;
}

void ContinuousSession::AddSample(const IMU::ProcessedSample& sample)
{
  if (!m_active)
    return;

  const double rate_hz = m_sessionConfig.scale_sample_rate_hz;
  const double poll_interval_ms = rate_hz > 0.0 ? kMsPerSecond / rate_hz : 0.0;

  if (!m_hasPolled || sample.stamp_ms - m_lastPollMs >= poll_interval_ms)
  {
    m_heldReading = m_scale.GetCurrentScaleReading();
    m_lastPollMs = sample.stamp_ms;
    m_hasPolled = true;
  }

  SessionSample entry;
  entry.stamp_ms = sample.stamp_ms;
  entry.a_z_mps2 = sample.a_z_mps2;
  entry.roll_deg = sample.roll_deg;
  entry.pitch_deg = sample.pitch_deg;
  entry.scale_reading_g = m_heldReading;
  entry.is_good = IsGood(sample);

  m_samples.push_back(entry);
}

SessionProgress ContinuousSession::GetProgress(double now_ms) const
{
  SessionProgress progress{};

  if (!m_active)
    return progress;

  progress.elapsed_s = (now_ms - m_startMs) / kMsPerSecond;
  progress.sample_count = m_samples.size();
  for (const SessionSample& sample : m_samples)
  {
    if (sample.is_good)
      ++progress.good_count;
  }

  return progress;
}

void ContinuousSession::Reset()
{
  m_samples.clear();
  m_lastPollMs = 0.0;
  m_hasPolled = false;
  m_heldReading = 0.0;
}

void ContinuousSession::UpdateConfig(const Measurement::MeasurementConfig& cfg)
{
  m_pendingConfig = cfg;
}

bool ContinuousSession::IsGood(const IMU::ProcessedSample& sample) const
{
  return std::abs(sample.a_z_mps2) < m_sessionConfig.t_az_instant_mps2 &&
         std::abs(sample.roll_deg) < m_sessionConfig.t_roll_instant_deg &&
         std::abs(sample.pitch_deg) < m_sessionConfig.t_pitch_instant_deg;
}
} // namespace SEASCALE::Session
