/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "imu/ImuTypes.h"
#include "measurement/MeasurementConfig.h"
#include "session/SessionTypes.h"

#include <vector>

namespace SEASCALE::Session
{
class IScaleReadingSource;

/*!
 * \brief Records motion samples paired with a sampled-and-held scale value
 *
 * The scale is polled at scale_sample_rate_hz, measured on the timestamps of
 * the incoming motion samples. Between polls the previous reading is carried
 * forward, so every SessionSample holds the value the scale showed at that
 * moment.
 *
 * States: idle -> Start() -> active -> Stop() -> idle.
 */
class ContinuousSession
{
public:
  ContinuousSession(const Measurement::MeasurementConfig& cfg, IScaleReadingSource& scale);

  /*!
   * \brief Begin recording, no-op while already active
   *
   * Snapshots the configuration for the life of the session.
   */
  void Start(double stamp_ms);

  /*!
   * \brief End recording and summarize
   *
   * \return Session snapshot, all zero when the session was not active
   */
  SessionData Stop(double stamp_ms);

  /*!
   * \brief Append a processed sample, ignored while idle
   */
  void AddSample(const IMU::ProcessedSample& sample);

  SessionProgress GetProgress(double now_ms) const;

  bool IsActive() const { return m_active; }

  /*!
   * \brief Drop recorded samples without changing the active state
   */
  void Reset();

  /*!
   * \brief Replace the configuration used by the next Start()
   */
  void UpdateConfig(const Measurement::MeasurementConfig& cfg);

private:
  bool IsGood(const IMU::ProcessedSample& sample) const;

  // Construction parameters
  IScaleReadingSource& m_scale;

  // Configuration
  Measurement::MeasurementConfig m_pendingConfig;
  Measurement::MeasurementConfig m_sessionConfig;

  // State
  bool m_active{false};
  std::vector<SessionSample> m_samples;
  double m_startMs{0.0};
  double m_lastPollMs{0.0};
  bool m_hasPolled{false};
  double m_heldReading{0.0};
};
} // namespace SEASCALE::Session
