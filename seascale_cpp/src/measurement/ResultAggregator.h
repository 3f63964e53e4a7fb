/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "measurement/MeasurementConfig.h"
#include "measurement/MeasurementTypes.h"
#include "session/SessionTypes.h"

#include <vector>

namespace SEASCALE::Measurement
{
/*!
 * \brief Reduces a finished session to a fixed value with uncertainty
 *
 * Continuous mode optionally corrects each scale reading for the vertical
 * acceleration of its own motion sample:
 *
 *   corrected = reading * g / (g + a_z)
 *
 * and combines a motion term with the spread of the readings. The 95% band
 * uses a fixed multiplier of 2.
 *
 * Manual mode combines the standard error of the trimmed readings with the
 * locked tare uncertainty, and scales by the Student-t factor for the
 * trimmed count.
 *
 * Both modes are pure functions of their inputs and the configuration.
 */
class ResultAggregator
{
public:
  explicit ResultAggregator(const MeasurementConfig& cfg);

  SessionResult ComputeContinuous(const Session::SessionData& data,
                                  double bias_g,
                                  bool motionCorrection) const;

  SessionResult ComputeManual(const std::vector<Session::ManualMeasurement>& measurements) const;

  void UpdateConfig(const MeasurementConfig& cfg) { m_cfg = cfg; }
  const MeasurementConfig& GetConfig() const { return m_cfg; }

private:
  SessionResult EmptyResult(Session::SessionKind kind, const char* note) const;

  MeasurementConfig m_cfg;
};
} // namespace SEASCALE::Measurement
