/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "session/ManualSession.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace SEASCALE::Session
{
ManualSession::ManualSession(SessionKind kind) : m_kind(kind)
{
}

void ManualSession::StartSession(double bias_g, double tareUncertainty95_g)
{
  m_active = true;
  m_measurements.clear();
  m_bias = bias_g;
  m_tareUncertainty95 = tareUncertainty95_g;
}

void ManualSession::StartSession(const TareEstimate& tare)
{
  StartSession(tare.bias_g, tare.uncertainty_95_g);
}

void ManualSession::AddMeasurement(double reading_g,
                                   double stamp_ms,
                                   const std::optional<QualitySnapshot>& quality)
{
  if (!m_active)
  {
    throw std::invalid_argument(std::string("Session ") + SessionKindName(m_kind) +
                                " is not active, call StartSession() first");
  }

  if (!std::isfinite(reading_g) || reading_g <= 0.0)
    throw std::invalid_argument("Scale reading must be a finite, positive number");

  ManualMeasurement measurement;
  measurement.stamp_ms = stamp_ms;
  measurement.kind = m_kind;
  measurement.scale_reading_g = reading_g;
  measurement.bias_g = m_bias;
  measurement.tare_uncertainty_95_g = m_tareUncertainty95;
  measurement.corrected_g = reading_g - m_bias;
  measurement.quality = quality;

  m_measurements.push_back(measurement);
}

void ManualSession::RemoveMeasurement(std::size_t index)
{
  if (index >= m_measurements.size())
    return;

  m_measurements.erase(m_measurements.begin() + static_cast<std::ptrdiff_t>(index));
}

std::vector<ManualMeasurement> ManualSession::StopSession()
{
  m_active = false;
  return m_measurements;
}

void ManualSession::Clear()
{
  m_measurements.clear();
}
} // namespace SEASCALE::Session
