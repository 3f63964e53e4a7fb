/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "measurement/MeasurementConfig.h"

#include <cmath>

namespace SEASCALE::Measurement
{
namespace
{
bool IsPositive(double value)
{
  return std::isfinite(value) && value > 0.0;
}
} // namespace

bool IsValid(const MeasurementConfig& cfg, const char** reason)
{
  const char* failed = nullptr;

  if (!IsPositive(cfg.t_az_rms_mps2))
    failed = "T_az_rms";
  else if (!IsPositive(cfg.t_roll_rms_deg))
    failed = "T_roll_rms";
  else if (!IsPositive(cfg.t_pitch_rms_deg))
    failed = "T_pitch_rms";
  else if (!IsPositive(cfg.t_az_instant_mps2))
    failed = "T_az_instant";
  else if (!IsPositive(cfg.t_roll_instant_deg))
    failed = "T_roll_instant";
  else if (!IsPositive(cfg.t_pitch_instant_deg))
    failed = "T_pitch_instant";
  else if (!std::isfinite(cfg.gravity_filter_alpha) || cfg.gravity_filter_alpha < 0.0 ||
           cfg.gravity_filter_alpha >= 1.0)
    failed = "gravity_filter_alpha";
  else if (!IsPositive(cfg.sample_mass_default_g))
    failed = "sample_mass_default";
  else if (!IsPositive(cfg.scale_sample_rate_hz))
    failed = "scale_sample_rate";
  else if (!IsPositive(cfg.live_window_duration_s))
    failed = "live_window_duration";
  else if (!std::isfinite(cfg.uncertainty_k) || cfg.uncertainty_k < 0.0)
    failed = "uncertainty_k";
  else if (!IsPositive(cfg.g_standard_mps2))
    failed = "g_standard";
  else if (!std::isfinite(cfg.trim_fraction) || cfg.trim_fraction < 0.0 ||
           cfg.trim_fraction >= 0.5)
    failed = "trim_fraction";
  else if (!IsPositive(cfg.max_sample_rate_hz))
    failed = "max_sample_rate_hz";
  else if (cfg.rate_history_size == 0)
    failed = "rate_history_size";

  if (reason != nullptr)
    *reason = failed;

  return failed == nullptr;
}
} // namespace SEASCALE::Measurement
