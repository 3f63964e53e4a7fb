/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "session/SessionTypes.h"

#include <cstddef>
#include <string>
#include <vector>

namespace SEASCALE::Measurement
{
/*!
 * \brief Motion breakdown of a continuous-session result
 */
struct MotionDiagnostics
{
  std::size_t n_good{0};

  // Units: percent
  double percent_good{0.0};

  // Units: m/s^2
  double session_rms_az_mps2{0.0};

  // Units: degrees
  double session_rms_roll_deg{0.0};

  // Units: degrees
  double session_rms_pitch_deg{0.0};

  /*!
   * \brief Uncertainty from residual vertical acceleration
   *
   * Units: grams
   */
  double sigma_motion_g{0.0};

  /*!
   * \brief Spread of the selected scale values
   *
   * Units: grams
   */
  double sigma_scale_g{0.0};
};

/*!
 * \brief Aggregate of one session, continuous or manual
 *
 * Insufficient data yields a valid result with zero estimates and an
 * explanatory note, never an exception.
 */
struct SessionResult
{
  Session::SessionKind kind{Session::SessionKind::Base};

  // Usable values before trimming
  std::size_t n_total{0};

  // Values left after trimming
  std::size_t n_trim{0};

  // Units: unitless
  double trim_fraction{0.0};

  // Units: grams
  double bias_g{0.0};

  // Units: grams
  double tare_uncertainty_95_g{0.0};

  // Units: grams
  double tare_sigma_g{0.0};

  // Units: grams
  double mean_g{0.0};

  // Units: grams
  double median_g{0.0};

  // Units: grams
  double trimmed_mean_g{0.0};

  /*!
   * \brief Selected central estimate
   *
   * Units: grams
   */
  double fixed_value_g{0.0};

  // Units: grams
  double std_dev_g{0.0};

  // Units: grams
  double std_error_g{0.0};

  // Units: grams
  double total_uncertainty_1sigma_g{0.0};

  /*!
   * \brief Half-width of the 95% band, k95 * total 1-sigma
   *
   * Units: grams
   */
  double error_band_95_g{0.0};

  // Units: percent of fixed_value_g
  double relative_error_95_percent{0.0};

  // Coverage factor used for the 95% band
  double k95{2.0};

  // Units: unitless, [0, 1]
  double confidence{0.0};

  bool is_reliable{false};

  // Populated for continuous sessions only
  MotionDiagnostics motion{};

  std::vector<std::string> notes;
};

/*!
 * \brief Relative change between a base and a final session
 *
 * ratio = (W_base - W_final) / W_base
 */
struct RatioResult
{
  SessionResult base_result;
  SessionResult final_result;

  // Units: unitless
  double ratio{0.0};

  // Units: percent
  double percent{0.0};

  // Units: unitless
  double sigma_ratio_1sigma{0.0};

  // Units: unitless
  double error_band_95_ratio{0.0};

  // Units: percentage points
  double error_band_95_percent{0.0};

  // Units: percent of |percent|
  double relative_error_95_percent{0.0};

  double k95{2.0};

  // min(base_result.n_trim, final_result.n_trim)
  std::size_t n_eff{0};

  std::vector<std::string> notes;
};
} // namespace SEASCALE::Measurement
