/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <cstddef>

namespace SEASCALE::Measurement
{
/*!
 * \brief Thresholds and filter coefficients shared by the estimation pipeline
 *
 * Passed by value into every component. Components copy it on construction
 * and on UpdateConfig(), so a caller may edit its own copy freely.
 *
 * The RMS thresholds gate live "ready to measure" guidance. The instant
 * thresholds gate individual session samples and are normally looser. The
 * two sets are tuned independently.
 */
struct MeasurementConfig
{
  /*!
   * \brief Live stability threshold on RMS vertical acceleration
   *
   * Units: m/s^2
   */
  double t_az_rms_mps2{0.35};

  /*!
   * \brief Live stability threshold on RMS roll
   *
   * Units: degrees
   */
  double t_roll_rms_deg{2.5};

  /*!
   * \brief Live stability threshold on RMS pitch
   *
   * Units: degrees
   */
  double t_pitch_rms_deg{2.5};

  /*!
   * \brief Per-sample gate on absolute vertical acceleration
   *
   * Units: m/s^2
   */
  double t_az_instant_mps2{0.8};

  /*!
   * \brief Per-sample gate on absolute roll
   *
   * Units: degrees
   */
  double t_roll_instant_deg{6.0};

  /*!
   * \brief Per-sample gate on absolute pitch
   *
   * Units: degrees
   */
  double t_pitch_instant_deg{6.0};

  /*!
   * \brief Gravity low-pass coefficient, weight of the previous estimate
   *
   * Units: unitless
   * Recommended range: [0.90, 0.98]
   */
  double gravity_filter_alpha{0.92};

  /*!
   * \brief Nominal sample mass offered to the operator
   *
   * Units: grams
   */
  double sample_mass_default_g{150.0};

  /*!
   * \brief Cadence at which a continuous session polls the scale reading
   *
   * Units: Hz
   */
  double scale_sample_rate_hz{5.0};

  /*!
   * \brief Trailing window for live RMS metrics
   *
   * Units: seconds
   */
  double live_window_duration_s{5.0};

  /*!
   * \brief Worst-case excursion factor applied to RMS vertical acceleration
   *
   * Units: unitless
   */
  double uncertainty_k{2.0};

  /*!
   * \brief Standard gravity
   *
   * Units: m/s^2
   */
  double g_standard_mps2{9.80665};

  /*!
   * \brief Fraction trimmed from each tail before averaging
   *
   * Units: unitless
   */
  double trim_fraction{0.10};

  /*!
   * \brief Sample-rate ceiling used to size the live RMS windows
   *
   * A faster device keeps a shorter wall-clock window than configured.
   *
   * Units: Hz
   */
  double max_sample_rate_hz{200.0};

  /*!
   * \brief Number of inter-sample intervals averaged for the rate estimate
   *
   * Units: samples
   */
  std::size_t rate_history_size{100};
};

/*!
 * \brief Check that every field is inside its usable range
 *
 * \param cfg The configuration to check
 * \param[out] reason Name of the first offending field, if any
 *
 * \return True if the configuration can drive the pipeline
 */
bool IsValid(const MeasurementConfig& cfg, const char** reason = nullptr);
} // namespace SEASCALE::Measurement
