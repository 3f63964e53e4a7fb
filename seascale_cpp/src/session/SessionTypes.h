/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace SEASCALE::Session
{
/*!
 * \brief Role of a measurement session
 *
 * Base and Final are the two manual sessions of a ratio workflow.
 */
enum class SessionKind
{
  Base,
  Final,
  Continuous,
};

const char* SessionKindName(SessionKind kind);

/*!
 * \brief One motion sample of a continuous session, paired with the scale
 */
struct SessionSample
{
  // Units: milliseconds
  double stamp_ms{0.0};

  // Units: m/s^2
  double a_z_mps2{0.0};

  // Units: degrees
  double roll_deg{0.0};

  // Units: degrees
  double pitch_deg{0.0};

  /*!
   * \brief Scale value held at this sample, see ContinuousSession
   *
   * Units: grams
   */
  double scale_reading_g{0.0};

  /*!
   * \brief True when all instantaneous motion gates passed
   */
  bool is_good{false};
};

/*!
 * \brief Snapshot of a finished continuous session
 */
struct SessionData
{
  std::vector<SessionSample> samples;

  // Units: milliseconds
  double start_ms{0.0};

  // Units: milliseconds
  double end_ms{0.0};

  // Units: seconds
  double duration_s{0.0};

  // Units: m/s^2
  double rms_az_mps2{0.0};

  // Units: degrees
  double rms_roll_deg{0.0};

  // Units: degrees
  double rms_pitch_deg{0.0};

  // Units: percent
  double percent_good{0.0};
};

struct SessionProgress
{
  // Units: seconds
  double elapsed_s{0.0};

  std::size_t sample_count{0};
  std::size_t good_count{0};
};

struct TareSample
{
  // Units: milliseconds
  double stamp_ms{0.0};

  // Units: grams
  double reading_g{0.0};
};

struct TareEstimate
{
  enum class Provenance
  {
    // Median and half range of collected empty-scale readings
    Estimated,

    // Entered directly by the operator
    UserEntered,
  };

  // Number of readings behind the estimate, 0 for user-entered values
  std::size_t count{0};

  // Units: grams
  double bias_g{0.0};

  /*!
   * \brief 95% tare uncertainty, half the observed range
   *
   * Units: grams
   */
  double uncertainty_95_g{0.0};

  /*!
   * \brief 1-sigma equivalent, uncertainty_95_g / 2
   *
   * Units: grams
   */
  double sigma_g{0.0};

  Provenance provenance{Provenance::Estimated};
};

/*!
 * \brief Live motion quality captured when a manual reading was taken
 */
struct QualitySnapshot
{
  // Units: unitless, [0, 1]
  std::optional<double> quality_score;

  // Units: m/s^2
  std::optional<double> az_rms_mps2;

  // Units: degrees
  std::optional<double> roll_rms_deg;

  // Units: degrees
  std::optional<double> pitch_rms_deg;
};

struct ManualMeasurement
{
  // Units: milliseconds
  double stamp_ms{0.0};

  SessionKind kind{SessionKind::Base};

  // Units: grams
  double scale_reading_g{0.0};

  /*!
   * \brief Bias locked at session start
   *
   * Units: grams
   */
  double bias_g{0.0};

  /*!
   * \brief 95% tare uncertainty locked at session start
   *
   * Units: grams
   */
  double tare_uncertainty_95_g{0.0};

  /*!
   * \brief scale_reading_g - bias_g
   *
   * Units: grams
   */
  double corrected_g{0.0};

  std::optional<QualitySnapshot> quality;
};
} // namespace SEASCALE::Session
