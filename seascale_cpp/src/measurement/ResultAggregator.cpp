/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "measurement/ResultAggregator.h"

#include "math/ConfidenceTable.h"
#include "math/Statistics.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

namespace SEASCALE::Measurement
{
namespace
{
// Units: grams
// Meaning: readings at or above this are treated as sensor garbage
constexpr double kMaxPlausibleReading = 100000.0;

// Units: unitless
// Meaning: smallest sample count for which the trimmed mean is used
constexpr std::size_t kMinTrimmedMeanCount = 3;

// Units: unitless
// Meaning: trimmed mean/median disagreement, as a fraction of the median,
// above which the median is used instead
constexpr double kMedianFallbackFraction = 0.1;

// Units: unitless
// Meaning: fixed coverage factor of the continuous-mode 95% band
constexpr double kContinuousBandK = 2.0;

// Units: m/s^2
// Meaning: g + a_z magnitude below which motion correction is skipped
constexpr double kMinCorrectionDenominator = 1e-9;

// Units: unitless
// Meaning: ratio of a 95% half-width to its 1-sigma equivalent
constexpr double kSigmaPer95 = 2.0;

// Units: unitless
// Meaning: largest band, as a fraction of the fixed value, for a reliable result
constexpr double kMaxReliableBandFraction = 0.1;

// Units: unitless
// Meaning: smallest confidence for a reliable result
constexpr double kMinReliableConfidence = 0.3;

bool IsPlausibleReading(double value)
{
  return std::isfinite(value) && value > 0.0 && value < kMaxPlausibleReading;
}

/*!
 * \brief Central estimate shared by both aggregation modes
 */
struct CentralEstimate
{
  std::size_t n_trim{0};
  double mean{0.0};
  double median{0.0};
  double trimmed_mean{0.0};
  double fixed_value{0.0};
  std::vector<double> trimmed;
  bool used_median{false};
  bool median_fallback{false};
};

/*!
 * \brief Pick the fixed value of a session
 *
 * Mean and median are reported over the trimmed set. With medianFallback the
 * median replaces a trimmed mean that drifts more than 10% from it.
 */
CentralEstimate SelectCentralValue(const std::vector<double>& values,
                                   double trimFraction,
                                   bool medianFallback)
{
  CentralEstimate estimate;

  estimate.trimmed = Math::Statistics::TrimSorted(values, trimFraction);
  estimate.n_trim = estimate.trimmed.size();
  estimate.mean = Math::Statistics::Mean(estimate.trimmed);
  estimate.median = Math::Statistics::Median(estimate.trimmed);
  estimate.trimmed_mean = Math::Statistics::Mean(estimate.trimmed);

  if (estimate.n_trim < kMinTrimmedMeanCount)
  {
    estimate.fixed_value = estimate.median;
    estimate.used_median = true;
    return estimate;
  }

  estimate.fixed_value = estimate.trimmed_mean;

  // The trim window can still hold an outlier cluster at small n
  if (medianFallback && std::abs(estimate.trimmed_mean - estimate.median) >
                            kMedianFallbackFraction * estimate.median)
  {
    estimate.fixed_value = estimate.median;
    estimate.median_fallback = true;
  }

  return estimate;
}

double ManualConfidence(std::size_t nTrim)
{
  if (nTrim >= 10)
    return 0.95;
  if (nTrim >= 6)
    return 0.85;
  if (nTrim >= 3)
    return 0.7;
  if (nTrim == 2)
    return 0.5;

  return 0.3;
}
} // namespace

ResultAggregator::ResultAggregator(const MeasurementConfig& cfg) : m_cfg(cfg)
{
}

SessionResult ResultAggregator::ComputeContinuous(const Session::SessionData& data,
                                                  double bias_g,
                                                  bool motionCorrection) const
{
  const double g = m_cfg.g_standard_mps2;

  // Each value stays paired with the motion sample it was recorded with
  std::vector<double> allValues;
  std::vector<double> goodValues;
  allValues.reserve(data.samples.size());

  std::size_t droppedByCorrection = 0;

  for (const Session::SessionSample& sample : data.samples)
  {
    if (!IsPlausibleReading(sample.scale_reading_g))
      continue;

    double value = sample.scale_reading_g - bias_g;

    if (motionCorrection)
    {
      const double denom = g + sample.a_z_mps2;
      if (std::abs(denom) >= kMinCorrectionDenominator)
        value = value * g / denom;

      if (!std::isfinite(value) || value <= 0.0)
      {
        ++droppedByCorrection;
        continue;
      }
    }

    allValues.push_back(value);
    if (sample.is_good)
      goodValues.push_back(value);
  }

  if (allValues.empty())
    return EmptyResult(Session::SessionKind::Continuous, "No usable scale readings");

  const bool useGood = goodValues.size() >= kMinTrimmedMeanCount;
  const std::vector<double>& selected = useGood ? goodValues : allValues;

  const CentralEstimate central = SelectCentralValue(selected, m_cfg.trim_fraction, true);

  SessionResult result;
  result.kind = Session::SessionKind::Continuous;
  result.n_total = allValues.size();
  result.n_trim = central.n_trim;
  result.trim_fraction = m_cfg.trim_fraction;
  result.bias_g = bias_g;
  result.mean_g = central.mean;
  result.median_g = central.median;
  result.trimmed_mean_g = central.trimmed_mean;
  result.fixed_value_g = central.fixed_value;

  const std::size_t n = selected.size();
  const double sigmaScale = Math::Statistics::SampleStdDev(selected);

  result.std_dev_g = sigmaScale;
  if (n >= 2)
    result.std_error_g = sigmaScale / std::sqrt(static_cast<double>(n));

  const double sigmaMotion = result.fixed_value_g * (m_cfg.uncertainty_k * data.rms_az_mps2) / g;
  result.total_uncertainty_1sigma_g = std::hypot(sigmaMotion, sigmaScale);

  result.k95 = kContinuousBandK;
  result.error_band_95_g = kContinuousBandK * result.total_uncertainty_1sigma_g;
  if (result.fixed_value_g > 0.0)
    result.relative_error_95_percent = 100.0 * result.error_band_95_g / result.fixed_value_g;

  const double percentGood = 100.0 * static_cast<double>(goodValues.size()) /
                             static_cast<double>(allValues.size());

  if (n >= kMinTrimmedMeanCount)
  {
    const double cv = result.fixed_value_g != 0.0 ? sigmaScale / result.fixed_value_g : 0.0;

    const double qualityScore = std::min(1.0, percentGood / 80.0);
    const double consistencyScore = std::max(0.0, 1.0 - 10.0 * cv);
    const double countScore = std::min(1.0, static_cast<double>(n) / 20.0);

    result.confidence =
        std::clamp(0.4 * qualityScore + 0.4 * consistencyScore + 0.2 * countScore, 0.0, 1.0);
  }
  else
  {
    result.confidence = std::min(1.0, static_cast<double>(n) / 10.0);
  }

  result.is_reliable = result.confidence > kMinReliableConfidence &&
                       goodValues.size() >= kMinTrimmedMeanCount &&
                       result.error_band_95_g < kMaxReliableBandFraction * result.fixed_value_g &&
                       data.rms_az_mps2 < 2.0 * m_cfg.t_az_rms_mps2;

  MotionDiagnostics& motion = result.motion;
  motion.n_good = goodValues.size();
  motion.percent_good = percentGood;
  motion.session_rms_az_mps2 = data.rms_az_mps2;
  motion.session_rms_roll_deg = data.rms_roll_deg;
  motion.session_rms_pitch_deg = data.rms_pitch_deg;
  motion.sigma_motion_g = sigmaMotion;
  motion.sigma_scale_g = sigmaScale;

  if (droppedByCorrection > 0)
  {
    result.notes.push_back(std::to_string(droppedByCorrection) +
                           " readings dropped after motion correction");
  }
  if (!useGood)
  {
    result.notes.push_back("Fewer than 3 good samples (" + std::to_string(goodValues.size()) +
                           ") - using all readings");
  }
  if (central.used_median)
  {
    result.notes.push_back("Low sample count (" + std::to_string(central.n_trim) +
                           ") - using median instead of trimmed mean");
  }
  if (central.median_fallback)
    result.notes.push_back("Trimmed mean deviates from median by more than 10% - using median");
  if (!result.is_reliable)
    result.notes.push_back("Result did not pass reliability checks");

  return result;
}

SessionResult ResultAggregator::ComputeManual(
    const std::vector<Session::ManualMeasurement>& measurements) const
{
  if (measurements.empty())
    return EmptyResult(Session::SessionKind::Base, "No measurements available");

  const Session::ManualMeasurement& first = measurements.front();

  std::vector<double> values;
  values.reserve(measurements.size());
  for (const Session::ManualMeasurement& measurement : measurements)
  {
    if (IsPlausibleReading(measurement.corrected_g))
      values.push_back(measurement.corrected_g);
  }

  if (values.empty())
    return EmptyResult(first.kind, "No measurements available");

  const CentralEstimate central = SelectCentralValue(values, m_cfg.trim_fraction, false);
  if (central.n_trim == 0)
    return EmptyResult(first.kind, "No measurements available");

  SessionResult result;
  result.kind = first.kind;
  result.n_total = values.size();
  result.n_trim = central.n_trim;
  result.trim_fraction = m_cfg.trim_fraction;
  result.bias_g = first.bias_g;
  result.tare_uncertainty_95_g = first.tare_uncertainty_95_g;
  result.tare_sigma_g = first.tare_uncertainty_95_g / kSigmaPer95;
  result.mean_g = central.mean;
  result.median_g = central.median;
  result.trimmed_mean_g = central.trimmed_mean;
  result.fixed_value_g = central.fixed_value;

  if (central.n_trim >= 2)
  {
    result.std_dev_g = Math::Statistics::SampleStdDev(central.trimmed);
    result.std_error_g = result.std_dev_g / std::sqrt(static_cast<double>(central.n_trim));
  }

  result.total_uncertainty_1sigma_g = std::hypot(result.std_error_g, result.tare_sigma_g);

  result.k95 = Math::ConfidenceTable::KFromN(central.n_trim);
  result.error_band_95_g = result.k95 * result.total_uncertainty_1sigma_g;
  if (result.fixed_value_g > 0.0)
    result.relative_error_95_percent = 100.0 * result.error_band_95_g / result.fixed_value_g;

  result.confidence = ManualConfidence(central.n_trim);

  std::vector<double> qualityScores;
  for (const Session::ManualMeasurement& measurement : measurements)
  {
    if (measurement.quality && measurement.quality->quality_score)
      qualityScores.push_back(std::clamp(*measurement.quality->quality_score, 0.0, 1.0));
  }
  if (!qualityScores.empty())
    result.confidence *= 0.5 + 0.5 * Math::Statistics::Mean(qualityScores);

  result.is_reliable = result.confidence > kMinReliableConfidence &&
                       central.n_trim >= kMinTrimmedMeanCount &&
                       result.error_band_95_g < kMaxReliableBandFraction * result.fixed_value_g;

  if (result.n_total == 1)
    result.notes.push_back("Single measurement - no statistical variation");
  if (central.used_median)
  {
    result.notes.push_back("Low sample count (" + std::to_string(central.n_trim) +
                           ") - using median instead of trimmed mean");
  }
  if (result.tare_uncertainty_95_g == 0.0)
    result.notes.push_back("No tare uncertainty specified");
  if (Math::ConfidenceTable::IsFallback(central.n_trim))
    result.notes.push_back("Warning: n=1, k-factor fallback used");

  return result;
}

SessionResult ResultAggregator::EmptyResult(Session::SessionKind kind, const char* note) const
{
  SessionResult result;
  result.kind = kind;
  result.trim_fraction = m_cfg.trim_fraction;
  result.k95 = Math::ConfidenceTable::FallbackK();
  result.notes.emplace_back(note);

  return result;
}
} // namespace SEASCALE::Measurement
