/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "imu/OrientationEstimator.h"
#include "math/VectorMath.h"

#include <cmath>

#include <gtest/gtest.h>

using namespace SEASCALE;
using namespace SEASCALE::IMU;

namespace
{
// Units: m/s^2
constexpr double kGravity = 9.80665;

// Units: milliseconds
constexpr double kPeriodMs = 10.0;

RawInertialSample MakeSample(const Vector3& accel, double stamp_ms)
{
  RawInertialSample raw;
  raw.accel_incl_gravity_mps2 = accel;
  raw.stamp_ms = stamp_ms;
  return raw;
}
} // namespace

TEST(OrientationEstimatorTest, SilentSensorIsIgnored)
{
  OrientationEstimator estimator{Measurement::MeasurementConfig{}};

  RawInertialSample raw;
  raw.stamp_ms = 5.0;

  const OrientationEstimator::Output out = estimator.Process(raw);

  EXPECT_FALSE(out.has_sample);
  EXPECT_FALSE(estimator.IsInitialized());
}

TEST(OrientationEstimatorTest, FirstSampleSeedsGravity)
{
  OrientationEstimator estimator{Measurement::MeasurementConfig{}};

  const Vector3 accel{0.1, -0.2, kGravity};
  const OrientationEstimator::Output out = estimator.Process(MakeSample(accel, 0.0));

  EXPECT_FALSE(out.has_sample);
  EXPECT_TRUE(estimator.IsInitialized());
  EXPECT_EQ(estimator.GravityEstimate(), accel);
}

TEST(OrientationEstimatorTest, StaticLevelPlatformIsStable)
{
  OrientationEstimator estimator{Measurement::MeasurementConfig{}};

  OrientationEstimator::Output out;
  for (int i = 0; i < 600; ++i)
    out = estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity}, i * kPeriodMs));

  ASSERT_TRUE(out.has_sample);
  EXPECT_NEAR(out.sample.a_z_mps2, 0.0, 1e-9);
  EXPECT_NEAR(out.sample.roll_deg, 0.0, 1e-9);
  EXPECT_NEAR(out.sample.pitch_deg, 0.0, 1e-9);
  EXPECT_NEAR(out.sample.g_unit.z(), 1.0, 1e-12);
  EXPECT_TRUE(out.metrics.is_stable);
  EXPECT_NEAR(out.metrics.confidence, 1.0, 1e-9);
  EXPECT_NEAR(out.metrics.sampling_rate_hz, 100.0, 1e-6);
}

TEST(OrientationEstimatorTest, RollAndPitchFromGravityDirection)
{
  const double tilt_rad = Math::DegToRad(10.0);

  OrientationEstimator rollEstimator{Measurement::MeasurementConfig{}};
  OrientationEstimator pitchEstimator{Measurement::MeasurementConfig{}};

  const Vector3 rolled{0.0, kGravity * std::sin(tilt_rad), kGravity * std::cos(tilt_rad)};
  const Vector3 pitched{-kGravity * std::sin(tilt_rad), 0.0, kGravity * std::cos(tilt_rad)};

  OrientationEstimator::Output rollOut;
  OrientationEstimator::Output pitchOut;
  for (int i = 0; i < 10; ++i)
  {
    rollOut = rollEstimator.Process(MakeSample(rolled, i * kPeriodMs));
    pitchOut = pitchEstimator.Process(MakeSample(pitched, i * kPeriodMs));
  }

  EXPECT_NEAR(rollOut.sample.roll_deg, 10.0, 1e-9);
  EXPECT_NEAR(rollOut.sample.pitch_deg, 0.0, 1e-9);
  EXPECT_NEAR(pitchOut.sample.pitch_deg, 10.0, 1e-9);
  EXPECT_NEAR(pitchOut.sample.roll_deg, 0.0, 1e-9);
}

TEST(OrientationEstimatorTest, VerticalStepDecaysIntoGravity)
{
  const Measurement::MeasurementConfig cfg;
  OrientationEstimator estimator{cfg};

  estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity}, 0.0));

  // Sustained extra 1 m/s^2 along gravity
  const Vector3 stepped{0.0, 0.0, kGravity + 1.0};

  OrientationEstimator::Output out = estimator.Process(MakeSample(stepped, kPeriodMs));
  ASSERT_TRUE(out.has_sample);
  EXPECT_NEAR(out.sample.a_z_mps2, cfg.gravity_filter_alpha * 1.0, 1e-9);

  for (int i = 2; i < 400; ++i)
    out = estimator.Process(MakeSample(stepped, i * kPeriodMs));

  EXPECT_NEAR(out.sample.a_z_mps2, 0.0, 1e-6);
  EXPECT_NEAR(estimator.GravityEstimate().z(), kGravity + 1.0, 1e-6);
}

TEST(OrientationEstimatorTest, VibrationIsUnstable)
{
  OrientationEstimator estimator{Measurement::MeasurementConfig{}};

  OrientationEstimator::Output out;
  for (int i = 0; i < 200; ++i)
  {
    const double heave = (i % 2 == 0) ? 2.0 : -2.0;
    out = estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity + heave}, i * kPeriodMs));
  }

  ASSERT_TRUE(out.has_sample);
  EXPECT_FALSE(out.metrics.is_stable);
  EXPECT_GT(out.metrics.rms_az_mps2, 1.0);
  EXPECT_LT(out.metrics.confidence, 0.7);
  EXPECT_GE(out.metrics.confidence, 0.0);
}

TEST(OrientationEstimatorTest, UpdateConfigChangesThresholds)
{
  OrientationEstimator estimator{Measurement::MeasurementConfig{}};

  OrientationEstimator::Output out;
  int i = 0;
  for (; i < 100; ++i)
  {
    const double heave = (i % 2 == 0) ? 1.0 : -1.0;
    out = estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity + heave}, i * kPeriodMs));
  }
  EXPECT_FALSE(out.metrics.is_stable);

  Measurement::MeasurementConfig relaxed;
  relaxed.t_az_rms_mps2 = 10.0;
  estimator.UpdateConfig(relaxed);

  out = estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity}, i * kPeriodMs));
  EXPECT_TRUE(out.metrics.is_stable);
}

TEST(OrientationEstimatorTest, ResetRearmsSeeding)
{
  OrientationEstimator estimator{Measurement::MeasurementConfig{}};

  estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity}, 0.0));
  estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity}, kPeriodMs));

  estimator.Reset();
  EXPECT_FALSE(estimator.IsInitialized());

  const OrientationEstimator::Output out =
      estimator.Process(MakeSample(Vector3{0.0, 0.0, kGravity}, 2 * kPeriodMs));
  EXPECT_FALSE(out.has_sample);
  EXPECT_TRUE(estimator.IsInitialized());
}
