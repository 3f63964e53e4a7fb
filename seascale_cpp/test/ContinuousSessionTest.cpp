/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "session/ContinuousSession.h"
#include "session/IScaleReadingSource.h"

#include <cmath>
#include <cstddef>

#include <gtest/gtest.h>

using namespace SEASCALE;
using namespace SEASCALE::Session;

namespace
{
/*!
 * \brief Scale that returns an increasing value on every poll
 */
class CountingScale : public IScaleReadingSource
{
public:
  double GetCurrentScaleReading() override
  {
    ++m_polls;
    return 100.0 + static_cast<double>(m_polls);
  }

  std::size_t Polls() const { return m_polls; }

private:
  std::size_t m_polls{0};
};

IMU::ProcessedSample MakeSample(double stamp_ms, double a_z = 0.0, double roll = 0.0)
{
  IMU::ProcessedSample sample;
  sample.stamp_ms = stamp_ms;
  sample.a_z_mps2 = a_z;
  sample.roll_deg = roll;
  return sample;
}
} // namespace

TEST(ContinuousSessionTest, IdleSessionIgnoresSamples)
{
  CountingScale scale;
  ContinuousSession session(Measurement::MeasurementConfig{}, scale);

  session.AddSample(MakeSample(0.0));

  EXPECT_FALSE(session.IsActive());
  EXPECT_EQ(scale.Polls(), 0u);

  const SessionData data = session.Stop(1000.0);
  EXPECT_TRUE(data.samples.empty());
  EXPECT_EQ(data.start_ms, 0.0);
  EXPECT_EQ(data.end_ms, 0.0);
  EXPECT_EQ(data.duration_s, 0.0);
  EXPECT_EQ(data.rms_az_mps2, 0.0);
  EXPECT_EQ(data.percent_good, 0.0);
}

TEST(ContinuousSessionTest, PollsAtScaleRateAndHoldsValue)
{
  // Default scale rate is 5 Hz, one poll per 200 ms
  CountingScale scale;
  ContinuousSession session(Measurement::MeasurementConfig{}, scale);

  session.Start(0.0);
  for (int i = 0; i < 10; ++i)
    session.AddSample(MakeSample(50.0 * i));

  const SessionData data = session.Stop(500.0);

  // Polls at 0, 200 and 400 ms
  EXPECT_EQ(scale.Polls(), 3u);
  ASSERT_EQ(data.samples.size(), 10u);
  EXPECT_DOUBLE_EQ(data.samples[0].scale_reading_g, 101.0);
  EXPECT_DOUBLE_EQ(data.samples[3].scale_reading_g, 101.0);
  EXPECT_DOUBLE_EQ(data.samples[4].scale_reading_g, 102.0);
  EXPECT_DOUBLE_EQ(data.samples[7].scale_reading_g, 102.0);
  EXPECT_DOUBLE_EQ(data.samples[8].scale_reading_g, 103.0);
  EXPECT_DOUBLE_EQ(data.duration_s, 0.5);
}

TEST(ContinuousSessionTest, FlagsGoodSamplesAndSummarizes)
{
  CountingScale scale;
  ContinuousSession session(Measurement::MeasurementConfig{}, scale);

  session.Start(0.0);
  session.AddSample(MakeSample(0.0, 0.1));
  session.AddSample(MakeSample(10.0, -0.1));
  session.AddSample(MakeSample(20.0, 1.5));
  session.AddSample(MakeSample(30.0, 0.0, 7.0));

  const SessionProgress progress = session.GetProgress(2000.0);
  EXPECT_DOUBLE_EQ(progress.elapsed_s, 2.0);
  EXPECT_EQ(progress.sample_count, 4u);
  EXPECT_EQ(progress.good_count, 2u);

  const SessionData data = session.Stop(40.0);

  EXPECT_TRUE(data.samples[0].is_good);
  EXPECT_TRUE(data.samples[1].is_good);
  EXPECT_FALSE(data.samples[2].is_good);
  EXPECT_FALSE(data.samples[3].is_good);
  EXPECT_DOUBLE_EQ(data.percent_good, 50.0);
  EXPECT_NEAR(data.rms_az_mps2, std::sqrt((0.01 + 0.01 + 2.25) / 4.0), 1e-12);
  EXPECT_NEAR(data.rms_roll_deg, 3.5, 1e-12);
  EXPECT_FALSE(session.IsActive());
}

TEST(ContinuousSessionTest, StartWhileActiveIsNoOp)
{
  CountingScale scale;
  ContinuousSession session(Measurement::MeasurementConfig{}, scale);

  session.Start(0.0);
  session.AddSample(MakeSample(0.0));
  session.Start(100.0);

  const SessionData data = session.Stop(1000.0);
  EXPECT_EQ(data.samples.size(), 1u);
  EXPECT_DOUBLE_EQ(data.start_ms, 0.0);
}

TEST(ContinuousSessionTest, ConfigTakesEffectAtNextStart)
{
  CountingScale scale;
  ContinuousSession session(Measurement::MeasurementConfig{}, scale);

  Measurement::MeasurementConfig strict;
  strict.t_az_instant_mps2 = 0.05;

  session.Start(0.0);
  session.UpdateConfig(strict);
  session.AddSample(MakeSample(0.0, 0.1));
  SessionData data = session.Stop(10.0);
  EXPECT_TRUE(data.samples.front().is_good);

  session.Start(20.0);
  session.AddSample(MakeSample(20.0, 0.1));
  data = session.Stop(30.0);
  EXPECT_FALSE(data.samples.front().is_good);
}

TEST(ContinuousSessionTest, ResetKeepsSessionActive)
{
  CountingScale scale;
  ContinuousSession session(Measurement::MeasurementConfig{}, scale);

  session.Start(0.0);
  session.AddSample(MakeSample(0.0));
  session.Reset();

  EXPECT_TRUE(session.IsActive());
  EXPECT_EQ(session.GetProgress(10.0).sample_count, 0u);

  // The first sample after a reset polls again
  session.AddSample(MakeSample(10.0));
  EXPECT_EQ(scale.Polls(), 2u);
}

TEST(ContinuousSessionTest, DurationFollowsSampleTimebase)
{
  // Header stamps since the epoch, with start and stop taken from the
  // newest sample stamp as the weighing node does
  constexpr double epochMs = 1.7e12;

  CountingScale scale;
  ContinuousSession session(Measurement::MeasurementConfig{}, scale);

  session.Start(epochMs);
  for (int i = 0; i <= 10; ++i)
    session.AddSample(MakeSample(epochMs + 100.0 * i));

  const SessionProgress progress = session.GetProgress(epochMs + 1000.0);
  EXPECT_DOUBLE_EQ(progress.elapsed_s, 1.0);
  EXPECT_EQ(progress.sample_count, 11u);

  const SessionData data = session.Stop(epochMs + 1000.0);

  EXPECT_DOUBLE_EQ(data.duration_s, 1.0);
  EXPECT_EQ(scale.Polls(), 6u);
}
