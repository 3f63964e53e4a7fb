/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "session/ManualSession.h"
#include "session/TareEstimator.h"

#include <cmath>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

using namespace SEASCALE::Session;

TEST(ManualSessionTest, AddBeforeStartThrows)
{
  ManualSession session(SessionKind::Base);

  EXPECT_FALSE(session.IsActive());
  EXPECT_THROW(session.AddMeasurement(100.0, 0.0), std::invalid_argument);
  EXPECT_FALSE(session.CanCalculate());
}

TEST(ManualSessionTest, CorrectsWithLockedBias)
{
  ManualSession session(SessionKind::Final);
  session.StartSession(5.0, 1.0);
  session.AddMeasurement(100.0, 10.0);

  ASSERT_EQ(session.Count(), 1u);
  const ManualMeasurement& m = session.Measurements().front();
  EXPECT_EQ(m.kind, SessionKind::Final);
  EXPECT_DOUBLE_EQ(m.scale_reading_g, 100.0);
  EXPECT_DOUBLE_EQ(m.bias_g, 5.0);
  EXPECT_DOUBLE_EQ(m.tare_uncertainty_95_g, 1.0);
  EXPECT_DOUBLE_EQ(m.corrected_g, 95.0);
  EXPECT_TRUE(session.CanCalculate());
}

TEST(ManualSessionTest, BiasStaysFrozenAfterTareChanges)
{
  TareEstimator tare;
  tare.AddTareSample(5.0, 0.0);

  ManualSession session(SessionKind::Base);
  session.StartSession(tare.Estimate());

  tare.Clear();
  tare.AddTareSample(50.0, 1.0);

  session.AddMeasurement(100.0, 2.0);

  EXPECT_DOUBLE_EQ(session.Bias(), 5.0);
  EXPECT_DOUBLE_EQ(session.Measurements().front().corrected_g, 95.0);
}

TEST(ManualSessionTest, RejectsInvalidReadings)
{
  ManualSession session(SessionKind::Base);
  session.StartSession(0.0, 0.0);

  EXPECT_THROW(session.AddMeasurement(0.0, 0.0), std::invalid_argument);
  EXPECT_THROW(session.AddMeasurement(-3.0, 0.0), std::invalid_argument);
  EXPECT_THROW(session.AddMeasurement(std::nan(""), 0.0), std::invalid_argument);
  EXPECT_EQ(session.Count(), 0u);
}

TEST(ManualSessionTest, StopReturnsMeasurements)
{
  ManualSession session(SessionKind::Base);
  session.StartSession(1.0, 0.5);
  session.AddMeasurement(10.0, 0.0);
  session.AddMeasurement(11.0, 1.0);

  const std::vector<ManualMeasurement> measurements = session.StopSession();

  EXPECT_EQ(measurements.size(), 2u);
  EXPECT_FALSE(session.IsActive());
  EXPECT_THROW(session.AddMeasurement(12.0, 2.0), std::invalid_argument);
}

TEST(ManualSessionTest, RemoveAndClear)
{
  ManualSession session(SessionKind::Base);
  session.StartSession(0.0, 0.0);
  session.AddMeasurement(10.0, 0.0);
  session.AddMeasurement(20.0, 1.0);

  session.RemoveMeasurement(5);
  EXPECT_EQ(session.Count(), 2u);

  session.RemoveMeasurement(0);
  ASSERT_EQ(session.Count(), 1u);
  EXPECT_DOUBLE_EQ(session.Measurements().front().scale_reading_g, 20.0);

  session.Clear();
  EXPECT_EQ(session.Count(), 0u);
  EXPECT_TRUE(session.IsActive());
}

TEST(ManualSessionTest, RestartDiscardsMeasurements)
{
  ManualSession session(SessionKind::Base);
  session.StartSession(0.0, 0.0);
  session.AddMeasurement(10.0, 0.0);

  session.StartSession(2.0, 0.0);

  EXPECT_EQ(session.Count(), 0u);
  EXPECT_DOUBLE_EQ(session.Bias(), 2.0);
}

TEST(ManualSessionTest, StoresQualitySnapshot)
{
  ManualSession session(SessionKind::Base);
  session.StartSession(0.0, 0.0);

  QualitySnapshot quality;
  quality.quality_score = 0.8;
  quality.az_rms_mps2 = 0.1;
  session.AddMeasurement(10.0, 0.0, quality);

  const ManualMeasurement& m = session.Measurements().front();
  ASSERT_TRUE(m.quality.has_value());
  EXPECT_DOUBLE_EQ(*m.quality->quality_score, 0.8);
  EXPECT_FALSE(m.quality->roll_rms_deg.has_value());
}
