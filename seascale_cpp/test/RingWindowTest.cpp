/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "imu/RingWindow.h"

#include <cmath>
#include <vector>

#include <gtest/gtest.h>

using namespace SEASCALE::IMU;

TEST(RingWindowTest, EmptyWindow)
{
  RingWindow window(4);

  EXPECT_TRUE(window.Empty());
  EXPECT_EQ(window.Capacity(), 4u);
  EXPECT_EQ(window.RmsInWindow(1000.0), 0.0);
  EXPECT_EQ(window.Rms(), 0.0);
  EXPECT_EQ(window.Latest(), 0.0);
  EXPECT_TRUE(window.Samples().empty());
}

TEST(RingWindowTest, ZeroCapacityHoldsOneEntry)
{
  RingWindow window(0);
  window.Push(1.0, 0.0);
  window.Push(2.0, 10.0);

  EXPECT_EQ(window.Capacity(), 1u);
  EXPECT_EQ(window.Values(), std::vector<double>{2.0});
}

TEST(RingWindowTest, OverwritesOldestWhenFull)
{
  RingWindow window(3);
  for (int i = 1; i <= 5; ++i)
    window.Push(static_cast<double>(i), 10.0 * i);

  EXPECT_TRUE(window.IsFull());
  EXPECT_EQ(window.Size(), 3u);
  EXPECT_EQ(window.Values(), (std::vector<double>{3.0, 4.0, 5.0}));
  EXPECT_DOUBLE_EQ(window.Latest(), 5.0);

  const std::vector<RingWindow::Entry> samples = window.Samples();
  EXPECT_DOUBLE_EQ(samples.front().stamp_ms, 30.0);
  EXPECT_DOUBLE_EQ(samples.back().stamp_ms, 50.0);
}

TEST(RingWindowTest, WindowMeasuredFromNewestStamp)
{
  RingWindow window(10);
  window.Push(100.0, 0.0);
  window.Push(3.0, 900.0);
  window.Push(-4.0, 1000.0);

  // Cutoff is 1000 - 100 = 900, inclusive
  EXPECT_EQ(window.ValuesInWindow(100.0), (std::vector<double>{3.0, -4.0}));
  EXPECT_NEAR(window.RmsInWindow(100.0), std::sqrt(12.5), 1e-12);
  EXPECT_EQ(window.SamplesInWindow(5000.0).size(), 3u);
}

TEST(RingWindowTest, ClearEmptiesWindow)
{
  RingWindow window(2);
  window.Push(1.0, 0.0);
  window.Clear();

  EXPECT_TRUE(window.Empty());
  EXPECT_EQ(window.Latest(), 0.0);
}
