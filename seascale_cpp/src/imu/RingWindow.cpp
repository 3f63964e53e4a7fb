/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "imu/RingWindow.h"

#include "math/Statistics.h"

#include <algorithm>

namespace SEASCALE::IMU
{
RingWindow::RingWindow(std::size_t capacity) : m_buffer(std::max<std::size_t>(capacity, 1))
{
}

void RingWindow::Push(double value, double stamp_ms)
{
  m_buffer[m_writeIndex] = Entry{value, stamp_ms};
  m_writeIndex = (m_writeIndex + 1) % m_buffer.size();

  if (m_count < m_buffer.size())
    ++m_count;
}

void RingWindow::Clear()
{
  m_writeIndex = 0;
  m_count = 0;
}

std::vector<RingWindow::Entry> RingWindow::Samples() const
{
  std::vector<Entry> samples;
  samples.reserve(m_count);

  // Oldest entry sits at the write index once the buffer has wrapped
  const std::size_t start = IsFull() ? m_writeIndex : 0;
  for (std::size_t i = 0; i < m_count; ++i)
    samples.push_back(m_buffer[(start + i) % m_buffer.size()]);

  return samples;
}

std::vector<double> RingWindow::Values() const
{
  std::vector<double> values;
  values.reserve(m_count);

  for (const Entry& entry : Samples())
    values.push_back(entry.value);

  return values;
}

std::vector<RingWindow::Entry> RingWindow::SamplesInWindow(double duration_ms) const
{
  std::vector<Entry> samples = Samples();
  if (samples.empty())
    return samples;

  const double cutoff_ms = samples.back().stamp_ms - duration_ms;

  std::vector<Entry> windowed;
  windowed.reserve(samples.size());
  for (const Entry& entry : samples)
  {
    if (entry.stamp_ms >= cutoff_ms)
      windowed.push_back(entry);
  }

  return windowed;
}

std::vector<double> RingWindow::ValuesInWindow(double duration_ms) const
{
  std::vector<double> values;
  for (const Entry& entry : SamplesInWindow(duration_ms))
    values.push_back(entry.value);

  return values;
}

double RingWindow::RmsInWindow(double duration_ms) const
{
  return Math::Statistics::Rms(ValuesInWindow(duration_ms));
}

double RingWindow::Rms() const
{
  return Math::Statistics::Rms(Values());
}

double RingWindow::Latest() const
{
  if (m_count == 0)
    return 0.0;

  const std::size_t newest = (m_writeIndex + m_buffer.size() - 1) % m_buffer.size();
  return m_buffer[newest].value;
}
} // namespace SEASCALE::IMU
