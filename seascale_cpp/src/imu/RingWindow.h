/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <cstddef>
#include <vector>

namespace SEASCALE::IMU
{
/*!
 * \brief Fixed-capacity circular buffer of timestamped scalars
 *
 * Once full, each push overwrites the oldest entry. Time windows are measured
 * back from the newest stored timestamp, not from wall-clock time, so a
 * window that stops receiving data keeps reporting the same RMS.
 */
class RingWindow
{
public:
  struct Entry
  {
    double value{0.0};

    // Units: milliseconds
    double stamp_ms{0.0};
  };

  /*!
   * \brief Create an empty window
   *
   * \param capacity Number of entries held, a capacity of 0 is raised to 1
   */
  explicit RingWindow(std::size_t capacity);

  void Push(double value, double stamp_ms);
  void Clear();

  /*!
   * \brief All stored entries, oldest first
   */
  std::vector<Entry> Samples() const;
  std::vector<double> Values() const;

  /*!
   * \brief Entries with stamp >= newest stamp - duration, oldest first
   */
  std::vector<Entry> SamplesInWindow(double duration_ms) const;
  std::vector<double> ValuesInWindow(double duration_ms) const;

  /*!
   * \brief RMS of the values in the trailing window, 0 when empty
   */
  double RmsInWindow(double duration_ms) const;
  double Rms() const;

  /*!
   * \brief Most recent value, 0 when empty
   */
  double Latest() const;

  std::size_t Size() const { return m_count; }
  std::size_t Capacity() const { return m_buffer.size(); }
  bool IsFull() const { return m_count == m_buffer.size(); }
  bool Empty() const { return m_count == 0; }

private:
  std::vector<Entry> m_buffer;

  // Next slot to write
  std::size_t m_writeIndex{0};

  // Number of valid entries, capped at capacity
  std::size_t m_count{0};
};
} // namespace SEASCALE::IMU
