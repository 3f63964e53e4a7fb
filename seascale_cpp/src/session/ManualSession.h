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
#include <optional>
#include <vector>

namespace SEASCALE::Session
{
/*!
 * \brief Discrete, operator-triggered scale readings with a locked tare
 *
 * Bias and tare uncertainty are frozen when the session starts. Later changes
 * to the tare estimate do not affect measurements already taken or those
 * taken before the next StartSession().
 */
class ManualSession
{
public:
  explicit ManualSession(SessionKind kind);

  /*!
   * \brief Start a session, discarding previous measurements
   *
   * \param bias_g Bias subtracted from each reading
   * \param tareUncertainty95_g 95% tare uncertainty carried by each reading
   */
  void StartSession(double bias_g, double tareUncertainty95_g);
  void StartSession(const TareEstimate& tare);

  /*!
   * \brief Record one reading
   *
   * \throws std::invalid_argument if the session is not active, or if the
   *         reading is NaN, infinite or not positive
   */
  void AddMeasurement(double reading_g,
                      double stamp_ms,
                      const std::optional<QualitySnapshot>& quality = std::nullopt);

  /*!
   * \brief Remove the measurement at index, no-op when out of range
   */
  void RemoveMeasurement(std::size_t index);

  /*!
   * \brief Deactivate the session
   *
   * \return The recorded measurements
   */
  std::vector<ManualMeasurement> StopSession();

  /*!
   * \brief Drop measurements, the session stays active
   */
  void Clear();

  const std::vector<ManualMeasurement>& Measurements() const { return m_measurements; }
  std::size_t Count() const { return m_measurements.size(); }
  bool IsActive() const { return m_active; }
  bool CanCalculate() const { return !m_measurements.empty(); }
  SessionKind Kind() const { return m_kind; }

  // Units: grams
  double Bias() const { return m_bias; }

  // Units: grams
  double TareUncertainty95() const { return m_tareUncertainty95; }

private:
  // Construction parameters
  const SessionKind m_kind;

  // State
  bool m_active{false};
  double m_bias{0.0};
  double m_tareUncertainty95{0.0};
  std::vector<ManualMeasurement> m_measurements;
};
} // namespace SEASCALE::Session
