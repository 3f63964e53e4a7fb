/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

namespace SEASCALE::Session
{
/*!
 * \brief Pull-style access to the most recent scale value
 */
class IScaleReadingSource
{
public:
  virtual ~IScaleReadingSource() = default;

  /*!
   * \brief Latest scale value, must not block
   *
   * Units: grams
   */
  virtual double GetCurrentScaleReading() = 0;
};
} // namespace SEASCALE::Session
