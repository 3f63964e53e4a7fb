/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "measurement/RatioAggregator.h"

#include "math/ConfidenceTable.h"

#include <cmath>
#include <string>

namespace SEASCALE::Measurement
{
namespace
{
// Units: unitless
// Meaning: trimmed count below which a session is flagged as weak
constexpr std::size_t kMinSessionCount = 3;
} // namespace

RatioResult RatioAggregator::Compute(const SessionResult& base, const SessionResult& final)
{
  RatioResult result;
  result.base_result = base;
  result.final_result = final;

  const double wb = base.fixed_value_g;
  const double wf = final.fixed_value_g;

  if (!std::isfinite(wb) || wb <= 0.0)
  {
    result.k95 = Math::ConfidenceTable::FallbackK();
    result.notes.emplace_back("Error: W_base must be > 0 (cannot divide by zero)");
    return result;
  }

  result.ratio = (wb - wf) / wb;
  result.percent = 100.0 * result.ratio;

  const double dRatio_dWb = wf / (wb * wb);
  const double dRatio_dWf = -1.0 / wb;

  result.sigma_ratio_1sigma = std::hypot(dRatio_dWb * base.total_uncertainty_1sigma_g,
                                         dRatio_dWf * final.total_uncertainty_1sigma_g);

  result.n_eff = Math::ConfidenceTable::EffectiveN(base.n_trim, final.n_trim);
  result.k95 = Math::ConfidenceTable::KFromN(result.n_eff);

  result.error_band_95_ratio = result.k95 * result.sigma_ratio_1sigma;
  result.error_band_95_percent = 100.0 * result.error_band_95_ratio;

  if (std::abs(result.percent) > 0.0)
  {
    result.relative_error_95_percent =
        result.error_band_95_percent / std::abs(result.percent) * 100.0;
  }

  if (base.n_trim < kMinSessionCount)
    result.notes.push_back("Low base sample count (" + std::to_string(base.n_trim) + ")");
  if (final.n_trim < kMinSessionCount)
    result.notes.push_back("Low final sample count (" + std::to_string(final.n_trim) + ")");
  if (result.n_eff < kMinSessionCount)
  {
    result.notes.push_back("Low effective sample count (" + std::to_string(result.n_eff) +
                           ") for k-factor");
  }
  if (base.tare_uncertainty_95_g == 0.0 && final.tare_uncertainty_95_g == 0.0)
    result.notes.push_back("No tare uncertainty specified for either session");

  return result;
}
} // namespace SEASCALE::Measurement
