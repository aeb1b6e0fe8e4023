// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PowerCurve.h"
#include <cmath>
#include <limits>
#include "NormalDistribution.h"

namespace abvalidator
{
  namespace
  {
    // [0, 0.2) in steps of 0.005
    constexpr std::size_t kDefaultGridPoints = 40;
    constexpr double kDefaultGridStep = 0.005;
  }

  std::vector<double> PowerCurve::defaultEffectGrid()
  {
    std::vector<double> grid;
    grid.reserve(kDefaultGridPoints);
    for (std::size_t i = 0; i < kDefaultGridPoints; ++i)
      grid.push_back(static_cast<double>(i) * kDefaultGridStep);

    return grid;
  }

  PowerCurve::PowerCurve(double propNull,
			 uint64_t trialsNull,
			 uint64_t trialsAlt,
			 const FrequentistTestConfiguration& config,
			 double observedEffect,
			 const std::vector<double>& effectGrid)
    : mPropNull(propNull),
      mStandardError(0.0),
      mCriticalValue(0.0),
      mObservedEffect(observedEffect),
      mEffectGrid(effectGrid)
  {
    if (trialsNull == 0 || trialsAlt == 0)
      throw ZeroTrialsException("PowerCurve: both arms need at least one trial");

    if (std::isnan(propNull) || propNull < 0.0 || propNull > 1.0)
      throw InvalidObservationException("PowerCurve: control proportion must be in [0, 1], got " +
					std::to_string(propNull));

    mStandardError = std::sqrt(propNull * (1.0 - propNull) *
			       (1.0 / static_cast<double>(trialsNull) +
				1.0 / static_cast<double>(trialsAlt)));

    const double upperTail = config.isTwoTailed() ? config.getAlpha() / 2.0 : config.getAlpha();
    mCriticalValue = NormalDistribution::criticalValue(upperTail);
  }

  double PowerCurve::powerAt(double effectSize) const
  {
    if (isDegenerate())
      return std::numeric_limits<double>::quiet_NaN();

    // 1 - Phi(z_alpha - e/se), evaluated as an upper tail
    return NormalDistribution::standardNormalSurvival(mCriticalValue - effectSize / mStandardError);
  }

  PowerPoint PowerCurve::pointAt(std::size_t index) const
  {
    const double effect = mEffectGrid.at(index);
    return PowerPoint(effect, powerAt(effect));
  }
}
