// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "FrequentistTestConfiguration.h"
#include <cmath>
#include <boost/algorithm/string.hpp>

namespace abvalidator
{
  TailType tailTypeFromString(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (key == "one_tailed")
      return TailType::OneTailed;
    else if (key == "two_tailed")
      return TailType::TwoTailed;
    else
      throw InvalidTestConfigurationException("Unknown alternative hypothesis '" + name +
					      "': expected one_tailed or two_tailed");
  }

  std::string tailTypeToString(TailType tail)
  {
    return tail == TailType::OneTailed ? "one_tailed" : "two_tailed";
  }

  FrequentistTestConfiguration::FrequentistTestConfiguration(double alpha, TailType tail)
    : mAlpha(validateAlpha(alpha)),
      mTail(tail)
  {}

  FrequentistTestConfiguration::FrequentistTestConfiguration(double alpha,
							     const std::string& hypothesis)
    : mAlpha(validateAlpha(alpha)),
      mTail(tailTypeFromString(hypothesis))
  {}

  double FrequentistTestConfiguration::validateAlpha(double alpha)
  {
    if (std::isnan(alpha) || alpha <= 0.0 || alpha >= 1.0)
      throw InvalidTestConfigurationException("Significance level alpha must be in (0, 1), got " +
					      std::to_string(alpha));
    return alpha;
  }
}
