// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __FREQUENTIST_TEST_CONFIGURATION_H
#define __FREQUENTIST_TEST_CONFIGURATION_H 1

#include <string>
#include "AbTestException.h"

namespace abvalidator
{
  // Direction of the alternative hypothesis.
  enum class TailType
  {
    OneTailed,
    TwoTailed
  };

  // Accepts "one_tailed" and "two_tailed" in any letter case.
  TailType tailTypeFromString(const std::string& name);

  std::string tailTypeToString(TailType tail);

  /**
   * @class FrequentistTestConfiguration
   * @brief Significance level and hypothesis direction of a frequentist test.
   *
   * Validated on construction: alpha must lie strictly inside (0, 1).
   */
  class FrequentistTestConfiguration
  {
  public:
    static constexpr double DefaultAlpha = 0.05;

    explicit FrequentistTestConfiguration(double alpha = DefaultAlpha,
					  TailType tail = TailType::TwoTailed);

    FrequentistTestConfiguration(double alpha, const std::string& hypothesis);

    double getAlpha() const
    {
      return mAlpha;
    }

    TailType getTailType() const
    {
      return mTail;
    }

    bool isTwoTailed() const
    {
      return mTail == TailType::TwoTailed;
    }

  private:
    static double validateAlpha(double alpha);

  private:
    double mAlpha;
    TailType mTail;
  };
}

#endif
