// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __EXPERIMENT_CONFIGURATION_H
#define __EXPERIMENT_CONFIGURATION_H 1

#include <cstdint>
#include <optional>
#include <string>
#include "AbTestException.h"
#include "FrequentistTestConfiguration.h"
#include "MultipleTestingCorrection.h"

namespace abvalidator
{
  enum class TestMethod
  {
    Frequentist,
    Bayesian
  };

  // "frequentist" or "bayesian", case-insensitive.
  TestMethod testMethodFromString(const std::string& name);

  std::string testMethodToString(TestMethod method);

  /**
   * @class BayesianPrior
   * @brief Beta prior handed to the Bayesian collaborator, expressed as
   *        pseudo-observations: priorSuccesses out of priorTrials.
   */
  class BayesianPrior
  {
  public:
    static constexpr uint64_t DefaultPriorSuccesses = 30;
    static constexpr uint64_t DefaultPriorTrials = 100;

    BayesianPrior(uint64_t priorSuccesses = DefaultPriorSuccesses,
		  uint64_t priorTrials = DefaultPriorTrials);

    uint64_t getPriorSuccesses() const
    {
      return mPriorSuccesses;
    }

    uint64_t getPriorTrials() const
    {
      return mPriorTrials;
    }

  private:
    uint64_t mPriorSuccesses;
    uint64_t mPriorTrials;
  };

  /**
   * @class ExperimentConfiguration
   * @brief Everything a run needs besides the data: the test method and the
   *        parameters of that method.
   *
   * The frequentist parameters (alpha, tail) are validated by
   * FrequentistTestConfiguration. The sequential stopping threshold must lie
   * in (0, 1) when sequential testing is enabled. A correction method only
   * applies to frequentist runs; with no correction method the p-values of
   * the pairwise tests are reported as they are.
   */
  class ExperimentConfiguration
  {
  public:
    static constexpr double DefaultStoppingThreshold = 0.05;

    ExperimentConfiguration(TestMethod method,
			    const FrequentistTestConfiguration& frequentistConfig,
			    const std::optional<CorrectionMethod>& correctionMethod,
			    bool sequential = false,
			    double stoppingThreshold = DefaultStoppingThreshold,
			    const BayesianPrior& prior = BayesianPrior());

    // Frequentist run with default alpha and tail and no correction.
    ExperimentConfiguration();

    TestMethod getTestMethod() const
    {
      return mMethod;
    }

    const FrequentistTestConfiguration& getFrequentistConfiguration() const
    {
      return mFrequentistConfig;
    }

    double getAlpha() const
    {
      return mFrequentistConfig.getAlpha();
    }

    const std::optional<CorrectionMethod>& getCorrectionMethod() const
    {
      return mCorrectionMethod;
    }

    bool isSequential() const
    {
      return mSequential;
    }

    double getStoppingThreshold() const
    {
      return mStoppingThreshold;
    }

    const BayesianPrior& getBayesianPrior() const
    {
      return mPrior;
    }

  private:
    TestMethod mMethod;
    FrequentistTestConfiguration mFrequentistConfig;
    std::optional<CorrectionMethod> mCorrectionMethod;
    bool mSequential;
    double mStoppingThreshold;
    BayesianPrior mPrior;
  };
}

#endif
