// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExperimentConfiguration.h"
#include <cmath>
#include <boost/algorithm/string.hpp>

namespace abvalidator
{
  TestMethod testMethodFromString(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (key == "frequentist")
      return TestMethod::Frequentist;
    else if (key == "bayesian")
      return TestMethod::Bayesian;
    else
      throw InvalidTestConfigurationException("Invalid test method '" + name +
					      "': expected frequentist or bayesian");
  }

  std::string testMethodToString(TestMethod method)
  {
    return method == TestMethod::Bayesian ? "bayesian" : "frequentist";
  }

  BayesianPrior::BayesianPrior(uint64_t priorSuccesses, uint64_t priorTrials)
    : mPriorSuccesses(priorSuccesses),
      mPriorTrials(priorTrials)
  {
    if (priorTrials == 0)
      throw InvalidTestConfigurationException("Bayesian prior needs at least one trial");

    if (priorSuccesses > priorTrials)
      throw InvalidTestConfigurationException("Bayesian prior successes (" +
					      std::to_string(priorSuccesses) +
					      ") exceed prior trials (" +
					      std::to_string(priorTrials) + ")");
  }

  ExperimentConfiguration::ExperimentConfiguration(TestMethod method,
						   const FrequentistTestConfiguration& frequentistConfig,
						   const std::optional<CorrectionMethod>& correctionMethod,
						   bool sequential,
						   double stoppingThreshold,
						   const BayesianPrior& prior)
    : mMethod(method),
      mFrequentistConfig(frequentistConfig),
      mCorrectionMethod(correctionMethod),
      mSequential(sequential),
      mStoppingThreshold(stoppingThreshold),
      mPrior(prior)
  {
    if (sequential &&
	(std::isnan(stoppingThreshold) || stoppingThreshold <= 0.0 || stoppingThreshold >= 1.0))
      throw InvalidTestConfigurationException("Stopping threshold must be in (0, 1), got " +
					      std::to_string(stoppingThreshold));
  }

  ExperimentConfiguration::ExperimentConfiguration()
    : ExperimentConfiguration(TestMethod::Frequentist,
			      FrequentistTestConfiguration(),
			      std::nullopt)
  {}
}
