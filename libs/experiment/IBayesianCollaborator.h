// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __IBAYESIAN_COLLABORATOR_H
#define __IBAYESIAN_COLLABORATOR_H 1

#include <cstdint>
#include <string>
#include "Aggregator.h"
#include "ExperimentConfiguration.h"

namespace abvalidator
{
  /**
   * @class BayesianUpliftSummary
   * @brief What a Bayesian posterior sampler reports for one treatment group.
   *
   * The counts are those the sampler was given. The payload is the
   * sampler's own summary (posterior statistics, uplift distribution and so
   * on) in whatever textual form it chooses; the experiment core passes it
   * through to the report without interpreting it.
   */
  class BayesianUpliftSummary
  {
  public:
    BayesianUpliftSummary(const std::string& groupName,
			  uint64_t controlSuccesses,
			  uint64_t controlTrials,
			  uint64_t treatmentSuccesses,
			  uint64_t treatmentTrials,
			  const std::string& payload)
      : mGroupName(groupName),
	mControlSuccesses(controlSuccesses),
	mControlTrials(controlTrials),
	mTreatmentSuccesses(treatmentSuccesses),
	mTreatmentTrials(treatmentTrials),
	mPayload(payload)
    {}

    const std::string& getGroupName() const
    {
      return mGroupName;
    }

    uint64_t getControlSuccesses() const
    {
      return mControlSuccesses;
    }

    uint64_t getControlTrials() const
    {
      return mControlTrials;
    }

    uint64_t getTreatmentSuccesses() const
    {
      return mTreatmentSuccesses;
    }

    uint64_t getTreatmentTrials() const
    {
      return mTreatmentTrials;
    }

    const std::string& getPayload() const
    {
      return mPayload;
    }

  private:
    std::string mGroupName;
    uint64_t mControlSuccesses;
    uint64_t mControlTrials;
    uint64_t mTreatmentSuccesses;
    uint64_t mTreatmentTrials;
    std::string mPayload;
  };

  /**
   * @class IBayesianCollaborator
   * @brief Adapter interface for an external Bayesian posterior sampler.
   *
   * Implementations may be called concurrently for different treatment
   * groups of the same run.
   */
  class IBayesianCollaborator
  {
  public:
    virtual ~IBayesianCollaborator() = default;

    virtual BayesianUpliftSummary evaluate(const GroupAggregate& control,
					   const GroupAggregate& treatment,
					   const BayesianPrior& prior) = 0;
  };
}

#endif
