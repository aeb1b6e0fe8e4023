// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __EXPERIMENT_REPORT_H
#define __EXPERIMENT_REPORT_H 1

#include <optional>
#include <string>
#include <vector>
#include "Aggregator.h"
#include "ExperimentConfiguration.h"
#include "MultipleTestingCorrection.h"
#include "PairwiseTest.h"

namespace abvalidator
{
  /**
   * @class ExperimentReport
   * @brief Result of one experiment run.
   *
   * Holds the per-group aggregates, one comparison per treatment group in
   * GroupBucketMap order and, when a correction was applied, one correction
   * result per non-degenerate frequentist comparison in the same order.
   */
  class ExperimentReport
  {
  public:
    ExperimentReport(const ExperimentConfiguration& config,
		     const ExperimentAggregates& aggregates,
		     const std::vector<PairwiseComparison>& comparisons,
		     const std::vector<CorrectionResult>& corrections)
      : mConfig(config),
	mAggregates(aggregates),
	mComparisons(comparisons),
	mCorrections(corrections)
    {}

    const ExperimentConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    const ExperimentAggregates& getAggregates() const
    {
      return mAggregates;
    }

    const std::vector<PairwiseComparison>& getComparisons() const
    {
      return mComparisons;
    }

    const std::vector<CorrectionResult>& getCorrections() const
    {
      return mCorrections;
    }

    bool hasCorrections() const
    {
      return !mCorrections.empty();
    }

    // The correction entry of a treatment group; empty when the group was
    // left out of the correction family or no correction was applied.
    std::optional<CorrectionResult> findCorrection(const std::string& groupName) const
    {
      for (const auto& correction : mCorrections)
	if (correction.getGroupName() == groupName)
	  return correction;

      return std::nullopt;
    }

  private:
    ExperimentConfiguration mConfig;
    ExperimentAggregates mAggregates;
    std::vector<PairwiseComparison> mComparisons;
    std::vector<CorrectionResult> mCorrections;
  };
}

#endif
