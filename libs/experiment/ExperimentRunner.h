// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __EXPERIMENT_RUNNER_H
#define __EXPERIMENT_RUNNER_H 1

#include <memory>
#include <ostream>
#include <vector>
#include "ExperimentConfiguration.h"
#include "ExperimentReport.h"
#include "GroupBucketMap.h"
#include "IBayesianCollaborator.h"
#include "IParallelExecutor.h"
#include "SubjectRecord.h"

namespace abvalidator
{
  /**
   * @class ExperimentRunner
   * @brief Runs the full pipeline over one set of subject records:
   *
   *   1. aggregate records into per-group counts (chunked across the executor),
   *   2. compare every treatment group against control (one task per group),
   *   3. correct the frequentist p-values for multiple comparisons.
   *
   * Each stage starts only after the previous one has completed. Degenerate
   * comparisons (NaN p-value) stay in the report but are left out of the
   * correction family.
   *
   * The executor and the collaborator must outlive the runner. When no
   * executor is supplied the runner works on the calling thread.
   */
  class ExperimentRunner
  {
  public:
    ExperimentRunner(const ExperimentConfiguration& config,
		     concurrency::IParallelExecutor* executor = nullptr,
		     IBayesianCollaborator* collaborator = nullptr);

    ~ExperimentRunner();

    ExperimentReport run(const std::vector<SubjectRecord>& records,
			 const GroupBucketMap& groupBuckets,
			 std::ostream* os = nullptr) const;

    const ExperimentConfiguration& getConfiguration() const
    {
      return mConfig;
    }

  private:
    std::vector<PairwiseComparison> runPairwiseTests(const ExperimentAggregates& aggregates,
						     std::ostream* os) const;

    std::vector<CorrectionResult> correct(const std::vector<PairwiseComparison>& comparisons,
					  std::ostream* os) const;

  private:
    ExperimentConfiguration mConfig;
    std::unique_ptr<concurrency::IParallelExecutor> mOwnedExecutor;
    concurrency::IParallelExecutor* mExecutor;
    std::unique_ptr<IPairwiseTest> mPairwiseTest;
  };
}

#endif
