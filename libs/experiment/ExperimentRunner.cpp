// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExperimentRunner.h"
#include <cmath>
#include <iomanip>
#include <optional>
#include <string>
#include <utility>
#include "Aggregator.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace abvalidator
{
  ExperimentRunner::ExperimentRunner(const ExperimentConfiguration& config,
				     concurrency::IParallelExecutor* executor,
				     IBayesianCollaborator* collaborator)
    : mConfig(config),
      mOwnedExecutor(),
      mExecutor(executor),
      mPairwiseTest(createPairwiseTest(config, collaborator))
  {
    if (mExecutor == nullptr)
      {
	mOwnedExecutor = std::make_unique<concurrency::SingleThreadExecutor>();
	mExecutor = mOwnedExecutor.get();
      }
  }

  ExperimentRunner::~ExperimentRunner() = default;

  ExperimentReport ExperimentRunner::run(const std::vector<SubjectRecord>& records,
					 const GroupBucketMap& groupBuckets,
					 std::ostream* os) const
  {
    if (os)
      (*os) << "[Experiment] Aggregating " << records.size() << " subject records into "
	    << groupBuckets.getNumGroups() << " groups" << std::endl;

    ExperimentAggregates aggregates = Aggregator::aggregate(records, groupBuckets, *mExecutor);

    if (os)
      {
	for (const auto& aggregate : aggregates)
	  (*os) << "   " << aggregate.getGroupName() << ": "
		<< aggregate.getSuccessCount() << " / " << aggregate.getTrialCount() << std::endl;
      }

    std::vector<PairwiseComparison> comparisons = runPairwiseTests(aggregates, os);
    std::vector<CorrectionResult> corrections = correct(comparisons, os);

    return ExperimentReport(mConfig, aggregates, comparisons, corrections);
  }

  std::vector<PairwiseComparison>
  ExperimentRunner::runPairwiseTests(const ExperimentAggregates& aggregates,
				     std::ostream* os) const
  {
    const GroupAggregate& control = aggregates.getControl();
    const std::vector<GroupAggregate> treatments = aggregates.getTreatments();

    if (os)
      (*os) << "[Experiment] Running " << testMethodToString(mPairwiseTest->getTestMethod())
	    << " tests for " << treatments.size() << " treatment groups"
	    << (mConfig.isSequential() ? " (sequential)" : "") << std::endl;

    // One slot per treatment; each task writes only its own slot.
    std::vector<std::optional<PairwiseComparison>> slots(treatments.size());
    concurrency::parallel_for(treatments.size(), *mExecutor,
			      [&](std::size_t i) {
				slots[i] = mPairwiseTest->evaluate(control, treatments[i]);
			      });

    std::vector<PairwiseComparison> comparisons;
    comparisons.reserve(slots.size());
    for (auto& slot : slots)
      comparisons.push_back(std::move(*slot));

    if (os)
      {
	for (const auto& comparison : comparisons)
	  {
	    const FrequentistResult* result = std::get_if<FrequentistResult>(&comparison);
	    if (result == nullptr)
	      {
		(*os) << "   " << getComparisonGroupName(comparison) << ": bayesian summary received"
		      << std::endl;
		continue;
	      }

	    (*os) << "   " << result->getGroupName() << ": z = " << std::fixed << std::setprecision(4)
		  << result->getStatistic() << ", p = " << result->getPValue();
	    if (result->isDegenerate())
	      (*os) << " (degenerate: zero standard error)";
	    if (result->isEarlyStopped())
	      (*os) << " (stopped early after " << result->getStoppingIndex() << " of "
		    << result->getObservations() << " observations)";
	    (*os) << std::endl;
	  }
      }

    return comparisons;
  }

  std::vector<CorrectionResult>
  ExperimentRunner::correct(const std::vector<PairwiseComparison>& comparisons,
			    std::ostream* os) const
  {
    if (mConfig.getTestMethod() != TestMethod::Frequentist || !mConfig.getCorrectionMethod())
      return std::vector<CorrectionResult>();

    std::vector<std::pair<std::string, double>> family;
    for (const auto& comparison : comparisons)
      {
	const FrequentistResult& result = std::get<FrequentistResult>(comparison);
	if (result.isDegenerate())
	  {
	    if (os)
	      (*os) << "   [Correction] Excluding degenerate comparison "
		    << result.getGroupName() << std::endl;
	    continue;
	  }
	family.emplace_back(result.getGroupName(), result.getPValue());
      }

    const CorrectionMethod method = *mConfig.getCorrectionMethod();
    if (os)
      (*os) << "[Experiment] Applying " << correctionMethodToString(method)
	    << " correction to " << family.size() << " p-values" << std::endl;

    return MultipleTestingCorrection::correct(family, method);
  }
}
