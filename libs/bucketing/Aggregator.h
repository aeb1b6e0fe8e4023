// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __AGGREGATOR_H
#define __AGGREGATOR_H 1

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "AbTestException.h"
#include "GroupAssigner.h"
#include "GroupBucketMap.h"
#include "SubjectRecord.h"
#include "IParallelExecutor.h"

namespace abvalidator
{
  /**
   * @class GroupAggregate
   * @brief Success and trial counts folded for one group.
   */
  class GroupAggregate
  {
  public:
    explicit GroupAggregate(const std::string& groupName)
      : mGroupName(groupName),
	mSuccessCount(0),
	mTrialCount(0)
    {}

    GroupAggregate(const std::string& groupName, uint64_t successCount, uint64_t trialCount)
      : mGroupName(groupName),
	mSuccessCount(successCount),
	mTrialCount(trialCount)
    {
      if (successCount > trialCount)
	throw InvalidObservationException("GroupAggregate '" + groupName + "': " +
					  std::to_string(successCount) + " successes exceed " +
					  std::to_string(trialCount) + " trials");
    }

    void addRecord(const SubjectRecord& record)
    {
      ++mTrialCount;
      mSuccessCount += record.getOutcome();
    }

    void merge(const GroupAggregate& partial)
    {
      if (partial.mGroupName != mGroupName)
	throw AbTestException("GroupAggregate: cannot merge '" + partial.mGroupName +
			      "' into '" + mGroupName + "'");
      mSuccessCount += partial.mSuccessCount;
      mTrialCount += partial.mTrialCount;
    }

    const std::string& getGroupName() const
    {
      return mGroupName;
    }

    uint64_t getSuccessCount() const
    {
      return mSuccessCount;
    }

    uint64_t getTrialCount() const
    {
      return mTrialCount;
    }

    double getConversionRate() const
    {
      return mTrialCount == 0 ? 0.0 :
	static_cast<double>(mSuccessCount) / static_cast<double>(mTrialCount);
    }

  private:
    std::string mGroupName;
    uint64_t mSuccessCount;
    uint64_t mTrialCount;
  };

  /**
   * @class ExperimentAggregates
   * @brief The per-group aggregates of one experiment run, in GroupBucketMap order.
   */
  class ExperimentAggregates
  {
  public:
    using const_iterator = std::vector<GroupAggregate>::const_iterator;

    explicit ExperimentAggregates(const GroupBucketMap& groupBuckets);

    const GroupAggregate& getGroup(const std::string& groupName) const;

    GroupAggregate& getGroup(const std::string& groupName);

    const GroupAggregate& getControl() const
    {
      return mAggregates[mControlIndex];
    }

    // Every group except control, in map order.
    std::vector<GroupAggregate> getTreatments() const;

    void merge(const ExperimentAggregates& partial);

    uint64_t getTotalSuccesses() const;

    uint64_t getTotalTrials() const;

    std::size_t getNumGroups() const
    {
      return mAggregates.size();
    }

    const_iterator begin() const
    {
      return mAggregates.begin();
    }

    const_iterator end() const
    {
      return mAggregates.end();
    }

  private:
    std::vector<GroupAggregate> mAggregates;
    std::map<std::string, std::size_t> mIndexByName;
    std::size_t mControlIndex;
  };

  /**
   * @class Aggregator
   * @brief Folds subject records into per-group success and trial counts.
   *
   * Aggregation is commutative and associative, so the record order does not
   * matter and the parallel overload yields exactly the serial result: each
   * chunk of records is folded into a private ExperimentAggregates, and the
   * partials are merged into the final result under a mutex.
   *
   * An UnassignedBucketException from any record aborts the whole aggregation.
   */
  class Aggregator
  {
  public:
    static ExperimentAggregates aggregate(const std::vector<SubjectRecord>& records,
					  const GroupBucketMap& groupBuckets);

    static ExperimentAggregates aggregate(const std::vector<SubjectRecord>& records,
					  const GroupBucketMap& groupBuckets,
					  concurrency::IParallelExecutor& executor,
					  std::size_t maxChunks = 0);
  };
}

#endif
