// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "Aggregator.h"
#include <boost/thread/mutex.hpp>
#include "ParallelFor.h"

namespace abvalidator
{
  ExperimentAggregates::ExperimentAggregates(const GroupBucketMap& groupBuckets)
    : mAggregates(),
      mIndexByName(),
      mControlIndex(groupBuckets.getControlIndex())
  {
    mAggregates.reserve(groupBuckets.getNumGroups());
    for (const auto& range : groupBuckets)
      {
	mIndexByName[range.getGroupName()] = mAggregates.size();
	mAggregates.emplace_back(range.getGroupName());
      }
  }

  const GroupAggregate& ExperimentAggregates::getGroup(const std::string& groupName) const
  {
    auto it = mIndexByName.find(groupName);
    if (it == mIndexByName.end())
      throw AbTestException("ExperimentAggregates: unknown group '" + groupName + "'");

    return mAggregates[it->second];
  }

  GroupAggregate& ExperimentAggregates::getGroup(const std::string& groupName)
  {
    auto it = mIndexByName.find(groupName);
    if (it == mIndexByName.end())
      throw AbTestException("ExperimentAggregates: unknown group '" + groupName + "'");

    return mAggregates[it->second];
  }

  std::vector<GroupAggregate> ExperimentAggregates::getTreatments() const
  {
    std::vector<GroupAggregate> treatments;
    for (std::size_t i = 0; i < mAggregates.size(); ++i)
      if (i != mControlIndex)
	treatments.push_back(mAggregates[i]);

    return treatments;
  }

  void ExperimentAggregates::merge(const ExperimentAggregates& partial)
  {
    for (const auto& aggregate : partial)
      getGroup(aggregate.getGroupName()).merge(aggregate);
  }

  uint64_t ExperimentAggregates::getTotalSuccesses() const
  {
    uint64_t total = 0;
    for (const auto& aggregate : mAggregates)
      total += aggregate.getSuccessCount();
    return total;
  }

  uint64_t ExperimentAggregates::getTotalTrials() const
  {
    uint64_t total = 0;
    for (const auto& aggregate : mAggregates)
      total += aggregate.getTrialCount();
    return total;
  }

  ExperimentAggregates Aggregator::aggregate(const std::vector<SubjectRecord>& records,
					     const GroupBucketMap& groupBuckets)
  {
    GroupAssigner assigner(groupBuckets);
    ExperimentAggregates result(groupBuckets);

    for (const auto& record : records)
      result.getGroup(assigner.assign(record.getSubjectId())).addRecord(record);

    return result;
  }

  ExperimentAggregates Aggregator::aggregate(const std::vector<SubjectRecord>& records,
					     const GroupBucketMap& groupBuckets,
					     concurrency::IParallelExecutor& executor,
					     std::size_t maxChunks)
  {
    GroupAssigner assigner(groupBuckets);
    ExperimentAggregates result(groupBuckets);
    boost::mutex resultMutex;

    concurrency::parallel_for_chunks(records.size(), executor,
				     [&](std::size_t start, std::size_t end) {
				       ExperimentAggregates partial(groupBuckets);
				       for (std::size_t i = start; i < end; ++i)
					 partial.getGroup(assigner.assign(records[i].getSubjectId()))
					   .addRecord(records[i]);

				       boost::mutex::scoped_lock lock(resultMutex);
				       result.merge(partial);
				     },
				     maxChunks);

    return result;
  }
}
