// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "GroupBucketMap.h"
#include <algorithm>
#include <set>

namespace abvalidator
{
  static std::string describeRange(const GroupBucketRange& range)
  {
    return range.getGroupName() + ":[" + std::to_string(range.getStart()) + "," +
      std::to_string(range.getEnd()) + ")";
  }

  GroupBucketMap::GroupBucketMap(const std::vector<GroupBucketRange>& ranges,
				 uint32_t bucketCount)
    : mRanges(ranges),
      mBucketCount(bucketCount),
      mControlIndex(0)
  {
    validate();
  }

  void GroupBucketMap::validate()
  {
    if (mBucketCount == 0)
      throw InvalidGroupBucketMapException("GroupBucketMap: bucket count must be positive");

    if (mRanges.empty())
      throw InvalidGroupBucketMapException("GroupBucketMap: no groups defined");

    std::set<std::string> names;
    std::size_t numControls = 0;

    for (std::size_t i = 0; i < mRanges.size(); ++i)
      {
	const GroupBucketRange& range = mRanges[i];

	if (range.getGroupName().empty())
	  throw InvalidGroupBucketMapException("GroupBucketMap: group name must not be empty");

	if (!names.insert(range.getGroupName()).second)
	  throw InvalidGroupBucketMapException("GroupBucketMap: duplicate group '" +
					       range.getGroupName() + "'");

	if (range.getStart() >= range.getEnd())
	  throw InvalidGroupBucketMapException("GroupBucketMap: empty range " + describeRange(range));

	if (range.getEnd() > mBucketCount)
	  throw InvalidGroupBucketMapException("GroupBucketMap: range " + describeRange(range) +
					       " exceeds bucket count " + std::to_string(mBucketCount));

	for (std::size_t j = 0; j < i; ++j)
	  {
	    if (mRanges[j].overlaps(range))
	      throw InvalidGroupBucketMapException("GroupBucketMap: range " + describeRange(range) +
						   " overlaps " + describeRange(mRanges[j]));
	  }

	if (range.isControl())
	  {
	    mControlIndex = i;
	    ++numControls;
	  }
      }

    if (numControls != 1)
      throw InvalidGroupBucketMapException("GroupBucketMap: exactly one group must be named '" +
					   controlGroupName() + "'");
  }

  std::optional<std::reference_wrapper<const GroupBucketRange>>
  GroupBucketMap::findRange(uint32_t bucket) const
  {
    auto it = std::find_if(mRanges.begin(), mRanges.end(),
			   [bucket](const GroupBucketRange& r) { return r.contains(bucket); });

    if (it == mRanges.end())
      return std::nullopt;

    return std::cref(*it);
  }

  bool GroupBucketMap::hasGroup(const std::string& groupName) const
  {
    return std::any_of(mRanges.begin(), mRanges.end(),
		       [&groupName](const GroupBucketRange& r) { return r.getGroupName() == groupName; });
  }

  std::vector<std::string> GroupBucketMap::getGroupNames() const
  {
    std::vector<std::string> names;
    names.reserve(mRanges.size());
    for (const auto& range : mRanges)
      names.push_back(range.getGroupName());
    return names;
  }

  std::vector<uint32_t> GroupBucketMap::uncoveredBuckets() const
  {
    std::vector<bool> covered(mBucketCount, false);
    for (const auto& range : mRanges)
      std::fill(covered.begin() + range.getStart(), covered.begin() + range.getEnd(), true);

    std::vector<uint32_t> gaps;
    for (uint32_t b = 0; b < mBucketCount; ++b)
      if (!covered[b])
	gaps.push_back(b);

    return gaps;
  }
}
