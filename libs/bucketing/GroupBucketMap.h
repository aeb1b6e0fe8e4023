// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __GROUP_BUCKET_MAP_H
#define __GROUP_BUCKET_MAP_H 1

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "AbTestException.h"
#include "Bucketer.h"

namespace abvalidator
{
  // Name of the reference arm every treatment group is compared against.
  inline const std::string& controlGroupName()
  {
    static const std::string name("control");
    return name;
  }

  /**
   * @class GroupBucketRange
   * @brief A named, half-open range of buckets [start, end).
   */
  class GroupBucketRange
  {
  public:
    GroupBucketRange(const std::string& groupName, uint32_t start, uint32_t end)
      : mGroupName(groupName),
	mStart(start),
	mEnd(end)
    {}

    const std::string& getGroupName() const
    {
      return mGroupName;
    }

    uint32_t getStart() const
    {
      return mStart;
    }

    uint32_t getEnd() const
    {
      return mEnd;
    }

    uint32_t size() const
    {
      return mEnd > mStart ? mEnd - mStart : 0;
    }

    bool contains(uint32_t bucket) const
    {
      return bucket >= mStart && bucket < mEnd;
    }

    bool overlaps(const GroupBucketRange& rhs) const
    {
      return mStart < rhs.mEnd && rhs.mStart < mEnd;
    }

    bool isControl() const
    {
      return mGroupName == controlGroupName();
    }

  private:
    std::string mGroupName;
    uint32_t mStart;
    uint32_t mEnd;
  };

  /**
   * @class GroupBucketMap
   * @brief Partition of the bucket space [0, bucketCount) into named groups.
   *
   * Invariants, all checked by the constructor:
   *  - bucketCount is positive,
   *  - every range is non-empty and lies inside [0, bucketCount),
   *  - ranges are pairwise disjoint,
   *  - group names are non-empty and unique,
   *  - exactly one group is named "control".
   *
   * Ranges are not required to cover the whole bucket space. A subject
   * landing in a gap is reported when it is assigned (UnassignedBucketException),
   * and uncoveredBuckets() lists the gaps up front for diagnostics.
   *
   * Groups keep the order in which they were supplied; the control group is
   * looked up by name, the treatment groups are visited in that order.
   */
  class GroupBucketMap
  {
  public:
    using const_iterator = std::vector<GroupBucketRange>::const_iterator;

    explicit GroupBucketMap(const std::vector<GroupBucketRange>& ranges,
			    uint32_t bucketCount = Bucketer::DefaultBucketCount);

    // First range containing the bucket, in map order.
    std::optional<std::reference_wrapper<const GroupBucketRange>> findRange(uint32_t bucket) const;

    const GroupBucketRange& getControl() const
    {
      return mRanges[mControlIndex];
    }

    std::size_t getControlIndex() const
    {
      return mControlIndex;
    }

    bool hasGroup(const std::string& groupName) const;

    std::vector<std::string> getGroupNames() const;

    std::vector<uint32_t> uncoveredBuckets() const;

    bool coversAllBuckets() const
    {
      return uncoveredBuckets().empty();
    }

    uint32_t getBucketCount() const
    {
      return mBucketCount;
    }

    std::size_t getNumGroups() const
    {
      return mRanges.size();
    }

    const_iterator begin() const
    {
      return mRanges.begin();
    }

    const_iterator end() const
    {
      return mRanges.end();
    }

  private:
    void validate();

  private:
    std::vector<GroupBucketRange> mRanges;
    uint32_t mBucketCount;
    std::size_t mControlIndex;
  };
}

#endif
