// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __GROUP_ASSIGNER_H
#define __GROUP_ASSIGNER_H 1

#include <string>
#include "Bucketer.h"
#include "GroupBucketMap.h"

namespace abvalidator
{
  /**
   * @class GroupAssigner
   * @brief Maps a subject to the group whose bucket range contains it.
   *
   * The assigner borrows the GroupBucketMap; the map must outlive it.
   * Buckets are computed with the map's bucket count.
   */
  class GroupAssigner
  {
  public:
    explicit GroupAssigner(const GroupBucketMap& groupBuckets)
      : mGroupBuckets(groupBuckets),
	mBucketer(groupBuckets.getBucketCount())
    {}

    // Throws UnassignedBucketException when no range contains the subject's bucket.
    const std::string& assign(const SubjectId& subjectId) const
    {
      return assignRange(subjectId).getGroupName();
    }

    const GroupBucketRange& assignRange(const SubjectId& subjectId) const;

    uint32_t bucket(const SubjectId& subjectId) const
    {
      return mBucketer.bucket(subjectId);
    }

    const GroupBucketMap& getGroupBucketMap() const
    {
      return mGroupBuckets;
    }

  private:
    const GroupBucketMap& mGroupBuckets;
    Bucketer mBucketer;
  };
}

#endif
