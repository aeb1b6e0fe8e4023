// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "GroupAssigner.h"

namespace abvalidator
{
  const GroupBucketRange& GroupAssigner::assignRange(const SubjectId& subjectId) const
  {
    const uint32_t subjectBucket = mBucketer.bucket(subjectId);

    auto range = mGroupBuckets.findRange(subjectBucket);
    if (!range)
      throw UnassignedBucketException(subjectId.asString(), subjectBucket);

    return range->get();
  }
}
