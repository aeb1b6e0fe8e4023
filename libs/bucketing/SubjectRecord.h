// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SUBJECT_RECORD_H
#define __SUBJECT_RECORD_H 1

#include <cstdint>
#include <ostream>
#include <string>
#include "AbTestException.h"

namespace abvalidator
{
  /**
   * @class SubjectId
   * @brief Canonical string form of an experiment subject identifier.
   *
   * Identifiers arrive either as strings or as integers. Both are reduced to
   * a single canonical string so that the bucket of a subject does not
   * depend on how the identifier was typed upstream: the integer 42 and the
   * string "42" hash to the same bucket.
   */
  class SubjectId
  {
  public:
    explicit SubjectId(const std::string& id)
      : mCanonicalId(id)
    {}

    explicit SubjectId(const char* id)
      : mCanonicalId(id)
    {}

    explicit SubjectId(int64_t id)
      : mCanonicalId(std::to_string(id))
    {}

    const std::string& asString() const
    {
      return mCanonicalId;
    }

    bool operator==(const SubjectId& rhs) const
    {
      return mCanonicalId == rhs.mCanonicalId;
    }

    bool operator!=(const SubjectId& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    std::string mCanonicalId;
  };

  inline std::ostream& operator<<(std::ostream& os, const SubjectId& id)
  {
    return os << id.asString();
  }

  /**
   * @class SubjectRecord
   * @brief One collected observation: a subject and its binary outcome.
   *
   * The outcome must be exactly 0 (failure) or 1 (success).
   */
  class SubjectRecord
  {
  public:
    SubjectRecord(const SubjectId& subjectId, int outcome)
      : mSubjectId(subjectId),
	mOutcome(validateOutcome(subjectId, outcome))
    {}

    const SubjectId& getSubjectId() const
    {
      return mSubjectId;
    }

    uint32_t getOutcome() const
    {
      return mOutcome;
    }

    bool isSuccess() const
    {
      return mOutcome == 1;
    }

  private:
    static uint32_t validateOutcome(const SubjectId& subjectId, int outcome)
    {
      if (outcome != 0 && outcome != 1)
	throw InvalidSubjectRecordException("Subject '" + subjectId.asString() +
					    "' has outcome " + std::to_string(outcome) +
					    ", expected 0 or 1");
      return static_cast<uint32_t>(outcome);
    }

  private:
    SubjectId mSubjectId;
    uint32_t mOutcome;
  };
}

#endif
