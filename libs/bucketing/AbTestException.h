// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTEST_EXCEPTION_H
#define __ABTEST_EXCEPTION_H 1

#include <cstdint>
#include <stdexcept>
#include <string>

namespace abvalidator
{
  // Root of every failure raised by the experiment core. Callers that only
  // want to abort a run can catch this; callers that want to skip a single
  // group catch the more specific classes below.
  class AbTestException : public std::runtime_error
  {
  public:
    explicit AbTestException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~AbTestException() = default;
  };

  //
  // Configuration errors: invalid alpha, unknown hypothesis type,
  // malformed or overlapping bucket ranges.
  //
  class ConfigurationException : public AbTestException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : AbTestException(msg)
    {}
  };

  class InvalidGroupBucketMapException : public ConfigurationException
  {
  public:
    explicit InvalidGroupBucketMapException(const std::string& msg)
      : ConfigurationException(msg)
    {}
  };

  class InvalidTestConfigurationException : public ConfigurationException
  {
  public:
    explicit InvalidTestConfigurationException(const std::string& msg)
      : ConfigurationException(msg)
    {}
  };

  // A subject record whose outcome is not exactly 0 or 1.
  class InvalidSubjectRecordException : public AbTestException
  {
  public:
    explicit InvalidSubjectRecordException(const std::string& msg)
      : AbTestException(msg)
    {}
  };

  // Success/trial counts that cannot describe a binomial sample
  // (negative counts, more successes than trials).
  class InvalidObservationException : public AbTestException
  {
  public:
    explicit InvalidObservationException(const std::string& msg)
      : AbTestException(msg)
    {}
  };

  class BucketingException : public AbTestException
  {
  public:
    explicit BucketingException(const std::string& msg)
      : AbTestException(msg)
    {}
  };

  class AssignmentException : public AbTestException
  {
  public:
    explicit AssignmentException(const std::string& msg)
      : AbTestException(msg)
    {}
  };

  // The subject hashed to a bucket that no group range covers.
  class UnassignedBucketException : public AssignmentException
  {
  public:
    UnassignedBucketException(const std::string& subjectId, uint32_t bucket)
      : AssignmentException("Subject '" + subjectId + "' hashed to bucket " +
			    std::to_string(bucket) + " which is not assigned to any group"),
	mSubjectId(subjectId),
	mBucket(bucket)
    {}

    const std::string& getSubjectId() const
    {
      return mSubjectId;
    }

    uint32_t getBucket() const
    {
      return mBucket;
    }

  private:
    std::string mSubjectId;
    uint32_t mBucket;
  };

  class ArithmeticException : public AbTestException
  {
  public:
    explicit ArithmeticException(const std::string& msg)
      : AbTestException(msg)
    {}
  };

  class ZeroTrialsException : public ArithmeticException
  {
  public:
    explicit ZeroTrialsException(const std::string& msg)
      : ArithmeticException(msg)
    {}
  };

  class CorrectionException : public AbTestException
  {
  public:
    explicit CorrectionException(const std::string& msg)
      : AbTestException(msg)
    {}
  };

  class UnsupportedCorrectionMethodException : public CorrectionException
  {
  public:
    explicit UnsupportedCorrectionMethodException(const std::string& msg)
      : CorrectionException(msg)
    {}
  };

  class InvalidPValueException : public CorrectionException
  {
  public:
    explicit InvalidPValueException(const std::string& msg)
      : CorrectionException(msg)
    {}
  };
}

#endif
