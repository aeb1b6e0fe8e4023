// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include "ExperimentConfiguration.h"
#include "GroupBucketMap.h"

namespace abvalidator
{
  class ExperimentConfigurationException : public std::runtime_error
  {
  public:
  ExperimentConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~ExperimentConfigurationException()
      {}
  };

  /**
   * @class ExperimentFileConfiguration
   * @brief Everything a configuration file describes: where the subject
   *        records are, how buckets map to groups and how to test them.
   */
  class ExperimentFileConfiguration
  {
  public:
    ExperimentFileConfiguration(const std::string& subjectsPath,
				const GroupBucketMap& groupBuckets,
				const ExperimentConfiguration& experimentConfig)
      : mSubjectsPath(subjectsPath),
	mGroupBuckets(groupBuckets),
	mExperimentConfig(experimentConfig)
    {}

    const std::string& getSubjectsPath() const
    {
      return mSubjectsPath;
    }

    const GroupBucketMap& getGroupBucketMap() const
    {
      return mGroupBuckets;
    }

    const ExperimentConfiguration& getExperimentConfiguration() const
    {
      return mExperimentConfig;
    }

  private:
    std::string mSubjectsPath;
    GroupBucketMap mGroupBuckets;
    ExperimentConfiguration mExperimentConfig;
  };

  /**
   * @class ExperimentConfigurationFileReader
   * @brief Reads a one row CSV configuration file with the columns
   *
   *   SubjectsPath,GroupBuckets,Method,Alpha,Hypothesis,Correction,
   *   Sequential,StoppingThreshold,PriorSuccesses,PriorTrials
   *
   * The header row is optional. GroupBuckets contains commas and so must be
   * double quoted. Empty optional columns take their defaults; Correction
   * may be "none". Relative subject paths are resolved against the
   * directory of the configuration file.
   *
   * Malformed values and a missing subjects file throw
   * ExperimentConfigurationException; values that parse but break an
   * invariant throw the ConfigurationException raised by the library type.
   */
  class ExperimentConfigurationFileReader
  {
  public:
    ExperimentConfigurationFileReader (const std::string& configurationFileName);
    ~ExperimentConfigurationFileReader()
      {}

    std::shared_ptr<ExperimentFileConfiguration> readConfigurationFile();

  private:
    std::string mConfigurationFileName;
  };
}
