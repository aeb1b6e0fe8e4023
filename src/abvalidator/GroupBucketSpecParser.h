// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <string>
#include "AbTestException.h"
#include "Bucketer.h"
#include "GroupBucketMap.h"

namespace abvalidator
{
  class GroupBucketSpecParseException : public ConfigurationException
  {
  public:
    GroupBucketSpecParseException(const std::string msg)
      : ConfigurationException(msg)
    {}

    ~GroupBucketSpecParseException()
    {}
  };

  /**
   * @class GroupBucketSpecParser
   * @brief Parses the textual group-bucket specification of a configuration
   *        file, e.g. "control:0-50,test1:50-100".
   *
   * Each comma separated entry is name:start-end with end exclusive.
   * Whitespace around names, bounds and entries is ignored. Syntax errors
   * throw GroupBucketSpecParseException; a well formed spec that breaks a
   * GroupBucketMap invariant (overlap, no control group, out of range)
   * throws InvalidGroupBucketMapException from the map itself.
   */
  class GroupBucketSpecParser
  {
  public:
    static GroupBucketMap parse(const std::string& spec,
				uint32_t bucketCount = Bucketer::DefaultBucketCount);

    static GroupBucketRange parseEntry(const std::string& entry);

    // Inverse of parse(), used when echoing the configuration.
    static std::string format(const GroupBucketMap& groupBuckets);

  private:
    static uint32_t parseBound(const std::string& bound, const std::string& entry);
  };
}
