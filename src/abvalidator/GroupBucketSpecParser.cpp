// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "GroupBucketSpecParser.h"
#include <limits>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace abvalidator
{
  GroupBucketMap GroupBucketSpecParser::parse(const std::string& spec, uint32_t bucketCount)
  {
    std::string trimmedSpec = boost::algorithm::trim_copy(spec);
    if (trimmedSpec.empty())
      throw GroupBucketSpecParseException("GroupBucketSpecParser::parse - empty group bucket specification");

    std::vector<std::string> entries;
    boost::algorithm::split(entries, trimmedSpec, boost::algorithm::is_any_of(","));

    std::vector<GroupBucketRange> ranges;
    ranges.reserve(entries.size());
    for (const auto& entry : entries)
      ranges.push_back(parseEntry(entry));

    return GroupBucketMap(ranges, bucketCount);
  }

  GroupBucketRange GroupBucketSpecParser::parseEntry(const std::string& entry)
  {
    std::string trimmedEntry = boost::algorithm::trim_copy(entry);

    std::string::size_type colon = trimmedEntry.find(':');
    if (colon == std::string::npos)
      throw GroupBucketSpecParseException("GroupBucketSpecParser - entry '" + trimmedEntry +
					  "' is not of the form name:start-end");

    std::string groupName = boost::algorithm::trim_copy(trimmedEntry.substr(0, colon));
    if (groupName.empty())
      throw GroupBucketSpecParseException("GroupBucketSpecParser - entry '" + trimmedEntry +
					  "' has an empty group name");

    std::vector<std::string> bounds;
    std::string rangeStr = trimmedEntry.substr(colon + 1);
    boost::algorithm::split(bounds, rangeStr, boost::algorithm::is_any_of("-"));
    if (bounds.size() != 2)
      throw GroupBucketSpecParseException("GroupBucketSpecParser - entry '" + trimmedEntry +
					  "' does not have a start-end bucket range");

    uint32_t start = parseBound(bounds[0], trimmedEntry);
    uint32_t end = parseBound(bounds[1], trimmedEntry);

    return GroupBucketRange(groupName, start, end);
  }

  std::string GroupBucketSpecParser::format(const GroupBucketMap& groupBuckets)
  {
    std::vector<std::string> entries;
    for (const auto& range : groupBuckets)
      entries.push_back(range.getGroupName() + ":" + std::to_string(range.getStart()) +
			"-" + std::to_string(range.getEnd()));

    return boost::algorithm::join(entries, ",");
  }

  uint32_t GroupBucketSpecParser::parseBound(const std::string& bound, const std::string& entry)
  {
    std::string trimmedBound = boost::algorithm::trim_copy(bound);
    if (trimmedBound.empty() ||
	!boost::algorithm::all(trimmedBound, boost::algorithm::is_digit()))
      throw GroupBucketSpecParseException("GroupBucketSpecParser - bucket bound '" + trimmedBound +
					  "' in entry '" + entry + "' is not a non-negative integer");

    // Keeps std::stoull clear of out_of_range
    if (trimmedBound.size() > 10)
      throw GroupBucketSpecParseException("GroupBucketSpecParser - bucket bound '" + trimmedBound +
					  "' in entry '" + entry + "' is out of range");

    unsigned long long value = std::stoull(trimmedBound);
    if (value > std::numeric_limits<uint32_t>::max())
      throw GroupBucketSpecParseException("GroupBucketSpecParser - bucket bound '" + trimmedBound +
					  "' in entry '" + entry + "' is out of range");

    return static_cast<uint32_t>(value);
  }
}
