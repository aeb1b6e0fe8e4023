// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include <rapidjson/document.h>
#include "ExperimentReport.h"
#include "GroupBucketMap.h"

namespace abvalidator
{
  /**
   * @class ResultSerializer
   * @brief Writes an ExperimentReport as a pretty printed JSON document.
   *
   * Top level members: "configuration", "groupBuckets", "aggregates",
   * "results" (one per treatment group, tagged with "method") and
   * "corrections". NaN statistics, p-values and powers are written as null.
   */
  class ResultSerializer
  {
  public:
    static std::string exportToJson(const ExperimentReport& report,
				    const GroupBucketMap& groupBuckets);

    // Throws std::runtime_error when the file cannot be written.
    static void exportToFile(const ExperimentReport& report,
			     const GroupBucketMap& groupBuckets,
			     const std::string& filePath);

  private:
    using Allocator = rapidjson::Document::AllocatorType;

    static rapidjson::Value serializeConfiguration(const ExperimentConfiguration& config,
						   Allocator& allocator);
    static rapidjson::Value serializeGroupBuckets(const GroupBucketMap& groupBuckets,
						  Allocator& allocator);
    static rapidjson::Value serializeAggregate(const GroupAggregate& aggregate,
					       Allocator& allocator);
    static rapidjson::Value serializeFrequentistResult(const FrequentistResult& result,
						       Allocator& allocator);
    static rapidjson::Value serializeBayesianSummary(const BayesianUpliftSummary& summary,
						     Allocator& allocator);
    static rapidjson::Value serializePowerCurve(const PowerCurve& curve,
						Allocator& allocator);
    static rapidjson::Value serializeCorrection(const CorrectionResult& correction,
						double alpha,
						Allocator& allocator);

    // Null for NaN, a JSON number otherwise.
    static rapidjson::Value makeNumber(double value);
  };
}
