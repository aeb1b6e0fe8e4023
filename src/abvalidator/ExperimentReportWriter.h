// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <ostream>
#include "ExperimentReport.h"
#include "GroupBucketMap.h"

namespace abvalidator
{
  // Human readable summary of a run, written to the console and log file.
  class ExperimentReportWriter
  {
  public:
    static void writeConfiguration(const ExperimentConfiguration& config,
				   const GroupBucketMap& groupBuckets,
				   std::ostream& os);

    static void writeReport(const ExperimentReport& report, std::ostream& os);

  private:
    static void writeAggregates(const ExperimentAggregates& aggregates, std::ostream& os);
    static void writeFrequentistResult(const FrequentistResult& result,
				       const ExperimentReport& report,
				       std::ostream& os);
    static void writeBayesianSummary(const BayesianUpliftSummary& summary, std::ostream& os);
  };
}
