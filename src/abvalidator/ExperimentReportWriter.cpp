// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExperimentReportWriter.h"
#include <iomanip>
#include <string>
#include <variant>
#include <vector>
#include "GroupBucketSpecParser.h"

namespace abvalidator
{
  void ExperimentReportWriter::writeConfiguration(const ExperimentConfiguration& config,
						  const GroupBucketMap& groupBuckets,
						  std::ostream& os)
  {
    os << "\n=== Experiment Configuration ===" << std::endl;
    os << "Group Buckets: " << GroupBucketSpecParser::format(groupBuckets)
       << " (of " << groupBuckets.getBucketCount() << ")" << std::endl;

    std::vector<uint32_t> uncovered = groupBuckets.uncoveredBuckets();
    if (!uncovered.empty())
      os << "Warning: " << uncovered.size()
	 << " buckets are not assigned to any group" << std::endl;

    os << "Method: " << testMethodToString(config.getTestMethod()) << std::endl;

    if (config.getTestMethod() == TestMethod::Frequentist)
      {
	os << "Alpha: " << config.getAlpha() << std::endl;
	os << "Hypothesis: "
	   << tailTypeToString(config.getFrequentistConfiguration().getTailType()) << std::endl;
	os << "Correction: "
	   << (config.getCorrectionMethod() ? correctionMethodToString(*config.getCorrectionMethod())
	       : std::string("none"))
	   << std::endl;
	if (config.isSequential())
	  os << "Sequential testing, stopping threshold: " << config.getStoppingThreshold()
	     << std::endl;
      }
    else
      {
	os << "Prior: " << config.getBayesianPrior().getPriorSuccesses() << " successes in "
	   << config.getBayesianPrior().getPriorTrials() << " trials" << std::endl;
      }

    os << "================================" << std::endl;
  }

  void ExperimentReportWriter::writeReport(const ExperimentReport& report, std::ostream& os)
  {
    writeAggregates(report.getAggregates(), os);

    for (const auto& comparison : report.getComparisons())
      {
	if (const auto* frequentist = std::get_if<FrequentistResult>(&comparison))
	  writeFrequentistResult(*frequentist, report, os);
	else
	  writeBayesianSummary(std::get<BayesianUpliftSummary>(comparison), os);
      }
  }

  void ExperimentReportWriter::writeAggregates(const ExperimentAggregates& aggregates,
					       std::ostream& os)
  {
    os << "\nGroup Totals" << std::endl;
    for (const auto& aggregate : aggregates)
      os << "  " << std::left << std::setw(16) << aggregate.getGroupName() << std::right
	 << aggregate.getSuccessCount() << " / " << aggregate.getTrialCount()
	 << "  (" << std::fixed << std::setprecision(2)
	 << aggregate.getConversionRate() * 100.0 << "%)" << std::defaultfloat
	 << std::endl;
  }

  void ExperimentReportWriter::writeFrequentistResult(const FrequentistResult& result,
						      const ExperimentReport& report,
						      std::ostream& os)
  {
    os << "\nFrequentist Test Results for " << result.getGroupName() << std::endl;
    os << std::string(25, '=') << std::endl;

    if (result.isDegenerate())
      {
	os << "Test Statistic (Z): undefined (zero pooled standard error)" << std::endl;
	os << "P-Value: undefined" << std::endl;
      }
    else
      {
	os << std::fixed << std::setprecision(4);
	os << "Test Statistic (Z): " << result.getStatistic() << std::endl;
	os << "P-Value: " << result.getPValue() << std::endl;
	os << std::defaultfloat;
      }

    os << "Control Successes: " << result.getSuccessNull() << " / " << result.getTrialsNull()
       << std::endl;
    os << "Test Successes: " << result.getSuccessAlt() << " / " << result.getTrialsAlt()
       << std::endl;
    os << "Observed Effect: " << std::fixed << std::setprecision(4) << result.getObservedEffect()
       << std::defaultfloat << std::endl;

    if (result.isEarlyStopped())
      os << "Early stopped after " << result.getStoppingIndex() << " of "
	 << result.getObservations() << " observations" << std::endl;

    auto correction = report.findCorrection(result.getGroupName());
    if (correction)
      os << "Corrected P-Value: " << std::fixed << std::setprecision(4)
	 << correction->getCorrectedPValue() << std::defaultfloat << std::endl;

    bool significant = correction ? correction->isSignificant(report.getConfiguration().getAlpha())
      : result.isSignificant();
    os << "Significant: " << (significant ? "yes" : "no") << std::endl;

    const PowerCurve& curve = result.getPowerCurve();
    if (!curve.isDegenerate())
      {
	os << "Power at selected effect sizes:" << std::endl;
	for (double effect : { 0.01, 0.02, 0.05, 0.1 })
	  os << "  effect " << std::fixed << std::setprecision(2) << effect << ": "
	     << std::setprecision(4) << curve.powerAt(effect) << std::defaultfloat << std::endl;
      }
  }

  void ExperimentReportWriter::writeBayesianSummary(const BayesianUpliftSummary& summary,
						    std::ostream& os)
  {
    os << "\nBayesian Test Results for " << summary.getGroupName() << std::endl;
    os << std::string(25, '=') << std::endl;
    os << "Control Successes: " << summary.getControlSuccesses() << " / "
       << summary.getControlTrials() << std::endl;
    os << "Test Successes: " << summary.getTreatmentSuccesses() << " / "
       << summary.getTreatmentTrials() << std::endl;

    if (!summary.getPayload().empty())
      os << summary.getPayload() << std::endl;
  }
}
