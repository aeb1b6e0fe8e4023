// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ResultSerializer.h"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <variant>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace abvalidator
{
  std::string ResultSerializer::exportToJson(const ExperimentReport& report,
					     const GroupBucketMap& groupBuckets)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("configuration", serializeConfiguration(report.getConfiguration(), allocator),
		  allocator);
    doc.AddMember("groupBuckets", serializeGroupBuckets(groupBuckets, allocator), allocator);

    Value aggregates(kArrayType);
    for (const auto& aggregate : report.getAggregates())
      aggregates.PushBack(serializeAggregate(aggregate, allocator), allocator);
    doc.AddMember("aggregates", aggregates, allocator);

    Value results(kArrayType);
    for (const auto& comparison : report.getComparisons())
      {
	if (const auto* frequentist = std::get_if<FrequentistResult>(&comparison))
	  results.PushBack(serializeFrequentistResult(*frequentist, allocator), allocator);
	else
	  results.PushBack(serializeBayesianSummary(std::get<BayesianUpliftSummary>(comparison),
						    allocator),
			   allocator);
      }
    doc.AddMember("results", results, allocator);

    Value corrections(kArrayType);
    for (const auto& correction : report.getCorrections())
      corrections.PushBack(serializeCorrection(correction, report.getConfiguration().getAlpha(),
					       allocator),
			   allocator);
    doc.AddMember("corrections", corrections, allocator);

    // Convert to string
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
  }

  void ResultSerializer::exportToFile(const ExperimentReport& report,
				      const GroupBucketMap& groupBuckets,
				      const std::string& filePath)
  {
    std::ofstream file(filePath);
    if (!file.is_open())
      throw std::runtime_error("ResultSerializer::exportToFile - cannot open " + filePath +
			       " for writing");

    file << exportToJson(report, groupBuckets) << std::endl;
  }

  Value ResultSerializer::serializeConfiguration(const ExperimentConfiguration& config,
						 Allocator& allocator)
  {
    Value obj(kObjectType);

    obj.AddMember("method", Value(testMethodToString(config.getTestMethod()).c_str(), allocator),
		  allocator);
    obj.AddMember("alpha", config.getAlpha(), allocator);
    obj.AddMember("hypothesis",
		  Value(tailTypeToString(config.getFrequentistConfiguration().getTailType()).c_str(),
			allocator),
		  allocator);

    if (config.getCorrectionMethod())
      obj.AddMember("correction",
		    Value(correctionMethodToString(*config.getCorrectionMethod()).c_str(), allocator),
		    allocator);
    else
      obj.AddMember("correction", Value(kNullType), allocator);

    obj.AddMember("sequential", config.isSequential(), allocator);
    obj.AddMember("stoppingThreshold", config.getStoppingThreshold(), allocator);

    Value prior(kObjectType);
    prior.AddMember("successes", static_cast<uint64_t>(config.getBayesianPrior().getPriorSuccesses()),
		    allocator);
    prior.AddMember("trials", static_cast<uint64_t>(config.getBayesianPrior().getPriorTrials()),
		    allocator);
    obj.AddMember("prior", prior, allocator);

    return obj;
  }

  Value ResultSerializer::serializeGroupBuckets(const GroupBucketMap& groupBuckets,
						Allocator& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("bucketCount", groupBuckets.getBucketCount(), allocator);

    Value ranges(kArrayType);
    for (const auto& range : groupBuckets)
      {
	Value rangeValue(kObjectType);
	rangeValue.AddMember("group", Value(range.getGroupName().c_str(), allocator), allocator);
	rangeValue.AddMember("start", range.getStart(), allocator);
	rangeValue.AddMember("end", range.getEnd(), allocator);
	ranges.PushBack(rangeValue, allocator);
      }
    obj.AddMember("ranges", ranges, allocator);

    return obj;
  }

  Value ResultSerializer::serializeAggregate(const GroupAggregate& aggregate, Allocator& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("group", Value(aggregate.getGroupName().c_str(), allocator), allocator);
    obj.AddMember("successes", static_cast<uint64_t>(aggregate.getSuccessCount()), allocator);
    obj.AddMember("trials", static_cast<uint64_t>(aggregate.getTrialCount()), allocator);
    obj.AddMember("conversionRate", aggregate.getConversionRate(), allocator);
    return obj;
  }

  Value ResultSerializer::serializeFrequentistResult(const FrequentistResult& result,
						     Allocator& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("group", Value(result.getGroupName().c_str(), allocator), allocator);
    obj.AddMember("method", "frequentist", allocator);
    obj.AddMember("controlSuccesses", static_cast<uint64_t>(result.getSuccessNull()), allocator);
    obj.AddMember("controlTrials", static_cast<uint64_t>(result.getTrialsNull()), allocator);
    obj.AddMember("treatmentSuccesses", static_cast<uint64_t>(result.getSuccessAlt()), allocator);
    obj.AddMember("treatmentTrials", static_cast<uint64_t>(result.getTrialsAlt()), allocator);
    obj.AddMember("statistic", makeNumber(result.getStatistic()), allocator);
    obj.AddMember("pValue", makeNumber(result.getPValue()), allocator);
    obj.AddMember("significant", result.isSignificant(), allocator);
    obj.AddMember("state", Value(testStateToString(result.getState()).c_str(), allocator),
		  allocator);
    obj.AddMember("stoppingIndex", static_cast<uint64_t>(result.getStoppingIndex()), allocator);
    obj.AddMember("observations", static_cast<uint64_t>(result.getObservations()), allocator);
    obj.AddMember("observedEffect", makeNumber(result.getObservedEffect()), allocator);
    obj.AddMember("powerCurve", serializePowerCurve(result.getPowerCurve(), allocator), allocator);
    return obj;
  }

  Value ResultSerializer::serializeBayesianSummary(const BayesianUpliftSummary& summary,
						   Allocator& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("group", Value(summary.getGroupName().c_str(), allocator), allocator);
    obj.AddMember("method", "bayesian", allocator);
    obj.AddMember("controlSuccesses", static_cast<uint64_t>(summary.getControlSuccesses()),
		  allocator);
    obj.AddMember("controlTrials", static_cast<uint64_t>(summary.getControlTrials()), allocator);
    obj.AddMember("treatmentSuccesses", static_cast<uint64_t>(summary.getTreatmentSuccesses()),
		  allocator);
    obj.AddMember("treatmentTrials", static_cast<uint64_t>(summary.getTreatmentTrials()),
		  allocator);
    obj.AddMember("payload", Value(summary.getPayload().c_str(), allocator), allocator);
    return obj;
  }

  Value ResultSerializer::serializePowerCurve(const PowerCurve& curve, Allocator& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("standardError", curve.getStandardError(), allocator);
    obj.AddMember("criticalValue", makeNumber(curve.getCriticalValue()), allocator);

    Value points(kArrayType);
    for (const PowerPoint point : curve)
      {
	Value pointValue(kObjectType);
	pointValue.AddMember("effect", point.getEffectSize(), allocator);
	pointValue.AddMember("power", makeNumber(point.getPower()), allocator);
	points.PushBack(pointValue, allocator);
      }
    obj.AddMember("points", points, allocator);

    return obj;
  }

  Value ResultSerializer::serializeCorrection(const CorrectionResult& correction,
					      double alpha,
					      Allocator& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("group", Value(correction.getGroupName().c_str(), allocator), allocator);
    obj.AddMember("originalPValue", correction.getOriginalPValue(), allocator);
    obj.AddMember("correctedPValue", correction.getCorrectedPValue(), allocator);
    obj.AddMember("significant", correction.isSignificant(alpha), allocator);
    return obj;
  }

  Value ResultSerializer::makeNumber(double value)
  {
    if (std::isnan(value))
      return Value(kNullType);

    return Value(value);
  }
}
