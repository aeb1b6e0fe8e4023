#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <cmath>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include "ExperimentRunner.h"
#include "GroupAssigner.h"
#include "ParallelExecutors.h"

using Catch::Approx;
using namespace abvalidator;

namespace
{
  class FakeBayesianCollaborator : public IBayesianCollaborator
  {
  public:
    FakeBayesianCollaborator()
      : mCalls(0)
    {}

    BayesianUpliftSummary evaluate(const GroupAggregate& control,
				   const GroupAggregate& treatment,
				   const BayesianPrior& prior) override
    {
      ++mCalls;
      return BayesianUpliftSummary(treatment.getGroupName(),
				   control.getSuccessCount(), control.getTrialCount(),
				   treatment.getSuccessCount(), treatment.getTrialCount(),
				   "prior=" + std::to_string(prior.getPriorSuccesses()) + "/" +
				   std::to_string(prior.getPriorTrials()));
    }

    int getCalls() const
    {
      return mCalls.load();
    }

  private:
    std::atomic<int> mCalls;
  };

  // Builds records so that each group ends with the requested counts. Subjects
  // are generated until enough land in each group's bucket range.
  std::vector<SubjectRecord> makeRecords(const GroupBucketMap& map,
					 const std::vector<std::pair<uint64_t, uint64_t>>& counts)
  {
    GroupAssigner assigner(map);
    const std::vector<std::string> names = map.getGroupNames();
    std::vector<uint64_t> trials(names.size(), 0);
    std::vector<SubjectRecord> records;

    for (int64_t id = 0; ; ++id)
      {
	bool done = true;
	for (std::size_t g = 0; g < names.size(); ++g)
	  done = done && trials[g] == counts[g].second;
	if (done)
	  break;

	SubjectId subject(id);
	const std::string& group = assigner.assign(subject);
	for (std::size_t g = 0; g < names.size(); ++g)
	  if (names[g] == group && trials[g] < counts[g].second)
	    {
	      records.emplace_back(subject, trials[g] < counts[g].first ? 1 : 0);
	      ++trials[g];
	    }
      }
    return records;
  }

  GroupBucketMap makeThreeGroupMap()
  {
    return GroupBucketMap({GroupBucketRange("control", 0, 34),
			   GroupBucketRange("test1", 34, 67),
			   GroupBucketRange("test2", 67, 100)});
  }
}

TEST_CASE("ExperimentRunner frequentist run", "[ExperimentRunner]")
{
  GroupBucketMap map = makeThreeGroupMap();
  std::vector<SubjectRecord> records = makeRecords(map, {{300, 1000}, {350, 1000}, {310, 1000}});

  ExperimentConfiguration config(TestMethod::Frequentist, FrequentistTestConfiguration(0.05),
				 CorrectionMethod::Bonferroni);

  concurrency::ThreadPoolExecutor<4> executor;
  ExperimentRunner runner(config, &executor);
  std::ostringstream log;
  ExperimentReport report = runner.run(records, map, &log);

  SECTION("Aggregates")
  {
    REQUIRE(report.getAggregates().getControl().getSuccessCount() == 300);
    REQUIRE(report.getAggregates().getGroup("test2").getTrialCount() == 1000);
  }

  SECTION("One comparison per treatment in map order")
  {
    REQUIRE(report.getComparisons().size() == 2);
    const auto& first = std::get<FrequentistResult>(report.getComparisons()[0]);
    const auto& second = std::get<FrequentistResult>(report.getComparisons()[1]);

    REQUIRE(first.getGroupName() == "test1");
    REQUIRE(second.getGroupName() == "test2");
    REQUIRE(first.getStatistic() == Approx(2.3870495801314426).margin(1e-9));
    REQUIRE(first.getPValue() == Approx(0.01698420058213057).margin(1e-9));
  }

  SECTION("Bonferroni corrections follow the comparisons")
  {
    REQUIRE(report.hasCorrections());
    REQUIRE(report.getCorrections().size() == 2);
    REQUIRE(report.getCorrections()[0].getGroupName() == "test1");
    REQUIRE(report.getCorrections()[0].getCorrectedPValue() ==
	    Approx(2.0 * 0.01698420058213057).margin(1e-9));
    REQUIRE(report.getCorrections()[0].isSignificant(0.05));

    auto correction = report.findCorrection("test2");
    REQUIRE(correction.has_value());
    REQUIRE(correction->getCorrectedPValue() >= correction->getOriginalPValue());
  }

  SECTION("Stages are logged")
  {
    const std::string text = log.str();
    REQUIRE(text.find("[Experiment] Aggregating 3000 subject records") != std::string::npos);
    REQUIRE(text.find("bonferroni correction to 2 p-values") != std::string::npos);
  }
}

TEST_CASE("ExperimentRunner without correction", "[ExperimentRunner]")
{
  GroupBucketMap map({GroupBucketRange("control", 0, 50), GroupBucketRange("test1", 50, 100)});
  std::vector<SubjectRecord> records = makeRecords(map, {{20, 100}, {30, 100}});

  ExperimentRunner runner(ExperimentConfiguration{});
  ExperimentReport report = runner.run(records, map);

  REQUIRE(report.getComparisons().size() == 1);
  REQUIRE_FALSE(report.hasCorrections());
  REQUIRE_FALSE(report.findCorrection("test1").has_value());
}

TEST_CASE("ExperimentRunner excludes degenerate comparisons from correction", "[ExperimentRunner]")
{
  GroupBucketMap map = makeThreeGroupMap();
  // control and test2 have no successes at all: zero pooled standard error
  std::vector<SubjectRecord> records = makeRecords(map, {{0, 200}, {40, 200}, {0, 200}});

  ExperimentConfiguration config(TestMethod::Frequentist, FrequentistTestConfiguration(),
				 CorrectionMethod::Holm);
  ExperimentRunner runner(config);
  ExperimentReport report = runner.run(records, map);

  const auto& degenerate = std::get<FrequentistResult>(report.getComparisons()[1]);
  REQUIRE(degenerate.isDegenerate());
  REQUIRE(std::isnan(degenerate.getPValue()));

  REQUIRE(report.getCorrections().size() == 1);
  REQUIRE(report.getCorrections()[0].getGroupName() == "test1");
  REQUIRE_FALSE(report.findCorrection("test2").has_value());
}

TEST_CASE("ExperimentRunner sequential run", "[ExperimentRunner]")
{
  GroupBucketMap map({GroupBucketRange("control", 0, 50), GroupBucketRange("test1", 50, 100)});
  std::vector<SubjectRecord> records = makeRecords(map, {{300, 1000}, {350, 1000}});

  ExperimentConfiguration config(TestMethod::Frequentist, FrequentistTestConfiguration(0.05),
				 std::nullopt, true, 0.05);
  ExperimentRunner runner(config);
  std::ostringstream log;
  ExperimentReport report = runner.run(records, map, &log);

  const auto& result = std::get<FrequentistResult>(report.getComparisons()[0]);
  REQUIRE(result.isEarlyStopped());
  REQUIRE(result.getStoppingIndex() == 1286);
  REQUIRE(log.str().find("stopped early after 1286 of 2000 observations") != std::string::npos);
}

TEST_CASE("ExperimentRunner bayesian run", "[ExperimentRunner]")
{
  GroupBucketMap map = makeThreeGroupMap();
  std::vector<SubjectRecord> records = makeRecords(map, {{3, 10}, {4, 10}, {5, 10}});

  ExperimentConfiguration config(TestMethod::Bayesian, FrequentistTestConfiguration(),
				 CorrectionMethod::Holm, false, 0.05, BayesianPrior(10, 50));

  SECTION("Collaborator is called once per treatment")
  {
    FakeBayesianCollaborator collaborator;
    ExperimentRunner runner(config, nullptr, &collaborator);
    ExperimentReport report = runner.run(records, map);

    REQUIRE(collaborator.getCalls() == 2);
    REQUIRE(report.getComparisons().size() == 2);

    const auto& summary = std::get<BayesianUpliftSummary>(report.getComparisons()[1]);
    REQUIRE(summary.getGroupName() == "test2");
    REQUIRE(summary.getControlSuccesses() == 3);
    REQUIRE(summary.getTreatmentSuccesses() == 5);
    REQUIRE(summary.getPayload() == "prior=10/50");

    // Correction only applies to frequentist runs
    REQUIRE_FALSE(report.hasCorrections());
  }

  SECTION("Missing collaborator is a configuration error")
  {
    REQUIRE_THROWS_AS(ExperimentRunner(config), ConfigurationException);
  }
}

TEST_CASE("ExperimentRunner propagates core failures", "[ExperimentRunner]")
{
  SECTION("Subject in an uncovered bucket")
  {
    // u1 hashes to bucket 17
    GroupBucketMap map({GroupBucketRange("control", 0, 10), GroupBucketRange("test1", 50, 100)});
    std::vector<SubjectRecord> records = { SubjectRecord(SubjectId("u1"), 1) };

    ExperimentRunner runner(ExperimentConfiguration{});
    REQUIRE_THROWS_AS(runner.run(records, map), UnassignedBucketException);
  }

  SECTION("Treatment group without trials")
  {
    GroupBucketMap map({GroupBucketRange("control", 0, 50), GroupBucketRange("test1", 50, 100)});
    // alice -> 20, bob -> 25: both control
    std::vector<SubjectRecord> records = { SubjectRecord(SubjectId("alice"), 1),
					   SubjectRecord(SubjectId("bob"), 0) };

    concurrency::ThreadPoolExecutor<2> executor;
    ExperimentRunner runner(ExperimentConfiguration{}, &executor);
    REQUIRE_THROWS_AS(runner.run(records, map), ZeroTrialsException);
  }
}
