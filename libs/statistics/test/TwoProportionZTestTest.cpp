#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "TwoProportionZTest.h"

using Catch::Approx;
using namespace abvalidator;

namespace
{
  std::vector<ArmObservation> alternating(const std::vector<int>& controlOutcomes,
					  const std::vector<int>& treatmentOutcomes)
  {
    std::vector<ArmObservation> observations;
    for (std::size_t i = 0; i < controlOutcomes.size(); ++i)
      {
	observations.emplace_back(Arm::Control, controlOutcomes[i]);
	observations.emplace_back(Arm::Treatment, treatmentOutcomes[i]);
      }
    return observations;
  }
}

TEST_CASE("FrequentistTestConfiguration validation", "[TwoProportionZTest][config]")
{
  SECTION("Defaults")
  {
    FrequentistTestConfiguration config;
    REQUIRE(config.getAlpha() == 0.05);
    REQUIRE(config.getTailType() == TailType::TwoTailed);
  }

  SECTION("Hypothesis names parse case-insensitively")
  {
    REQUIRE(tailTypeFromString("one_tailed") == TailType::OneTailed);
    REQUIRE(tailTypeFromString("Two_Tailed") == TailType::TwoTailed);
    REQUIRE(tailTypeToString(TailType::OneTailed) == "one_tailed");
    REQUIRE(FrequentistTestConfiguration(0.1, "ONE_TAILED").getTailType() == TailType::OneTailed);
  }

  SECTION("Unknown hypothesis")
  {
    REQUIRE_THROWS_AS(tailTypeFromString("left"), InvalidTestConfigurationException);
    REQUIRE_THROWS_AS(FrequentistTestConfiguration(0.05, "sideways"), ConfigurationException);
  }

  SECTION("Alpha must lie inside (0, 1)")
  {
    REQUIRE_THROWS_AS(FrequentistTestConfiguration(0.0), InvalidTestConfigurationException);
    REQUIRE_THROWS_AS(FrequentistTestConfiguration(1.0), InvalidTestConfigurationException);
    REQUIRE_THROWS_AS(FrequentistTestConfiguration(-0.2), InvalidTestConfigurationException);
    REQUIRE_THROWS_AS(FrequentistTestConfiguration(std::nan("")), InvalidTestConfigurationException);
  }
}

TEST_CASE("TwoProportionZTest batch", "[TwoProportionZTest]")
{
  TwoProportionZTest twoTailed(FrequentistTestConfiguration(0.05, TailType::TwoTailed));
  TwoProportionZTest oneTailed(FrequentistTestConfiguration(0.05, TailType::OneTailed));

  SECTION("300/1000 vs 350/1000 two tailed")
  {
    FrequentistResult result = twoTailed.conduct(300, 1000, 350, 1000, "test1");

    REQUIRE(result.getGroupName() == "test1");
    REQUIRE(result.getPropNull() == Approx(0.30));
    REQUIRE(result.getPropAlt() == Approx(0.35));
    REQUIRE(result.getObservedEffect() == Approx(0.05));
    REQUIRE(result.getStatistic() == Approx(2.3870495801314426).margin(1e-9));
    REQUIRE(result.getPValue() == Approx(0.01698420058213057).margin(1e-9));
    REQUIRE(result.isSignificant());
    REQUIRE_FALSE(result.isDegenerate());
    REQUIRE(result.getState() == TestState::Computed);
    REQUIRE(result.getStoppingIndex() == 2000);
    REQUIRE(result.getPowerCurve().size() == 40);
    REQUIRE(result.getPowerCurve().getObservedEffect() == Approx(0.05));
  }

  SECTION("One tailed p-value is half the two tailed one in the observed direction")
  {
    FrequentistResult result = oneTailed.conduct(300, 1000, 350, 1000);
    REQUIRE(result.getPValue() == Approx(0.008492100291065285).margin(1e-9));
  }

  SECTION("One tailed test with the effect in the other direction uses the lower tail")
  {
    FrequentistResult result = oneTailed.conduct(350, 1000, 300, 1000);
    REQUIRE(result.getStatistic() == Approx(-2.3870495801314426).margin(1e-9));
    REQUIRE(result.getPValue() == Approx(0.008492100291065285).margin(1e-9));
  }

  SECTION("Swapping arms negates the statistic and keeps the two tailed p-value")
  {
    FrequentistResult forward = twoTailed.conduct(50, 500, 70, 600);
    FrequentistResult backward = twoTailed.conduct(70, 600, 50, 500);

    REQUIRE(forward.getStatistic() == Approx(0.88288).margin(1e-5));
    REQUIRE(backward.getStatistic() == Approx(-forward.getStatistic()));
    REQUIRE(backward.getPValue() == Approx(forward.getPValue()));
    REQUIRE(forward.getPValue() == Approx(0.37730).margin(1e-5));
    REQUIRE_FALSE(forward.isSignificant());
  }

  SECTION("Small difference is not significant")
  {
    FrequentistResult result = twoTailed.conduct(100, 1000, 104, 1000);
    REQUIRE(result.getStatistic() == Approx(0.29553).margin(1e-5));
    REQUIRE(result.getPValue() == Approx(0.76759).margin(1e-5));
    REQUIRE_FALSE(result.isSignificant());
  }

  SECTION("Identical proportions give z = 0 and p = 1")
  {
    FrequentistResult result = twoTailed.conduct(20, 100, 20, 100);
    REQUIRE(result.getStatistic() == 0.0);
    REQUIRE(result.getPValue() == Approx(1.0));
  }

  SECTION("GroupAggregate overload names the result after the treatment")
  {
    GroupAggregate control("control", 300, 1000);
    GroupAggregate treatment("test1", 350, 1000);
    FrequentistResult result = twoTailed.conduct(control, treatment);

    REQUIRE(result.getGroupName() == "test1");
    REQUIRE(result.getSuccessNull() == 300);
    REQUIRE(result.getTrialsAlt() == 1000);
    REQUIRE(result.getPValue() == Approx(0.01698420058213057).margin(1e-9));
  }
}

TEST_CASE("TwoProportionZTest degenerate and invalid inputs", "[TwoProportionZTest]")
{
  TwoProportionZTest test(FrequentistTestConfiguration(0.05));

  SECTION("No successes anywhere is degenerate")
  {
    FrequentistResult result = test.conduct(0, 100, 0, 100);
    REQUIRE(result.isDegenerate());
    REQUIRE(std::isnan(result.getStatistic()));
    REQUIRE(std::isnan(result.getPValue()));
    REQUIRE_FALSE(result.isSignificant());
    REQUIRE(result.getPowerCurve().isDegenerate());
  }

  SECTION("All successes is degenerate")
  {
    FrequentistResult result = test.conduct(50, 50, 80, 80);
    REQUIRE(result.isDegenerate());
    REQUIRE_FALSE(result.isSignificant());
  }

  SECTION("Zero trials")
  {
    REQUIRE_THROWS_AS(test.conduct(0, 0, 1, 10), ZeroTrialsException);
    REQUIRE_THROWS_AS(test.conduct(1, 10, 0, 0), ArithmeticException);
    REQUIRE_THROWS_AS(test.conduct(GroupAggregate("control"), GroupAggregate("test1", 1, 2)),
		      ZeroTrialsException);
  }

  SECTION("Invalid counts")
  {
    REQUIRE_THROWS_AS(test.conduct(-1, 10, 1, 10), InvalidObservationException);
    REQUIRE_THROWS_AS(test.conduct(1, 10, 1, -10), InvalidObservationException);
    REQUIRE_THROWS_AS(test.conduct(11, 10, 1, 10), InvalidObservationException);
    REQUIRE_THROWS_AS(test.conduct(1, 10, 12, 10), InvalidObservationException);
    REQUIRE_THROWS_AS(GroupAggregate("test1", 5, 4), InvalidObservationException);
  }
}

TEST_CASE("TwoProportionZTest sequential stream", "[TwoProportionZTest][sequential]")
{
  TwoProportionZTest test(FrequentistTestConfiguration(0.05));

  SECTION("Stops at the first p-value below the threshold")
  {
    // After four observations: control 0/2, treatment 2/2, z = 2, p = 0.0455
    auto observations = alternating({0, 0, 0, 0, 0}, {1, 1, 1, 1, 1});
    FrequentistResult result = test.conductSequential(observations, 0.05, "test1");

    REQUIRE(result.getState() == TestState::EarlyStopped);
    REQUIRE(result.isEarlyStopped());
    REQUIRE(result.getStoppingIndex() == 4);
    REQUIRE(result.getObservations() == 10);
    REQUIRE(result.getTrialsNull() == 2);
    REQUIRE(result.getTrialsAlt() == 2);
    REQUIRE(result.getStatistic() == Approx(2.0));
    REQUIRE(result.getPValue() == Approx(0.04550026389635842).margin(1e-9));
    REQUIRE(result.isSignificant());
  }

  SECTION("Stricter threshold waits for more data")
  {
    auto observations = alternating({0, 0, 0, 0, 0}, {1, 1, 1, 1, 1});
    FrequentistResult result = test.conductSequential(observations, 0.01);

    // control 0/3, treatment 3/3: z = sqrt(6), p = 0.0143; 0/4 vs 3/3: z = sqrt(7), p = 0.0081
    REQUIRE(result.getStoppingIndex() == 7);
    REQUIRE(result.getTrialsNull() == 4);
    REQUIRE(result.getTrialsAlt() == 3);
    REQUIRE(result.getStatistic() == Approx(std::sqrt(7.0)));
  }

  SECTION("Never stopping reports the cumulative result")
  {
    auto observations = alternating({1, 0, 1, 0}, {1, 0, 1, 0});
    FrequentistResult result = test.conductSequential(observations, 0.05);

    REQUIRE(result.getState() == TestState::Computed);
    REQUIRE(result.getStoppingIndex() == observations.size());
    REQUIRE(result.getTrialsNull() == 4);
    REQUIRE(result.getSuccessAlt() == 2);
    REQUIRE(result.getStatistic() == 0.0);
    REQUIRE_FALSE(result.isSignificant());
  }

  SECTION("Degenerate steps never stop the test")
  {
    // No successes on either arm: every step has a zero standard error
    std::vector<ArmObservation> observations;
    for (int i = 0; i < 6; ++i)
      observations.emplace_back(i % 2 == 0 ? Arm::Control : Arm::Treatment, 0);
    FrequentistResult result = test.conductSequential(observations, 0.5);

    REQUIRE(result.getState() == TestState::Computed);
    REQUIRE(result.isDegenerate());
  }

  SECTION("Stream that never reaches one arm")
  {
    std::vector<ArmObservation> observations{ArmObservation(Arm::Control, 1),
					     ArmObservation(Arm::Control, 0)};
    REQUIRE_THROWS_AS(test.conductSequential(observations, 0.05), ZeroTrialsException);
    REQUIRE_THROWS_AS(test.conductSequential(std::vector<ArmObservation>(), 0.05),
		      ZeroTrialsException);
  }

  SECTION("Invalid outcome and threshold")
  {
    REQUIRE_THROWS_AS(ArmObservation(Arm::Treatment, 2), InvalidObservationException);
    REQUIRE_THROWS_AS(test.conductSequential(alternating({0}, {1}), 0.0),
		      InvalidTestConfigurationException);
    REQUIRE_THROWS_AS(test.conductSequential(alternating({0}, {1}), 1.0),
		      InvalidTestConfigurationException);
  }
}

TEST_CASE("TwoProportionZTest sequential counts", "[TwoProportionZTest][sequential]")
{
  TwoProportionZTest test(FrequentistTestConfiguration(0.05));

  SECTION("Evenly interleaved schedule stops early")
  {
    FrequentistResult result = test.conductSequential(300, 1000, 350, 1000, 0.05, "test1");

    REQUIRE(result.getState() == TestState::EarlyStopped);
    REQUIRE(result.getStoppingIndex() == 1286);
    REQUIRE(result.getObservations() == 2000);
    REQUIRE(result.getTrialsNull() == 643);
    REQUIRE(result.getSuccessNull() == 192);
    REQUIRE(result.getSuccessAlt() == 225);
    REQUIRE(result.getPValue() == Approx(0.04931273321375591).margin(1e-9));
  }

  SECTION("A test that never stops reports the batch result")
  {
    FrequentistResult sequential = test.conductSequential(300, 1000, 350, 1000, 0.01);
    FrequentistResult batch = test.conduct(300, 1000, 350, 1000);

    REQUIRE(sequential.getState() == TestState::Computed);
    REQUIRE(sequential.getStoppingIndex() == 2000);
    REQUIRE(sequential.getStatistic() == Approx(batch.getStatistic()));
    REQUIRE(sequential.getPValue() == Approx(batch.getPValue()));
    REQUIRE(sequential.getSuccessNull() == 300);
    REQUIRE(sequential.getTrialsAlt() == 1000);
  }

  SECTION("Unequal arm sizes keep the schedule within the counts")
  {
    FrequentistResult result = test.conductSequential(10, 30, 12, 70, 0.001);
    REQUIRE(result.getTrialsNull() == 30);
    REQUIRE(result.getTrialsAlt() == 70);
    REQUIRE(result.getSuccessNull() == 10);
    REQUIRE(result.getSuccessAlt() == 12);
  }

  SECTION("GroupAggregate overload")
  {
    FrequentistResult result =
      test.conductSequential(GroupAggregate("control", 300, 1000), GroupAggregate("test1", 350, 1000), 0.05);
    REQUIRE(result.getGroupName() == "test1");
    REQUIRE(result.getStoppingIndex() == 1286);
  }

  SECTION("Invalid counts are rejected before the schedule runs")
  {
    REQUIRE_THROWS_AS(test.conductSequential(5, 4, 1, 10, 0.05), InvalidObservationException);
    REQUIRE_THROWS_AS(test.conductSequential(0, 0, 1, 10, 0.05), ZeroTrialsException);
  }
}
