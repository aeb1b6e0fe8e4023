#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <iterator>
#include <vector>
#include "PowerCurve.h"

using Catch::Approx;
using namespace abvalidator;

TEST_CASE("PowerCurve default grid", "[PowerCurve]")
{
  const std::vector<double> grid = PowerCurve::defaultEffectGrid();

  REQUIRE(grid.size() == 40);
  REQUIRE(grid.front() == 0.0);
  REQUIRE(grid[1] == Approx(0.005));
  REQUIRE(grid.back() == Approx(0.195));
  for (std::size_t i = 1; i < grid.size(); ++i)
    REQUIRE(grid[i] > grid[i - 1]);
}

TEST_CASE("PowerCurve two tailed values", "[PowerCurve]")
{
  // p0 = 0.3, n0 = n1 = 1000, alpha = 0.05
  PowerCurve curve(0.3, 1000, 1000, FrequentistTestConfiguration(0.05, TailType::TwoTailed), 0.05);

  REQUIRE_FALSE(curve.isDegenerate());
  REQUIRE(curve.getStandardError() == Approx(std::sqrt(0.3 * 0.7 * 0.002)));
  REQUIRE(curve.getCriticalValue() == Approx(1.959963984540054).margin(1e-9));
  REQUIRE(curve.getObservedEffect() == Approx(0.05));

  SECTION("Zero effect has power alpha / 2")
  {
    REQUIRE(curve.powerAt(0.0) == Approx(0.025).margin(1e-9));
  }

  SECTION("Known points")
  {
    REQUIRE(curve.powerAt(0.05) == Approx(0.6843102859581269).margin(1e-8));
    REQUIRE(curve.powerAt(0.1) == Approx(0.9982472376270524).margin(1e-8));
  }

  SECTION("Power is non-decreasing over the grid")
  {
    double previous = -1.0;
    for (const PowerPoint& point : curve)
      {
	REQUIRE(point.getPower() >= previous);
	REQUIRE(point.getPower() <= 1.0);
	previous = point.getPower();
      }
  }
}

TEST_CASE("PowerCurve one tailed uses the one sided critical value", "[PowerCurve]")
{
  PowerCurve curve(0.3, 1000, 1000, FrequentistTestConfiguration(0.05, TailType::OneTailed));

  REQUIRE(curve.getCriticalValue() == Approx(1.644853626951472).margin(1e-9));
  REQUIRE(curve.powerAt(0.0) == Approx(0.05).margin(1e-9));
  REQUIRE(curve.powerAt(0.05) == Approx(0.7866631609339783).margin(1e-8));
}

TEST_CASE("PowerCurve is a restartable range", "[PowerCurve]")
{
  PowerCurve curve(0.1, 500, 400, FrequentistTestConfiguration());

  std::vector<double> firstPass, secondPass;
  for (const PowerPoint& point : curve)
    firstPass.push_back(point.getPower());
  for (auto it = curve.begin(); it != curve.end(); ++it)
    secondPass.push_back((*it).getPower());

  REQUIRE(firstPass.size() == 40);
  REQUIRE(static_cast<std::size_t>(std::distance(curve.begin(), curve.end())) == curve.size());
  REQUIRE(firstPass == secondPass);

  SECTION("Points carry the grid effect sizes")
  {
    REQUIRE(curve.pointAt(3).getEffectSize() == Approx(0.015));
  }

  SECTION("Custom grid")
  {
    PowerCurve custom(0.1, 500, 400, FrequentistTestConfiguration(), 0.0, {0.0, 0.02});
    REQUIRE(custom.size() == 2);
    REQUIRE(custom.pointAt(1).getPower() == Approx(curve.powerAt(0.02)));
  }
}

TEST_CASE("PowerCurve degenerate and invalid inputs", "[PowerCurve]")
{
  SECTION("Control proportion of zero gives NaN powers")
  {
    PowerCurve curve(0.0, 100, 100, FrequentistTestConfiguration());
    REQUIRE(curve.isDegenerate());
    for (const PowerPoint& point : curve)
      REQUIRE(std::isnan(point.getPower()));
  }

  SECTION("Control proportion of one gives NaN powers")
  {
    PowerCurve curve(1.0, 100, 100, FrequentistTestConfiguration());
    REQUIRE(curve.isDegenerate());
    REQUIRE(std::isnan(curve.powerAt(0.05)));
  }

  SECTION("Empty arm")
  {
    REQUIRE_THROWS_AS(PowerCurve(0.3, 0, 100, FrequentistTestConfiguration()), ZeroTrialsException);
  }

  SECTION("Proportion out of range")
  {
    REQUIRE_THROWS_AS(PowerCurve(1.3, 10, 100, FrequentistTestConfiguration()),
		      InvalidObservationException);
  }
}
