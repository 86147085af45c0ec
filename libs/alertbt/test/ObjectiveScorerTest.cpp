// ObjectiveScorerTest.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>

#include "ObjectiveScorer.h"
#include "AlertBacktestException.h"

using namespace alertbt;
using Catch::Approx;

namespace
{
  RunSummary makeSummary(std::size_t okCount, double avgR)
  {
    RunSummary s;
    s.alertsTotal = okCount;
    s.alertsOk = okCount;
    s.avgR = avgR;
    s.totalR = avgR * static_cast<double>(okCount);
    s.winRate = 0.5;
    s.avgRWin = 1.5;
    s.avgRLoss = -1.0;
    s.ddPre2xMedian = -0.1;
    return s;
  }
}

TEST_CASE("ObjectiveScorer with no eligible trades", "[ObjectiveScorer]")
{
  const ObjectiveScorer scorer;
  RunSummary empty;
  empty.alertsTotal = 12;
  empty.alertsMissing = 12;

  const ObjectiveComponents c = scorer.score(empty);

  REQUIRE(c.confidence == 0.0);
  REQUIRE(c.finalScore == 0.0);
  REQUIRE(c.rawScore == 0.0);
  REQUIRE_FALSE(std::isnan(c.finalScore));
}

TEST_CASE("ObjectiveScorer confidence", "[ObjectiveScorer]")
{
  const ObjectiveConfig config;

  SECTION("Zero samples give zero confidence")
  {
    REQUIRE(ObjectiveScorer::confidence(0, config) == 0.0);
  }

  SECTION("Confidence is sqrt(n / (n + k))")
  {
    REQUIRE(ObjectiveScorer::confidence(10, config) == Approx(std::sqrt(0.5)));
    REQUIRE(ObjectiveScorer::confidence(30, config) == Approx(std::sqrt(30.0 / 40.0)));
  }

  SECTION("Confidence grows with the sample and stays below one")
  {
    double previous = 0.0;
    for (std::size_t n = 1; n <= 1000; n *= 2)
      {
	const double c = ObjectiveScorer::confidence(n, config);
	REQUIRE(c > previous);
	REQUIRE(c < 1.0);
	previous = c;
      }
  }

  SECTION("Same raw score ranks higher with more trades")
  {
    const ObjectiveScorer scorer(config);
    const ObjectiveComponents small = scorer.score(makeSummary(5, 0.4));
    const ObjectiveComponents large = scorer.score(makeSummary(50, 0.4));

    REQUIRE(small.rawScore == Approx(large.rawScore));
    REQUIRE(large.finalScore > small.finalScore);
  }
}

TEST_CASE("ObjectiveScorer drawdown penalty", "[ObjectiveScorer]")
{
  const ObjectiveConfig config;

  SECTION("No penalty inside the threshold")
  {
    REQUIRE(ObjectiveScorer::drawdownPenalty(-0.10, config) == 0.0);
    REQUIRE(ObjectiveScorer::drawdownPenalty(-0.30, config) == 0.0);
  }

  SECTION("Exponential above the threshold")
  {
    REQUIRE(ObjectiveScorer::drawdownPenalty(-0.40, config) == Approx(std::exp(5.0 * 0.1) - 1.0));
  }

  SECTION("Brutal zone multiplies the penalty")
  {
    const double base = std::exp(5.0 * 0.4) - 1.0;
    REQUIRE(ObjectiveScorer::drawdownPenalty(-0.70, config) == Approx(base * (1.0 + 10.0 * 0.1)));
  }

  SECTION("Deeper drawdowns are never penalized less")
  {
    double previous = 0.0;
    for (double dd = 0.0; dd <= 0.95; dd += 0.05)
      {
	const double p = ObjectiveScorer::drawdownPenalty(-dd, config);
	REQUIRE(p >= previous);
	previous = p;
      }
  }

  SECTION("A deep pre-2x drawdown lowers the score")
  {
    const ObjectiveScorer scorer(config);
    RunSummary shallow = makeSummary(20, 0.3);
    RunSummary deep = shallow;
    deep.ddPre2xMedian = -0.55;

    REQUIRE(scorer.score(deep).finalScore < scorer.score(shallow).finalScore);
    REQUIRE(scorer.score(deep).ddPenalty > 0.0);
  }
}

TEST_CASE("ObjectiveScorer bonuses", "[ObjectiveScorer]")
{
  const ObjectiveConfig config;

  SECTION("Time boost halves at the half-life")
  {
    REQUIRE(ObjectiveScorer::timeBoost(0.0, config) == Approx(0.5));
    REQUIRE(ObjectiveScorer::timeBoost(60.0, config) == Approx(0.25));
    REQUIRE(ObjectiveScorer::timeBoost(180.0, config) == Approx(0.125));
  }

  SECTION("Spread tail bonus rewards the right tail")
  {
    const double bonus = ObjectiveScorer::tailBonus(1.3, 2.0, 5.0, config);
    REQUIRE(bonus == Approx(0.10 * (0.5 * 0.7 + 1.0 * 3.0)));
    REQUIRE(ObjectiveScorer::tailBonus(1.3, 1.3, 1.3, config) == 0.0);
  }

  SECTION("Alternative tail metrics")
  {
    ObjectiveConfig alt = config;
    alt.tailBonusMetric = TailBonusMetric::LogP95;
    REQUIRE(ObjectiveScorer::tailBonus(1.3, 2.0, 0.8, alt) == Approx(0.0));
    REQUIRE(ObjectiveScorer::tailBonus(1.3, 2.0, 5.0, alt) == Approx(std::log(5.0) * 0.10));

    alt.tailBonusMetric = TailBonusMetric::P95Ratio;
    REQUIRE(ObjectiveScorer::tailBonus(1.3, 2.0, 5.0, alt) == Approx(1.5 * 0.10));
  }

  SECTION("Discipline bonus needs both hit rate and shallow drawdown")
  {
    const ObjectiveScorer scorer(config);
    RunSummary s = makeSummary(20, 0.3);
    s.pctHitTier[tierIndex(2.0)] = 0.4;
    REQUIRE(scorer.score(s).disciplineBonus == Approx(0.10));

    s.ddPre2xMedian = -0.45;
    REQUIRE(scorer.score(s).disciplineBonus == 0.0);
  }

  SECTION("Loss R penalty only outside the tolerance")
  {
    REQUIRE(ObjectiveScorer::lossRPenalty(-1.2, config) == 0.0);
    REQUIRE(ObjectiveScorer::lossRPenalty(-0.5, config) == Approx((0.5 - 0.3) * 2.0));
    REQUIRE(ObjectiveScorer::lossRPenalty(0.0, config) == 0.0);
  }

  SECTION("Win-rate penalty below the floor")
  {
    REQUIRE(ObjectiveScorer::winRatePenalty(0.5, config) == 0.0);
    REQUIRE(ObjectiveScorer::winRatePenalty(0.1, config) == Approx(std::exp(5.0 * 0.1) - 1.0));
  }
}

TEST_CASE("ObjectiveScorer composition", "[ObjectiveScorer]")
{
  ObjectiveConfig config;
  config.tailBonusWeight = 0.0;
  const ObjectiveScorer scorer(config);

  RunSummary s = makeSummary(10, 0.5);
  s.timeTo2xMedianMin = 60.0;

  const ObjectiveComponents c = scorer.score(s);

  REQUIRE(c.baseValue == Approx(0.5));
  REQUIRE(c.timeBoost == Approx(0.25));
  REQUIRE(c.rawScore == Approx(0.5 + 0.25 * 0.3));
  REQUIRE(c.confidence == Approx(std::sqrt(0.5)));
  REQUIRE(c.finalScore == Approx(c.confidence * c.rawScore));

  SECTION("Primary metric selects the base value")
  {
    ObjectiveConfig totalConfig = config;
    totalConfig.primaryMetric = PrimaryMetric::TotalR;
    REQUIRE(ObjectiveScorer(totalConfig).score(s).baseValue == Approx(5.0));

    ObjectiveConfig expectancy = config;
    expectancy.primaryMetric = PrimaryMetric::ExpectancyR;
    REQUIRE(ObjectiveScorer(expectancy).score(s).baseValue == Approx(0.5 * 1.5 - 0.5 * 1.0));
  }
}

TEST_CASE("ObjectiveConfig presets and validation", "[ObjectiveScorer]")
{
  SECTION("Presets differ in drawdown tolerance")
  {
    const ObjectiveConfig def = ObjectiveConfig::preset("default");
    const ObjectiveConfig conservative = ObjectiveConfig::preset("conservative");
    const ObjectiveConfig aggressive = ObjectiveConfig::preset("aggressive");

    REQUIRE(conservative.ddPenaltyThreshold < def.ddPenaltyThreshold);
    REQUIRE(aggressive.ddPenaltyThreshold > def.ddPenaltyThreshold);
    REQUIRE(def.validate().empty());
    REQUIRE(conservative.validate().empty());
    REQUIRE(aggressive.validate().empty());
  }

  SECTION("Unknown names throw")
  {
    REQUIRE_THROWS_AS(ObjectiveConfig::preset("reckless"), ConfigurationException);
    REQUIRE_THROWS_AS(primaryMetricFromString("sharpe"), ConfigurationException);
    REQUIRE_THROWS_AS(tailBonusMetricFromString("p99"), ConfigurationException);
  }

  SECTION("Invalid settings are reported and rejected by the scorer")
  {
    ObjectiveConfig bad;
    bad.confidenceK = 0.0;
    bad.ddBrutalThreshold = 0.1;
    REQUIRE(bad.validate().size() == 2);
    REQUIRE_THROWS_AS(ObjectiveScorer(bad), ConfigurationException);
  }

  SECTION("Metric names round trip")
  {
    REQUIRE(primaryMetricFromString(primaryMetricToString(PrimaryMetric::ExpectancyR)) == PrimaryMetric::ExpectancyR);
    REQUIRE(tailBonusMetricFromString("p95_minus_p75") == TailBonusMetric::P95MinusP75);
  }
}
