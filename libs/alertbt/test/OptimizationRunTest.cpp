#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>

#include "OptimizationRun.h"
#include "AlertBacktestException.h"

using namespace alertbt;
using Catch::Approx;

namespace
{
  OptimizationResult makeResult(std::size_t cell, double score, double totalR)
  {
    OptimizationResult r;
    r.cellIndex = cell;
    r.runId = "test";
    r.policy = PolicyConfig(2.0, 0.5);
    r.summary.alertsOk = 10;
    r.summary.totalR = totalR;
    r.objective.finalScore = score;
    return r;
  }

  OptimizationResult makeFailed(std::size_t cell)
  {
    OptimizationResult r;
    r.cellIndex = cell;
    r.runId = "test";
    r.failure = std::string("cell exploded");
    return r;
  }
}

TEST_CASE("OptimizationRun ranking", "[OptimizationRun]")
{
  OptimizationRun run("test");
  run.append(makeResult(0, 0.2, 5.0));
  run.append(makeFailed(1));
  run.append(makeResult(2, 0.9, 1.0));
  run.append(makeResult(3, -0.4, 8.0));

  SECTION("Stored order is insertion order")
  {
    REQUIRE(run.size() == 4);
    REQUIRE(run.getResults()[1].cellIndex == 1);
    REQUIRE(run.failedCount() == 1);
  }

  SECTION("Ranking by objective puts failed cells last")
  {
    const std::vector<OptimizationResult> ranked = run.rankBy(RankKey::ObjectiveScore);
    REQUIRE(ranked[0].cellIndex == 2);
    REQUIRE(ranked[1].cellIndex == 0);
    REQUIRE(ranked[2].cellIndex == 3);
    REQUIRE(ranked[3].isFailed());
  }

  SECTION("Ranking by another key reorders without touching storage")
  {
    const std::vector<OptimizationResult> ranked = run.rankBy(RankKey::TotalR);
    REQUIRE(ranked[0].cellIndex == 3);
    REQUIRE(ranked[1].cellIndex == 0);
    REQUIRE(run.getResults()[0].cellIndex == 0);
  }

  SECTION("Best result by key")
  {
    REQUIRE(run.getBest()->cellIndex == 2);
    REQUIRE(run.getBest(RankKey::TotalR)->cellIndex == 3);
  }
}

TEST_CASE("OptimizationRun with only failures has no best", "[OptimizationRun]")
{
  OptimizationRun run("failures");
  run.append(makeFailed(0));
  run.append(makeFailed(1));

  REQUIRE_FALSE(run.getBest().has_value());
  REQUIRE(run.failedCount() == 2);
  REQUIRE_FALSE(OptimizationRun("empty").getBest().has_value());
}

TEST_CASE("OptimizationRun phase timings accumulate", "[OptimizationRun]")
{
  OptimizationRun run("timed");
  run.recordPhase("grid", 1.5);
  run.recordPhase("grid", 0.5);
  run.recordPhase("load_candles", 0.25);

  REQUIRE(run.getPhaseTimings().at("grid") == Approx(2.0));
  REQUIRE(run.getPhaseTimings().at("load_candles") == Approx(0.25));
  REQUIRE(run.getRunId() == "timed");
}

TEST_CASE("OptimizationResult rank values", "[OptimizationRun]")
{
  OptimizationResult r = makeResult(0, 0.1, 1.0);
  r.summary.profitFactor = std::numeric_limits<double>::infinity();
  r.summary.rProfitFactor = 2.5;

  REQUIRE(r.rankValue(RankKey::ProfitFactor) == Approx(kProfitFactorCap));
  REQUIRE(r.rankValue(RankKey::RProfitFactor) == Approx(2.5));

  for (RankKey key : {RankKey::ObjectiveScore, RankKey::TotalR, RankKey::AvgR, RankKey::WinRate,
		      RankKey::ProfitFactor, RankKey::ExpectancyPct, RankKey::RiskAdjTotalReturnPct,
		      RankKey::RProfitFactor})
    REQUIRE(rankKeyFromString(rankKeyToString(key)) == key);

  REQUIRE_THROWS_AS(rankKeyFromString("sharpe"), ConfigurationException);
}
