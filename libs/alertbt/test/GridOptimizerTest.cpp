// GridOptimizerTest.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "GridOptimizer.h"
#include "AlertBacktestException.h"
#include "ParallelExecutors.h"
#include "TestUtils.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace alertbt;
using namespace alertbt::test;
using Catch::Approx;

namespace
{
  struct GridFixture
  {
    GridFixture()
    {
      // A mix of runners, losers and a token without data
      lookup.addCandles("RUN1", makeSeries({{1.0, 0.95}, {1.6, 0.9}, {2.4, 1.5}, {3.2, 2.2}}, 1.0, 1));
      lookup.addCandles("RUN2", makeSeries({{1.0, 0.8}, {1.7, 0.75}, {1.6, 1.2}, {1.9, 1.4}}, 1.0, 1));
      lookup.addCandles("DUMP", makeSeries({{1.05, 0.9}, {0.9, 0.6}, {0.7, 0.3}}, 1.0, 1));
      lookup.addCandles("CHOP", makeSeries({{1.1, 0.9}, {1.15, 0.85}, {1.1, 0.95}}, 1.0, 1));

      for (const char* token : {"RUN1", "RUN2", "DUMP", "CHOP", "GONE"})
	alerts.push_back(makeAlert(token, 1));

      options.intervalSeconds = 60;
      options.horizonHours = 1.0;
    }

    InMemoryCandleLookup lookup;
    std::vector<Alert> alerts;
    GridOptimizerOptions options;
  };

  // Holds each load open briefly and records the peak number of overlapping loads
  class CountingCandleLookup : public ICandleLookup
  {
  public:
    explicit CountingCandleLookup(const ICandleLookup& inner)
      : mInner(inner), mActive(0), mPeak(0)
    {}

    CandleSeries loadCandles(const std::string& tokenId,
			     const ptime& start,
			     const ptime& end,
			     long intervalSeconds) const override
    {
      const std::size_t active = ++mActive;
      std::size_t peak = mPeak.load();
      while (active > peak && !mPeak.compare_exchange_weak(peak, active))
	;
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      CandleSeries candles = mInner.loadCandles(tokenId, start, end, intervalSeconds);
      --mActive;
      return candles;
    }

    std::size_t getPeak() const { return mPeak.load(); }

  private:
    const ICandleLookup& mInner;
    mutable std::atomic<std::size_t> mActive;
    mutable std::atomic<std::size_t> mPeak;
  };
}

TEST_CASE("GridOptimizer evaluates every cell", "[GridOptimizer]")
{
  GridFixture fx;
  const GridOptimizer optimizer(fx.options);
  const ParameterSpace space;
  concurrency::ThreadPoolExecutor pool(4);

  const OptimizationRun run = optimizer.run(fx.alerts, fx.lookup, space, pool, "unit");
  const ParameterGrid grid(space, fx.options.feeBps, fx.options.slippageBps);

  SECTION("One result per cell in cell order")
  {
    REQUIRE(run.size() == grid.size());
    REQUIRE(run.failedCount() == 0);
    for (std::size_t i = 0; i < run.size(); ++i)
      {
	const OptimizationResult& r = run.getResults()[i];
	REQUIRE(r.cellIndex == i);
	REQUIRE(r.runId == "unit");
	REQUIRE(r.policy->describe() == grid.cellAt(i).describe());
	REQUIRE(r.summary.alertsTotal == 5);
	REQUIRE(r.summary.alertsOk == 4);
	REQUIRE(r.summary.alertsMissing == 1);
      }
  }

  SECTION("Cell statistics match a direct batch run")
  {
    const PolicyConfig policy = grid.cellAt(3);
    const BatchRunner runner(fx.lookup, fx.options.intervalSeconds, fx.options.horizonHours);
    const Summarizer summarizer(fx.options.riskPerTrade);
    const RunSummary direct = summarizer.summarize(runner.run(fx.alerts, policy), policy);
    const ObjectiveComponents score = ObjectiveScorer(fx.options.objective).score(direct);

    const OptimizationResult& cell = run.getResults()[3];
    REQUIRE(cell.summary.totalR == Approx(direct.totalR));
    REQUIRE(cell.summary.winRate == Approx(direct.winRate));
    REQUIRE(cell.objective.finalScore == Approx(score.finalScore));
  }

  SECTION("Phase timings are recorded")
  {
    REQUIRE(run.getPhaseTimings().count("load_candles") == 1);
    REQUIRE(run.getPhaseTimings().count("grid") == 1);
  }

  SECTION("The run report logs without throwing")
  {
    REQUIRE_NOTHROW(GridOptimizer::logRunReport(run, fx.options.objective, 3));
  }
}

TEST_CASE("GridOptimizer results do not depend on the executor", "[GridOptimizer]")
{
  GridFixture fx;
  ParameterSpace space;
  space.trailing.enabled = true;
  space.trailing.activationPct = RangeSpec::values({0.3, 0.5});

  GridOptimizerOptions boundedOptions = fx.options;
  boundedOptions.maxConcurrentCells = 1;

  concurrency::SingleThreadExecutor inlineExecutor;
  concurrency::ThreadPoolExecutor pool(3);

  const OptimizationRun sequential = GridOptimizer(fx.options).run(fx.alerts, fx.lookup, space, inlineExecutor);
  const OptimizationRun bounded = GridOptimizer(boundedOptions).run(fx.alerts, fx.lookup, space, pool);

  REQUIRE(sequential.size() == bounded.size());
  for (std::size_t i = 0; i < sequential.size(); ++i)
    {
      REQUIRE(sequential.getResults()[i].summary.totalR == bounded.getResults()[i].summary.totalR);
      REQUIRE(sequential.getResults()[i].objective.finalScore == bounded.getResults()[i].objective.finalScore);
    }
}

TEST_CASE("GridOptimizer caps concurrent candle loads", "[GridOptimizer]")
{
  GridFixture fx;
  CountingCandleLookup counting(fx.lookup);
  ParameterSpace space;
  space.tpSl.tpMult = RangeSpec::values({2.0});
  space.tpSl.slMult = RangeSpec::values({0.5});

  concurrency::ThreadPoolExecutor pool(4);

  SECTION("One load at a time when cells are capped at one")
  {
    GridOptimizerOptions options = fx.options;
    options.maxConcurrentCells = 1;

    const OptimizationRun run = GridOptimizer(options).run(fx.alerts, counting, space, pool);

    REQUIRE(run.size() == 1);
    REQUIRE(run.getResults()[0].summary.alertsOk == 4);
    REQUIRE(counting.getPeak() == 1);
  }

  SECTION("Never more loads than the cap")
  {
    GridOptimizerOptions options = fx.options;
    options.maxConcurrentCells = 2;

    GridOptimizer(options).run(fx.alerts, counting, space, pool);

    REQUIRE(counting.getPeak() >= 1);
    REQUIRE(counting.getPeak() <= 2);
  }
}

TEST_CASE("GridOptimizer isolates failing cells", "[GridOptimizer]")
{
  GridFixture fx;
  ParameterSpace space;
  space.tpSl.tpMult = RangeSpec::values({2.0});
  space.tpSl.slMult = RangeSpec::values({0.5, -0.2, 0.7});

  concurrency::ThreadPoolExecutor pool(2);
  const OptimizationRun run = GridOptimizer(fx.options).run(fx.alerts, fx.lookup, space, pool);

  REQUIRE(run.size() == 3);
  REQUIRE(run.failedCount() == 1);

  const OptimizationResult& failed = run.getResults()[1];
  REQUIRE(failed.isFailed());
  REQUIRE_FALSE(failed.policy.has_value());
  REQUIRE(failed.failure->find("sl_mult") != std::string::npos);

  const std::vector<OptimizationResult> ranked = run.rankBy(RankKey::ObjectiveScore);
  REQUIRE(ranked.back().cellIndex == 1);
  REQUIRE(run.getBest().has_value());
  REQUIRE_FALSE(run.getBest()->isFailed());
}

TEST_CASE("GridOptimizer rejects an unusable space before running", "[GridOptimizer]")
{
  GridFixture fx;
  ParameterSpace space;
  space.tpSl.intrabarOrders.clear();
  concurrency::SingleThreadExecutor inlineExecutor;

  REQUIRE_THROWS_AS(GridOptimizer(fx.options).run(fx.alerts, fx.lookup, space, inlineExecutor),
		    ParameterSpaceException);
}

TEST_CASE("GridOptimizer with no usable alerts scores zero", "[GridOptimizer]")
{
  GridFixture fx;
  concurrency::SingleThreadExecutor inlineExecutor;
  const std::vector<Alert> gaps{makeAlert("GONE", 1), makeAlert("NOWHERE", 1)};

  const OptimizationRun run = GridOptimizer(fx.options).run(gaps, fx.lookup, ParameterSpace(), inlineExecutor);

  REQUIRE(run.failedCount() == 0);
  for (const OptimizationResult& r : run.getResults())
    {
      REQUIRE(r.summary.alertsOk == 0);
      REQUIRE(r.objective.confidence == 0.0);
      REQUIRE(r.objective.finalScore == 0.0);
    }
}
