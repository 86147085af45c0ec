// BatchRunnerTest.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <stdexcept>

#include "BatchRunner.h"
#include "ParallelExecutors.h"
#include "TestUtils.h"

using namespace alertbt;
using namespace alertbt::test;
using Catch::Approx;

namespace
{
  // Delegates to an in-memory store but fails for one token
  class FailingCandleLookup : public ICandleLookup
  {
  public:
    FailingCandleLookup(const ICandleLookup& inner, const std::string& failingToken)
      : mInner(inner),
	mFailingToken(failingToken)
    {}

    CandleSeries loadCandles(const std::string& tokenId,
			     const ptime& start,
			     const ptime& end,
			     long intervalSeconds) const override
    {
      if (tokenId == mFailingToken)
	throw std::runtime_error("candle store unavailable");
      return mInner.loadCandles(tokenId, start, end, intervalSeconds);
    }

  private:
    const ICandleLookup& mInner;
    std::string mFailingToken;
  };

  InMemoryCandleLookup makeLookup()
  {
    InMemoryCandleLookup lookup;
    // Winner: reaches 2x on the third candle
    lookup.addCandles("WIN", makeSeries({{1.0, 1.0}, {1.5, 0.95}, {2.2, 1.4}, {1.8, 1.6}}, 1.0, 1));
    // Loser: stopped out
    lookup.addCandles("LOSE", makeSeries({{1.05, 0.9}, {0.9, 0.4}, {0.6, 0.5}}, 1.0, 1));
    // Single candle: not enough data
    lookup.addCandles("THIN", makeSeries({{1.1, 0.9}}, 1.0, 1));
    // Zero open on the first candle
    lookup.addCandles("ZERO", makeSeries({{1.1, 0.9}, {1.2, 1.0}}, 0.0, 1));
    // High below low on the second candle
    lookup.addCandles("BROKEN", {makeCandle(1, 1.0, 1.1, 0.9, 1.0), makeCandle(2, 1.0, 0.8, 1.2, 1.0)});
    return lookup;
  }
}

TEST_CASE("BatchRunner windows", "[BatchRunner]")
{
  const InMemoryCandleLookup lookup = makeLookup();
  const BatchRunner runner(lookup, 60, 1.0);

  SECTION("Entry is the alert time rounded up to the candle interval")
  {
    const Alert alert("WIN", minutesAfterBase(0) + boost::posix_time::seconds(30));
    const AlertWindow window = runner.prepareWindow(alert);

    REQUIRE(window.entryTime == minutesAfterBase(1));
    REQUIRE(window.endTime == minutesAfterBase(61));
    REQUIRE(window.candles.size() == 4);
    REQUIRE(window.loadError.empty());
  }

  SECTION("An alert on a boundary enters at that candle")
  {
    const AlertWindow window = runner.prepareWindow(makeAlert("WIN", 2));
    REQUIRE(window.entryTime == minutesAfterBase(2));
    REQUIRE(window.candles.size() == 3);
  }

  SECTION("The horizon bounds the window")
  {
    const BatchRunner shortRunner(lookup, 60, 2.0 / 60.0);
    const AlertWindow window = shortRunner.prepareWindow(makeAlert("WIN", 1));
    REQUIRE(window.candles.size() == 2);
  }

  SECTION("Invalid interval or horizon is rejected")
  {
    REQUIRE_THROWS_AS(BatchRunner(lookup, 0, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(BatchRunner(lookup, 60, 0.0), std::invalid_argument);
  }
}

TEST_CASE("BatchRunner per-alert outcomes", "[BatchRunner]")
{
  const InMemoryCandleLookup lookup = makeLookup();
  const BatchRunner runner(lookup, 60, 1.0);
  const PolicyConfig policy(2.0, 0.5);

  const std::vector<Alert> alerts{makeAlert("WIN", 1), makeAlert("LOSE", 1), makeAlert("NONE", 1),
				  makeAlert("THIN", 1), makeAlert("ZERO", 1), makeAlert("BROKEN", 1)};
  const std::vector<AlertResult> rows = runner.run(alerts, policy);

  REQUIRE(rows.size() == alerts.size());
  for (std::size_t i = 0; i < rows.size(); ++i)
    REQUIRE(rows[i].alert.getTokenId() == alerts[i].getTokenId());

  SECTION("Winner exits at the target")
  {
    REQUIRE(rows[0].isOk());
    REQUIRE(rows[0].entryPrice == 1.0);
    REQUIRE(rows[0].exit.has_value());
    REQUIRE(rows[0].exit->reason == ExitReason::TakeProfit);
    REQUIRE(rows[0].metrics.tierReached(2.0));
  }

  SECTION("Loser exits at the stop")
  {
    REQUIRE(rows[1].isOk());
    REQUIRE(rows[1].exit->reason == ExitReason::StopLoss);
    REQUIRE(rows[1].exit->rMultiple < -1.0);
  }

  SECTION("Coverage gaps are Missing, not errors")
  {
    REQUIRE(rows[2].status == AlertStatus::Missing);
    REQUIRE_FALSE(rows[2].entryPrice.has_value());
    REQUIRE(rows[3].status == AlertStatus::Missing);
    REQUIRE_FALSE(rows[3].exit.has_value());
  }

  SECTION("Non-positive entry is BadEntry")
  {
    REQUIRE(rows[4].status == AlertStatus::BadEntry);
    REQUIRE_FALSE(rows[4].exit.has_value());
  }

  SECTION("Malformed candles become an Error row")
  {
    REQUIRE(rows[5].status == AlertStatus::Error);
    REQUIRE_FALSE(rows[5].errorMessage.empty());
  }

  SECTION("Status counts cover every row")
  {
    const StatusCounts counts = countStatuses(rows);
    REQUIRE(counts.ok == 2);
    REQUIRE(counts.missing == 2);
    REQUIRE(counts.badEntry == 1);
    REQUIRE(counts.error == 1);
  }
}

TEST_CASE("BatchRunner isolates lookup failures", "[BatchRunner]")
{
  const InMemoryCandleLookup inner = makeLookup();
  const FailingCandleLookup lookup(inner, "LOSE");
  const BatchRunner runner(lookup, 60, 1.0);

  const std::vector<AlertResult> rows = runner.run({makeAlert("WIN", 1), makeAlert("LOSE", 1)},
						   PolicyConfig(2.0, 0.5));

  REQUIRE(rows[0].isOk());
  REQUIRE(rows[1].status == AlertStatus::Error);
  REQUIRE(rows[1].errorMessage.find("candle store unavailable") != std::string::npos);
}

TEST_CASE("BatchRunner evaluation limits", "[BatchRunner]")
{
  const InMemoryCandleLookup lookup = makeLookup();

  SECTION("Too many candles marks the alert Error")
  {
    const BatchRunner runner(lookup, 60, 1.0, EvaluationLimits(3));
    const std::vector<AlertResult> rows = runner.run({makeAlert("WIN", 1), makeAlert("LOSE", 1)},
						     PolicyConfig(2.0, 0.5));

    REQUIRE(rows[0].status == AlertStatus::Error);
    REQUIRE(rows[1].isOk());
  }

  SECTION("An unspent millisecond budget keeps the alert Ok")
  {
    const BatchRunner runner(lookup, 60, 1.0, EvaluationLimits(0, 60000));
    const std::vector<AlertResult> rows = runner.run({makeAlert("WIN", 1)}, PolicyConfig(2.0, 0.5));
    REQUIRE(rows[0].isOk());
    REQUIRE(rows[0].exit.has_value());
  }

  SECTION("Zero means unbounded")
  {
    const BatchRunner runner(lookup, 60, 1.0, EvaluationLimits(0, 0));
    const std::vector<AlertResult> rows = runner.run({makeAlert("WIN", 1)}, PolicyConfig(2.0, 0.5));
    REQUIRE(rows[0].isOk());
  }
}

TEST_CASE("BatchRunner parallel evaluation matches sequential", "[BatchRunner]")
{
  InMemoryCandleLookup lookup;
  std::vector<Alert> alerts;
  for (int i = 0; i < 40; ++i)
    {
      const std::string token = "T" + std::to_string(i);
      const double peak = 1.0 + 0.05 * i;
      lookup.addCandles(token, makeSeries({{1.0, 0.95}, {peak, 0.9}, {peak * 0.9, 0.7 + 0.005 * i}}, 1.0, 1));
      alerts.push_back(makeAlert(token, 1));
    }

  const BatchRunner runner(lookup, 60, 1.0);
  const PolicyConfig policy(1.5, 0.8);

  concurrency::ThreadPoolExecutor pool(4);
  const std::vector<AlertResult> parallel = runner.run(alerts, policy, pool);
  const std::vector<AlertResult> sequential = runner.run(alerts, policy);

  REQUIRE(parallel.size() == sequential.size());
  for (std::size_t i = 0; i < parallel.size(); ++i)
    {
      REQUIRE(parallel[i].alert.getTokenId() == sequential[i].alert.getTokenId());
      REQUIRE(parallel[i].status == sequential[i].status);
      REQUIRE(parallel[i].exit->reason == sequential[i].exit->reason);
      REQUIRE(parallel[i].exit->netReturn == sequential[i].exit->netReturn);
    }
}
