#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Alert.h"
#include "Candle.h"
#include "DataSources.h"
#include "ExitPolicySimulator.h"
#include "PathMetrics.h"
#include "PathMetricsCalculator.h"
#include "PolicyConfig.h"
#include "IParallelExecutor.h"

namespace alertbt
{
  using boost::posix_time::ptime;

  /**
   * @brief Caller-supplied budget for a single alert's evaluation. Zero means
   * unbounded. Exceeding either budget marks the alert Error.
   */
  class EvaluationLimits
  {
  public:
    explicit EvaluationLimits(std::size_t maxCandles = 0, long maxEvalMillis = 0)
      : mMaxCandles(maxCandles),
	mMaxEvalMillis(maxEvalMillis)
    {}

    std::size_t getMaxCandles() const
    {
      return mMaxCandles;
    }

    long getMaxEvalMillis() const
    {
      return mMaxEvalMillis;
    }

  private:
    std::size_t mMaxCandles;
    long mMaxEvalMillis;
  };

  /**
   * @brief An alert together with its loaded candle window. Windows are loaded
   * once and can be evaluated under many policies.
   */
  struct AlertWindow
  {
    explicit AlertWindow(const Alert& a)
      : alert(a)
    {}

    Alert alert;
    ptime entryTime;
    ptime endTime;
    CandleSeries candles;
    std::string loadError;
  };

  /**
   * @brief One per-alert result row of a policy run.
   */
  struct AlertResult
  {
    explicit AlertResult(const Alert& a)
      : alert(a)
    {}

    Alert alert;
    AlertStatus status = AlertStatus::Missing;
    ptime entryTime;
    std::optional<double> entryPrice;
    PathMetrics metrics;
    std::optional<ExitOutcome> exit;
    std::string errorMessage;

    bool isOk() const
    {
      return status == AlertStatus::Ok;
    }
  };

  /**
   * @brief Applies PathMetricsCalculator and ExitPolicySimulator to every alert
   * of a run under one PolicyConfig.
   *
   * Entry time is the alert time rounded up to the candle interval; the window
   * is [entry, entry + horizon) and the entry price is the first candle's open.
   * A failure in one alert (lookup error, malformed candles, exceeded limits)
   * becomes an Error row; it never aborts the batch.
   */
  class BatchRunner
  {
  public:
    BatchRunner(const ICandleLookup& candleLookup,
		long intervalSeconds,
		double horizonHours,
		const EvaluationLimits& limits = EvaluationLimits());

    /** Load windows and evaluate sequentially on the calling thread. */
    std::vector<AlertResult> run(const std::vector<Alert>& alerts, const PolicyConfig& policy) const;

    /** Load windows and evaluate, dispatching alerts through @p executor. */
    std::vector<AlertResult> run(const std::vector<Alert>& alerts,
				 const PolicyConfig& policy,
				 concurrency::IParallelExecutor& executor) const;

    std::vector<AlertWindow> prepareWindows(const std::vector<Alert>& alerts,
					    concurrency::IParallelExecutor& executor) const;

    std::vector<AlertResult> evaluateWindows(const std::vector<AlertWindow>& windows,
					     const PolicyConfig& policy,
					     concurrency::IParallelExecutor& executor) const;

    /** Evaluate one prepared window. Never throws. */
    AlertResult evaluate(const AlertWindow& window, const PolicyConfig& policy) const;

    AlertWindow prepareWindow(const Alert& alert) const;

    long getIntervalSeconds() const
    {
      return mIntervalSeconds;
    }

    double getHorizonHours() const
    {
      return mHorizonHours;
    }

    const EvaluationLimits& getLimits() const
    {
      return mLimits;
    }

  private:
    const ICandleLookup& mCandleLookup;
    long mIntervalSeconds;
    double mHorizonHours;
    EvaluationLimits mLimits;
    PathMetricsCalculator mMetricsCalculator;
    ExitPolicySimulator mExitSimulator;
  };

  /** @brief Number of rows with each status, in AlertStatus order. */
  struct StatusCounts
  {
    std::size_t ok = 0;
    std::size_t missing = 0;
    std::size_t badEntry = 0;
    std::size_t error = 0;
  };

  StatusCounts countStatuses(const std::vector<AlertResult>& rows);
}
