#include "BatchRunner.h"
#include "AlertBacktestException.h"
#include "EvaluationDeadline.h"
#include "Logger.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "TimeUtils.h"

#include <cmath>
#include <stdexcept>

namespace alertbt
{
  BatchRunner::BatchRunner(const ICandleLookup& candleLookup,
			   long intervalSeconds,
			   double horizonHours,
			   const EvaluationLimits& limits)
    : mCandleLookup(candleLookup),
      mIntervalSeconds(intervalSeconds),
      mHorizonHours(horizonHours),
      mLimits(limits),
      mMetricsCalculator(),
      mExitSimulator()
  {
    if (mIntervalSeconds <= 0)
      throw std::invalid_argument("BatchRunner: interval_seconds must be > 0");
    if (!std::isfinite(mHorizonHours) || mHorizonHours <= 0.0)
      throw std::invalid_argument("BatchRunner: horizon_hours must be > 0");
  }

  AlertWindow BatchRunner::prepareWindow(const Alert& alert) const
  {
    AlertWindow window(alert);

    try
      {
	window.entryTime = ceilToInterval(alert.getAlertTime(), mIntervalSeconds);
	const long horizonSeconds = static_cast<long>(std::llround(mHorizonHours * 3600.0));
	window.endTime = window.entryTime + boost::posix_time::seconds(horizonSeconds);
	window.candles = mCandleLookup.loadCandles(alert.getTokenId(), window.entryTime,
						   window.endTime, mIntervalSeconds);
      }
    catch (const std::exception& e)
      {
	window.loadError = e.what();
	ALERTBT_LOG_WARN("Candle lookup failed for {} at {}: {}", alert.getTokenId(),
			 toIsoString(alert.getAlertTime()), e.what());
      }

    return window;
  }

  std::vector<AlertWindow> BatchRunner::prepareWindows(const std::vector<Alert>& alerts,
						       concurrency::IParallelExecutor& executor) const
  {
    std::vector<AlertWindow> windows;
    windows.reserve(alerts.size());
    for (const Alert& a : alerts)
      windows.emplace_back(a);

    concurrency::parallel_for(alerts.size(), executor,
			      [this, &alerts, &windows](std::size_t i) {
				windows[i] = prepareWindow(alerts[i]);
			      });

    return windows;
  }

  AlertResult BatchRunner::evaluate(const AlertWindow& window, const PolicyConfig& policy) const
  {
    AlertResult result(window.alert);
    result.entryTime = window.entryTime;

    if (!window.loadError.empty())
      {
	result.status = AlertStatus::Error;
	result.metrics.status = AlertStatus::Error;
	result.errorMessage = window.loadError;
	return result;
      }

    try
      {
	const EvaluationDeadline deadline(mLimits.getMaxEvalMillis());
	const CandleSeries& candles = window.candles;

	if (mLimits.getMaxCandles() > 0 && candles.size() > mLimits.getMaxCandles())
	  throw EvaluationLimitException("Window holds " + std::to_string(candles.size()) +
					 " candles, limit is " + std::to_string(mLimits.getMaxCandles()));

	const double entryPrice = candles.empty() ? 0.0 : candles.front().getOpen();
	if (!candles.empty())
	  result.entryPrice = entryPrice;

	result.metrics = mMetricsCalculator.compute(entryPrice, candles, window.entryTime, &deadline);

	if (result.metrics.isOk())
	  result.exit = mExitSimulator.simulate(entryPrice, candles, policy, window.entryTime, &deadline);

	result.status = result.metrics.status;
      }
    catch (const std::exception& e)
      {
	result.status = AlertStatus::Error;
	result.metrics.status = AlertStatus::Error;
	result.exit.reset();
	result.errorMessage = e.what();
	ALERTBT_LOG_ERROR("Alert {} at {} failed: {}", window.alert.getTokenId(),
			  toIsoString(window.alert.getAlertTime()), e.what());
      }

    return result;
  }

  std::vector<AlertResult> BatchRunner::evaluateWindows(const std::vector<AlertWindow>& windows,
							const PolicyConfig& policy,
							concurrency::IParallelExecutor& executor) const
  {
    std::vector<AlertResult> results;
    results.reserve(windows.size());
    for (const AlertWindow& w : windows)
      results.emplace_back(w.alert);

    concurrency::parallel_for(windows.size(), executor,
			      [this, &windows, &results, &policy](std::size_t i) {
				results[i] = evaluate(windows[i], policy);
			      });

    const StatusCounts counts = countStatuses(results);
    ALERTBT_LOG_DEBUG("Batch [{}]: {} alerts, ok={} missing={} bad_entry={} error={}",
		      policy.describe(), results.size(), counts.ok, counts.missing,
		      counts.badEntry, counts.error);

    return results;
  }

  std::vector<AlertResult> BatchRunner::run(const std::vector<Alert>& alerts,
					    const PolicyConfig& policy,
					    concurrency::IParallelExecutor& executor) const
  {
    return evaluateWindows(prepareWindows(alerts, executor), policy, executor);
  }

  std::vector<AlertResult> BatchRunner::run(const std::vector<Alert>& alerts,
					    const PolicyConfig& policy) const
  {
    concurrency::SingleThreadExecutor inlineExecutor;
    return run(alerts, policy, inlineExecutor);
  }

  StatusCounts countStatuses(const std::vector<AlertResult>& rows)
  {
    StatusCounts counts;
    for (const AlertResult& r : rows)
      {
	switch (r.status)
	  {
	  case AlertStatus::Ok:
	    ++counts.ok;
	    break;
	  case AlertStatus::Missing:
	    ++counts.missing;
	    break;
	  case AlertStatus::BadEntry:
	    ++counts.badEntry;
	    break;
	  case AlertStatus::Error:
	    ++counts.error;
	    break;
	  }
      }
    return counts;
  }
}
