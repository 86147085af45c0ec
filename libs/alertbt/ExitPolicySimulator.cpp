#include "ExitPolicySimulator.h"
#include "CostModel.h"
#include "TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace alertbt
{
  std::string exitReasonToString(ExitReason reason)
  {
    switch (reason)
      {
      case ExitReason::TakeProfit:
	return "tp";
      case ExitReason::StopLoss:
	return "sl";
      case ExitReason::Trailing:
	return "trailing";
      case ExitReason::Breakeven:
	return "breakeven";
      case ExitReason::TimeStop:
	return "time_stop";
      case ExitReason::Horizon:
	return "horizon";
      }

    return "horizon";
  }

  ExitReason exitReasonFromString(const std::string& text)
  {
    if (text == "tp")
      return ExitReason::TakeProfit;
    if (text == "sl")
      return ExitReason::StopLoss;
    if (text == "trailing")
      return ExitReason::Trailing;
    if (text == "breakeven")
      return ExitReason::Breakeven;
    if (text == "time_stop")
      return ExitReason::TimeStop;
    if (text == "horizon")
      return ExitReason::Horizon;

    throw std::invalid_argument("Unknown exit reason: " + text);
  }

  std::size_t ExitPolicySimulator::evaluationWindowSize(const CandleSeries& candles,
							const PolicyConfig& policy,
							const ptime& entryTime)
  {
    if (!policy.getTimeStopHours())
      return candles.size();

    const long long stopSeconds = std::llround(*policy.getTimeStopHours() * 3600.0);
    const ptime cutoff = entryTime + boost::posix_time::seconds(static_cast<long>(stopSeconds));

    auto firstPastCutoff = std::find_if(candles.begin(), candles.end(),
					[&cutoff](const Candle& c) { return !(c.getTime() < cutoff); });

    const std::size_t inWindow = static_cast<std::size_t>(std::distance(candles.begin(), firstPastCutoff));

    // A time stop shorter than the first candle still evaluates that candle
    return std::max<std::size_t>(inWindow, 1);
  }

  ExitOutcome ExitPolicySimulator::simulate(double entryPrice,
					    const CandleSeries& candles,
					    const PolicyConfig& policy) const
  {
    if (candles.empty())
      throw std::invalid_argument("ExitPolicySimulator::simulate: empty candle series");

    return simulate(entryPrice, candles, policy, candles.front().getTime());
  }

  ExitOutcome ExitPolicySimulator::simulate(double entryPrice,
					    const CandleSeries& candles,
					    const PolicyConfig& policy,
					    const ptime& entryTime,
					    const EvaluationDeadline* deadline) const
  {
    if (candles.empty())
      throw std::invalid_argument("ExitPolicySimulator::simulate: empty candle series");
    if (!std::isfinite(entryPrice) || entryPrice <= 0.0)
      throw std::invalid_argument("ExitPolicySimulator::simulate: entry price must be > 0");

    const std::size_t windowSize = evaluationWindowSize(candles, policy, entryTime);
    const bool truncated = windowSize < candles.size();

    const double targetPrice = entryPrice * policy.getTpMult();
    const double fixedStop = entryPrice * policy.getSlMult();
    const auto& breakeven = policy.getBreakeven();
    const auto& trailing = policy.getTrailing();

    ExitOutcome outcome;
    double runningMaxHigh = -std::numeric_limits<double>::infinity();
    bool exited = false;

    for (std::size_t i = 0; i < windowSize && !exited; ++i)
      {
	if (deadline)
	  deadline->checkAt(i, "exit simulation");

	const Candle& c = candles[i];
	runningMaxHigh = std::max(runningMaxHigh, c.getHigh());
	const double gain = runningMaxHigh / entryPrice - 1.0;

	if (breakeven && gain >= breakeven->getTriggerPct())
	  outcome.breakevenActivated = true;
	if (trailing && gain >= trailing->getActivationPct())
	  outcome.trailingActivated = true;

	StopType stopType = StopType::Fixed;
	double stop = fixedStop;
	if (outcome.trailingActivated)
	  {
	    stopType = StopType::Trailing;
	    stop = runningMaxHigh * (1.0 - trailing->getDistancePct());
	  }
	else if (outcome.breakevenActivated)
	  {
	    stopType = StopType::Breakeven;
	    stop = entryPrice * (1.0 + breakeven->getOffsetPct());
	  }

	const bool hitStop = c.getLow() <= stop;
	const bool hitTarget = c.getHigh() >= targetPrice;
	if (!hitStop && !hitTarget)
	  continue;

	const bool targetWins = hitTarget &&
	  (!hitStop || policy.getIntrabarOrder() == IntrabarOrder::TpFirst);

	if (targetWins)
	  {
	    outcome.reason = ExitReason::TakeProfit;
	    outcome.exitPrice = targetPrice;
	    outcome.targetPrice = targetPrice;
	  }
	else
	  {
	    switch (stopType)
	      {
	      case StopType::Trailing:
		outcome.reason = ExitReason::Trailing;
		break;
	      case StopType::Breakeven:
		outcome.reason = ExitReason::Breakeven;
		break;
	      case StopType::Fixed:
		outcome.reason = ExitReason::StopLoss;
		break;
	      }
	    outcome.exitPrice = stop;
	    outcome.stopLevel = stop;
	  }

	outcome.exitCandleIndex = i;
	exited = true;
      }

    if (!exited)
      {
	outcome.reason = truncated ? ExitReason::TimeStop : ExitReason::Horizon;
	outcome.exitCandleIndex = windowSize - 1;
	outcome.exitPrice = candles[outcome.exitCandleIndex].getClose();
      }

    const Candle& exitCandle = candles[outcome.exitCandleIndex];
    outcome.exitTime = exitCandle.getTime();
    outcome.exitOffsetSeconds = secondsBetween(entryTime, exitCandle.getTime());
    outcome.maxHighBeforeExit = runningMaxHigh;
    outcome.netReturn = CostModel::netReturn(entryPrice, outcome.exitPrice,
					     policy.getFeeBps(), policy.getSlippageBps());
    outcome.rMultiple = outcome.netReturn / policy.getMaxLossFraction();

    return outcome;
  }
}
