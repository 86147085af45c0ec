#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "Candle.h"
#include "EvaluationDeadline.h"
#include "PolicyConfig.h"

namespace alertbt
{
  using boost::posix_time::ptime;

  /**
   * @brief Terminal state of the per-alert exit state machine.
   */
  enum class ExitReason
    {
      TakeProfit,
      StopLoss,
      Trailing,
      Breakeven,
      TimeStop,
      Horizon
    };

  std::string exitReasonToString(ExitReason reason);
  ExitReason exitReasonFromString(const std::string& text);

  /**
   * @brief Which stop level governed the candle that closed the trade.
   */
  enum class StopType
    {
      Fixed,
      Breakeven,
      Trailing
    };

  /**
   * @brief The single exit event of one alert under one policy.
   *
   * The reason-specific payload is carried alongside the reason:
   *  - stop exits (StopLoss/Breakeven/Trailing) set stopLevel to the level that filled
   *  - TakeProfit sets targetPrice
   *  - TimeStop and Horizon exit at the close of the last evaluated candle
   */
  struct ExitOutcome
  {
    ExitReason reason = ExitReason::Horizon;
    double exitPrice = 0.0;
    ptime exitTime;
    long exitOffsetSeconds = 0;
    std::size_t exitCandleIndex = 0;
    double netReturn = 0.0;
    double rMultiple = 0.0;

    std::optional<double> stopLevel;
    std::optional<double> targetPrice;
    double maxHighBeforeExit = 0.0;
    bool breakevenActivated = false;
    bool trailingActivated = false;

    bool isStopExit() const
    {
      return reason == ExitReason::StopLoss || reason == ExitReason::Breakeven ||
	reason == ExitReason::Trailing;
    }
  };

  /**
   * @brief Causal take-profit / stop-loss simulator with optional time-stop,
   * break-even and trailing-stop extensions.
   *
   * Candles are processed strictly in order. On each candle the running maximum
   * high (including the current candle) determines whether break-even and
   * trailing stops are active; the effective stop is the trailing level when
   * trailing is active, else the break-even level when break-even is active,
   * else entry * sl_mult. The first candle whose low reaches the effective stop
   * or whose high reaches the target ends the trade. When both happen on one
   * candle the policy's IntrabarOrder decides.
   */
  class ExitPolicySimulator
  {
  public:
    ExitPolicySimulator() = default;

    /**
     * @throws std::invalid_argument for an empty series or a non-positive entry
     * @throws EvaluationLimitException if @p deadline expires mid-scan
     */
    ExitOutcome simulate(double entryPrice,
			 const CandleSeries& candles,
			 const PolicyConfig& policy,
			 const ptime& entryTime,
			 const EvaluationDeadline* deadline = nullptr) const;

    /** Offsets measured from the first candle's time. */
    ExitOutcome simulate(double entryPrice,
			 const CandleSeries& candles,
			 const PolicyConfig& policy) const;

  private:
    static std::size_t evaluationWindowSize(const CandleSeries& candles,
					    const PolicyConfig& policy,
					    const ptime& entryTime);
  };
}
