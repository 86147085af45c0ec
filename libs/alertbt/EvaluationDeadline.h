#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "AlertBacktestException.h"

namespace alertbt
{
  /**
   * @brief Wall-clock budget for evaluating one alert.
   *
   * Candle scans call checkAt() with the candle index; the clock is read once
   * every kCheckInterval candles. A limit of 0 or less never expires.
   */
  class EvaluationDeadline
  {
  public:
    static constexpr std::size_t kCheckInterval = 64;

    explicit EvaluationDeadline(long maxMillis)
      : EvaluationDeadline(maxMillis, std::chrono::steady_clock::now())
    {}

    EvaluationDeadline(long maxMillis, std::chrono::steady_clock::time_point start)
      : mMaxMillis(maxMillis),
	mStart(start)
    {}

    /**
     * @throws EvaluationLimitException once the budget is spent
     */
    void check(const char* stage) const
    {
      if (mMaxMillis <= 0)
	return;

      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
	std::chrono::steady_clock::now() - mStart).count();
      if (elapsed > mMaxMillis)
	throw EvaluationLimitException("Evaluation exceeded " + std::to_string(mMaxMillis) +
				       " ms during " + stage);
    }

    void checkAt(std::size_t candleIndex, const char* stage) const
    {
      if (candleIndex % kCheckInterval == 0)
	check(stage);
    }

    long getMaxMillis() const
    {
      return mMaxMillis;
    }

  private:
    long mMaxMillis;
    std::chrono::steady_clock::time_point mStart;
  };
}
