#pragma once

#include "Candle.h"
#include "EvaluationDeadline.h"
#include "PathMetrics.h"

namespace alertbt
{
  using boost::posix_time::ptime;

  /**
   * @brief Derives ATH, tier timing and drawdown statistics from one alert's
   * candle window in a single forward scan.
   *
   * The scan keeps the running maximum high, the running minimum low, and the
   * first-touch candle index of each ladder tier. Windows anchored on a touch
   * ("before tier", "after tier", tier bands, post-ATH) are accumulated as the
   * scan passes them, so no candle is visited twice.
   */
  class PathMetricsCalculator
  {
  public:
    // Relative tolerance under which two highs are treated as the same ATH
    static constexpr double kAthTolerance = 1e-12;

    PathMetricsCalculator() = default;

    /**
     * @brief Compute metrics with time offsets measured from @p entryTime.
     * @throws AlertBacktestException if the series is malformed
     * @throws EvaluationLimitException if @p deadline expires mid-scan
     */
    PathMetrics compute(double entryPrice,
			const CandleSeries& candles,
			const ptime& entryTime,
			const EvaluationDeadline* deadline = nullptr) const;

    /** Same as above, offsets measured from the first candle's time. */
    PathMetrics compute(double entryPrice, const CandleSeries& candles) const;
  };
}
