#pragma once

#include <cstddef>
#include <vector>

#include "BatchRunner.h"
#include "PolicyConfig.h"
#include "RunSummary.h"

namespace alertbt
{
  /**
   * @brief Reduces the per-alert rows of one policy run to a RunSummary.
   *
   * Medians sort a copy of the sample; percentiles are sorted[min(floor(n*p), n-1)].
   * Raw win/loss statistics count ret > 0 as a win and ret < 0 as a loss.
   */
  class Summarizer
  {
  public:
    static constexpr double kDefaultRiskPerTrade = 0.02;
    static constexpr std::size_t kDefaultMinTrades = 5;

    explicit Summarizer(double riskPerTrade = kDefaultRiskPerTrade);

    RunSummary summarize(const std::vector<AlertResult>& rows, const PolicyConfig& policy) const;

    /**
     * Groups Ok rows by trimmed caller name, drops callers with fewer than
     * @p minTrades rows and sorts by risk-adjusted total return, best first.
     * Rows with an empty caller are ignored.
     */
    std::vector<CallerSummary> summarizeByCaller(const std::vector<AlertResult>& rows,
						 const PolicyConfig& policy,
						 std::size_t minTrades = kDefaultMinTrades) const;

    double getRiskPerTrade() const
    {
      return mRiskPerTrade;
    }

  private:
    double mRiskPerTrade;
  };
}
