#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include "ExitPolicySimulator.h"
#include "PathMetrics.h"

namespace alertbt
{
  constexpr std::size_t kExitReasonCount = 6;

  /**
   * @brief Aggregate statistics of one policy run.
   *
   * Only Ok rows contribute to the statistics; the status counters cover every
   * row. When no row is Ok, hasEligibleTrades() is false and every optional
   * statistic is empty.
   *
   * Returns are ratios unless the name ends in Pct (percent). R values are net
   * returns divided by the policy's maximum loss fraction.
   */
  struct RunSummary
  {
    std::size_t alertsTotal = 0;
    std::size_t alertsOk = 0;
    std::size_t alertsMissing = 0;
    std::size_t alertsBadEntry = 0;
    std::size_t alertsError = 0;

    std::optional<double> medianAthMult;
    std::optional<double> medianDdInitial;
    std::optional<double> medianDdOverall;
    std::optional<double> medianDdAfter2x;
    std::optional<double> medianDdAfter3x;
    std::optional<double> medianDdAfterAth;
    std::optional<double> medianPeakPnlPct;
    std::optional<double> medianRetEnd;
    std::optional<double> medianTimeTo2xSeconds;
    std::optional<double> medianTimeTo4xSeconds;

    // Fraction of Ok alerts that reached each ladder tier
    std::array<double, kTierCount> pctHitTier{};

    std::optional<double> p25AthMult;
    std::optional<double> p75AthMult;
    std::optional<double> p95AthMult;

    std::array<std::size_t, kExitReasonCount> exitReasonCounts{};

    // Raw returns at full position size
    double totalReturnPct = 0.0;
    double avgReturnPct = 0.0;
    double winRate = 0.0;
    double avgWinPct = 0.0;
    double avgLossPct = 0.0;
    double profitFactor = 0.0;       // +inf when there are profits and no losses
    double expectancyPct = 0.0;

    // Portfolio-level returns with position_size = risk_per_trade / max_loss_fraction
    double riskPerTradePct = 0.0;
    double positionSizePct = 0.0;
    double riskAdjTotalReturnPct = 0.0;
    double riskAdjAvgReturnPct = 0.0;
    double riskAdjAvgWinPct = 0.0;
    double riskAdjAvgLossPct = 0.0;

    double totalR = 0.0;
    double avgR = 0.0;
    double avgRWin = 0.0;
    double avgRLoss = 0.0;           // r <= 0 counts as a loss
    double rProfitFactor = 0.0;

    std::optional<double> ddPre2xMedian;      // median of dd_pre2x_or_horizon
    std::optional<double> timeTo2xMedianMin;

    bool hasEligibleTrades() const
    {
      return alertsOk > 0;
    }

    double pctHit(double multiple) const
    {
      return pctHitTier[tierIndex(multiple)];
    }

    std::size_t exitCount(ExitReason reason) const
    {
      return exitReasonCounts[static_cast<std::size_t>(reason)];
    }
  };

  /**
   * @brief Leaderboard entry: the summary of one caller's Ok alerts.
   */
  struct CallerSummary
  {
    std::string caller;
    RunSummary summary;
  };
}
