#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "RunSummary.h"

namespace alertbt
{
  /**
   * @brief Which summary value anchors the objective.
   *
   *  - Blend       : avgRWeight * avg_r + totalRWeight * total_r
   *  - AvgR        : avg_r
   *  - TotalR      : total_r
   *  - ExpectancyR : win_rate * avg_r_win + (1 - win_rate) * avg_r_loss
   */
  enum class PrimaryMetric
    {
      Blend,
      AvgR,
      TotalR,
      ExpectancyR
    };

  /**
   * @brief How the right tail of the ATH-multiple distribution is rewarded.
   */
  enum class TailBonusMetric
    {
      Spread,        // p75Weight * (p75 - median) + p95Weight * (p95 - p75)
      LogP95,        // log(max(p95, 1))
      P95MinusP75,   // max(0, p95 - p75)
      P95Ratio       // p95 / p75 - 1
    };

  std::string primaryMetricToString(PrimaryMetric metric);
  PrimaryMetric primaryMetricFromString(const std::string& text);
  std::string tailBonusMetricToString(TailBonusMetric metric);
  TailBonusMetric tailBonusMetricFromString(const std::string& text);

  /**
   * @brief Named weights and thresholds of the objective function.
   */
  struct ObjectiveConfig
  {
    PrimaryMetric primaryMetric = PrimaryMetric::Blend;
    double avgRWeight = 1.0;
    double totalRWeight = 0.0;

    // Drawdown penalty on |dd_pre2x_median|: exp(k * max(0, |dd| - threshold)) - 1
    double ddPenaltyThreshold = 0.30;
    double ddPenaltyK = 5.0;
    double ddBrutalThreshold = 0.60;     // penalty *= 1 + multiplier * (|dd| - brutal)
    double ddBrutalMultiplier = 10.0;
    double ddPenaltyWeight = 1.0;

    // Time boost: maxBoost / (1 + t2x_minutes / halfLife)
    double timeBoostMax = 0.5;
    double timeBoostHalfLifeMinutes = 60.0;
    double timeBoostWeight = 0.3;

    // Discipline bonus: pct_hit_2x >= threshold and |dd_pre2x_median| <= threshold
    double disciplineHitRate2x = 0.30;
    double disciplineMaxDrawdown = 0.30;
    double disciplineBonus = 0.10;

    TailBonusMetric tailBonusMetric = TailBonusMetric::Spread;
    double tailBonusWeight = 0.10;
    double tailP75Weight = 0.5;
    double tailP95Weight = 1.0;

    // Win-rate floor: exp(k * (min - wr)) - 1 below min
    double minWinRate = 0.20;
    double winRatePenaltyK = 5.0;
    double winRatePenaltyWeight = 0.0;

    // Implied loss R drift: k * max(0, |avg_r_loss - expected| - tolerance)
    double expectedLossR = -1.0;
    double lossRTolerance = 0.3;
    double lossRPenaltyK = 2.0;
    double lossRPenaltyWeight = 0.0;

    // Sample-size shrinkage: sqrt(n / (n + k))
    double confidenceK = 10.0;

    /** @return list of problems, empty when the configuration is usable */
    std::vector<std::string> validate() const;

    static ObjectiveConfig preset(const std::string& name);
  };

  /**
   * @brief Breakdown of one objective evaluation. finalScore is
   * confidence * rawScore.
   */
  struct ObjectiveComponents
  {
    double baseValue = 0.0;
    double ddPenalty = 0.0;
    double timeBoost = 0.0;
    double disciplineBonus = 0.0;
    double tailBonus = 0.0;
    double winRatePenalty = 0.0;
    double lossRPenalty = 0.0;
    double confidence = 0.0;
    double rawScore = 0.0;
    double finalScore = 0.0;
  };

  /**
   * @brief Maps a RunSummary to a single ranking scalar.
   *
   * score = confidence * (base + timeBoost * w_t + discipline + tail
   *                       - ddPenalty * w_dd - winRatePenalty * w_wr - lossRPenalty * w_lr)
   *
   * A summary without eligible trades scores exactly 0 with confidence 0.
   */
  class ObjectiveScorer
  {
  public:
    explicit ObjectiveScorer(const ObjectiveConfig& config = ObjectiveConfig());

    ObjectiveComponents score(const RunSummary& summary) const;

    const ObjectiveConfig& getConfig() const
    {
      return mConfig;
    }

    static double drawdownPenalty(double drawdown, const ObjectiveConfig& config);
    static double timeBoost(double timeTo2xMinutes, const ObjectiveConfig& config);
    static double tailBonus(double medianAth, double p75Ath, double p95Ath,
			    const ObjectiveConfig& config);
    static double winRatePenalty(double winRate, const ObjectiveConfig& config);
    static double lossRPenalty(double avgLossR, const ObjectiveConfig& config);
    static double confidence(std::size_t sampleCount, const ObjectiveConfig& config);

  private:
    double baseValue(const RunSummary& summary) const;

    ObjectiveConfig mConfig;
  };
}
