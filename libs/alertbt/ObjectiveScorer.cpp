#include "ObjectiveScorer.h"
#include "AlertBacktestException.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace alertbt
{
  std::string primaryMetricToString(PrimaryMetric metric)
  {
    switch (metric)
      {
      case PrimaryMetric::Blend:
	return "blend";
      case PrimaryMetric::AvgR:
	return "avg_r";
      case PrimaryMetric::TotalR:
	return "total_r";
      case PrimaryMetric::ExpectancyR:
	return "expectancy_r";
      }
    return "blend";
  }

  PrimaryMetric primaryMetricFromString(const std::string& text)
  {
    if (text == "blend")
      return PrimaryMetric::Blend;
    if (text == "avg_r")
      return PrimaryMetric::AvgR;
    if (text == "total_r")
      return PrimaryMetric::TotalR;
    if (text == "expectancy_r")
      return PrimaryMetric::ExpectancyR;

    throw ConfigurationException("Unknown primary_metric: " + text);
  }

  std::string tailBonusMetricToString(TailBonusMetric metric)
  {
    switch (metric)
      {
      case TailBonusMetric::Spread:
	return "spread";
      case TailBonusMetric::LogP95:
	return "log_p95";
      case TailBonusMetric::P95MinusP75:
	return "p95_minus_p75";
      case TailBonusMetric::P95Ratio:
	return "p95_ratio";
      }
    return "spread";
  }

  TailBonusMetric tailBonusMetricFromString(const std::string& text)
  {
    if (text == "spread")
      return TailBonusMetric::Spread;
    if (text == "log_p95")
      return TailBonusMetric::LogP95;
    if (text == "p95_minus_p75")
      return TailBonusMetric::P95MinusP75;
    if (text == "p95_ratio")
      return TailBonusMetric::P95Ratio;

    throw ConfigurationException("Unknown tail_bonus_metric: " + text);
  }

  std::vector<std::string> ObjectiveConfig::validate() const
  {
    std::vector<std::string> errors;

    auto requireNonNegative = [&errors](double v, const char* name) {
      if (!std::isfinite(v) || v < 0.0)
	errors.push_back(std::string(name) + " must be finite and >= 0");
    };

    requireNonNegative(avgRWeight, "avg_r_weight");
    requireNonNegative(totalRWeight, "total_r_weight");
    requireNonNegative(ddPenaltyThreshold, "dd_penalty_threshold");
    requireNonNegative(ddPenaltyK, "dd_penalty_k");
    requireNonNegative(ddBrutalMultiplier, "dd_brutal_multiplier");
    requireNonNegative(ddPenaltyWeight, "dd_penalty_weight");
    requireNonNegative(timeBoostMax, "time_boost_max");
    requireNonNegative(timeBoostWeight, "time_boost_weight");
    requireNonNegative(disciplineBonus, "discipline_bonus");
    requireNonNegative(tailBonusWeight, "tail_bonus_weight");
    requireNonNegative(tailP75Weight, "tail_p75_weight");
    requireNonNegative(tailP95Weight, "tail_p95_weight");
    requireNonNegative(winRatePenaltyK, "win_rate_penalty_k");
    requireNonNegative(winRatePenaltyWeight, "win_rate_penalty_weight");
    requireNonNegative(lossRTolerance, "loss_r_tolerance");
    requireNonNegative(lossRPenaltyK, "loss_r_penalty_k");
    requireNonNegative(lossRPenaltyWeight, "loss_r_penalty_weight");

    if (ddBrutalThreshold < ddPenaltyThreshold)
      errors.push_back("dd_brutal_threshold must be >= dd_penalty_threshold");
    if (!(timeBoostHalfLifeMinutes > 0.0))
      errors.push_back("time_boost_half_life_minutes must be > 0");
    if (!(confidenceK > 0.0) || !std::isfinite(confidenceK))
      errors.push_back("confidence_k must be > 0");
    if (minWinRate < 0.0 || minWinRate > 1.0)
      errors.push_back("min_win_rate must be in [0, 1]");
    if (disciplineHitRate2x < 0.0 || disciplineHitRate2x > 1.0)
      errors.push_back("discipline_hit_rate_2x must be in [0, 1]");

    return errors;
  }

  ObjectiveConfig ObjectiveConfig::preset(const std::string& name)
  {
    ObjectiveConfig config;

    if (name == "default")
      return config;

    if (name == "conservative")
      {
	config.ddPenaltyThreshold = 0.20;
	config.ddPenaltyK = 8.0;
	config.minWinRate = 0.30;
	config.tailBonusWeight = 0.05;
	return config;
      }

    if (name == "aggressive")
      {
	config.ddPenaltyThreshold = 0.40;
	config.ddPenaltyK = 3.0;
	config.ddBrutalThreshold = 0.70;
	config.minWinRate = 0.15;
	config.tailBonusWeight = 0.2;
	return config;
      }

    throw ConfigurationException("Unknown objective preset: " + name);
  }

  ObjectiveScorer::ObjectiveScorer(const ObjectiveConfig& config)
    : mConfig(config)
  {
    const std::vector<std::string> errors = mConfig.validate();
    if (!errors.empty())
      {
	std::ostringstream msg;
	msg << "Invalid objective configuration:";
	for (const std::string& e : errors)
	  msg << " " << e << ";";
	throw ConfigurationException(msg.str());
      }
  }

  double ObjectiveScorer::drawdownPenalty(double drawdown, const ObjectiveConfig& config)
  {
    if (!std::isfinite(drawdown))
      return 0.0;

    const double magnitude = std::fabs(drawdown);
    if (magnitude <= config.ddPenaltyThreshold)
      return 0.0;

    double penalty = std::exp(config.ddPenaltyK * (magnitude - config.ddPenaltyThreshold)) - 1.0;
    if (magnitude > config.ddBrutalThreshold)
      penalty *= 1.0 + config.ddBrutalMultiplier * (magnitude - config.ddBrutalThreshold);

    return penalty;
  }

  double ObjectiveScorer::timeBoost(double timeTo2xMinutes, const ObjectiveConfig& config)
  {
    if (!std::isfinite(timeTo2xMinutes) || timeTo2xMinutes < 0.0)
      return 0.0;

    return config.timeBoostMax / (1.0 + timeTo2xMinutes / config.timeBoostHalfLifeMinutes);
  }

  double ObjectiveScorer::tailBonus(double medianAth, double p75Ath, double p95Ath,
				    const ObjectiveConfig& config)
  {
    if (!std::isfinite(p95Ath) || p95Ath <= 0.0)
      return 0.0;

    switch (config.tailBonusMetric)
      {
      case TailBonusMetric::Spread:
	return config.tailBonusWeight *
	  (config.tailP75Weight * std::max(0.0, p75Ath - medianAth) +
	   config.tailP95Weight * std::max(0.0, p95Ath - p75Ath));

      case TailBonusMetric::LogP95:
	return std::log(std::max(p95Ath, 1.0)) * config.tailBonusWeight;

      case TailBonusMetric::P95MinusP75:
	return std::max(0.0, p95Ath - p75Ath) * config.tailBonusWeight;

      case TailBonusMetric::P95Ratio:
	if (p75Ath > 0.0)
	  return (p95Ath / p75Ath - 1.0) * config.tailBonusWeight;
	return 0.0;
      }

    return 0.0;
  }

  double ObjectiveScorer::winRatePenalty(double winRate, const ObjectiveConfig& config)
  {
    if (winRate >= config.minWinRate)
      return 0.0;

    return std::exp(config.winRatePenaltyK * (config.minWinRate - winRate)) - 1.0;
  }

  double ObjectiveScorer::lossRPenalty(double avgLossR, const ObjectiveConfig& config)
  {
    // No losing trades: nothing to check
    if (avgLossR == 0.0 || !std::isfinite(avgLossR))
      return 0.0;

    const double drift = std::fabs(avgLossR - config.expectedLossR);
    if (drift <= config.lossRTolerance)
      return 0.0;

    return (drift - config.lossRTolerance) * config.lossRPenaltyK;
  }

  double ObjectiveScorer::confidence(std::size_t sampleCount, const ObjectiveConfig& config)
  {
    if (sampleCount == 0)
      return 0.0;

    const double n = static_cast<double>(sampleCount);
    return std::sqrt(n / (n + config.confidenceK));
  }

  double ObjectiveScorer::baseValue(const RunSummary& summary) const
  {
    switch (mConfig.primaryMetric)
      {
      case PrimaryMetric::Blend:
	return mConfig.avgRWeight * summary.avgR + mConfig.totalRWeight * summary.totalR;
      case PrimaryMetric::AvgR:
	return summary.avgR;
      case PrimaryMetric::TotalR:
	return summary.totalR;
      case PrimaryMetric::ExpectancyR:
	return summary.winRate * summary.avgRWin + (1.0 - summary.winRate) * summary.avgRLoss;
      }
    return summary.avgR;
  }

  ObjectiveComponents ObjectiveScorer::score(const RunSummary& summary) const
  {
    ObjectiveComponents c;
    if (!summary.hasEligibleTrades())
      return c;

    c.baseValue = baseValue(summary);

    const double dd = summary.ddPre2xMedian.value_or(0.0);
    c.ddPenalty = drawdownPenalty(dd, mConfig);

    if (summary.timeTo2xMedianMin)
      c.timeBoost = timeBoost(*summary.timeTo2xMedianMin, mConfig);

    if (summary.pctHit(2.0) >= mConfig.disciplineHitRate2x &&
	std::fabs(dd) <= mConfig.disciplineMaxDrawdown)
      c.disciplineBonus = mConfig.disciplineBonus;

    if (summary.medianAthMult && summary.p75AthMult && summary.p95AthMult)
      c.tailBonus = tailBonus(*summary.medianAthMult, *summary.p75AthMult,
			      *summary.p95AthMult, mConfig);

    c.winRatePenalty = winRatePenalty(summary.winRate, mConfig);
    c.lossRPenalty = lossRPenalty(summary.avgRLoss, mConfig);

    c.rawScore = c.baseValue
      + c.timeBoost * mConfig.timeBoostWeight
      + c.disciplineBonus
      + c.tailBonus
      - c.ddPenalty * mConfig.ddPenaltyWeight
      - c.winRatePenalty * mConfig.winRatePenaltyWeight
      - c.lossRPenalty * mConfig.lossRPenaltyWeight;

    c.confidence = confidence(summary.alertsOk, mConfig);
    c.finalScore = c.confidence * c.rawScore;
    return c;
  }
}
