#include "OptimizationRun.h"
#include "AlertBacktestException.h"

#include <algorithm>
#include <cmath>

namespace alertbt
{
  std::string rankKeyToString(RankKey key)
  {
    switch (key)
      {
      case RankKey::ObjectiveScore:
	return "objective_score";
      case RankKey::TotalR:
	return "total_r";
      case RankKey::AvgR:
	return "avg_r";
      case RankKey::WinRate:
	return "win_rate";
      case RankKey::ProfitFactor:
	return "profit_factor";
      case RankKey::ExpectancyPct:
	return "expectancy_pct";
      case RankKey::RiskAdjTotalReturnPct:
	return "risk_adj_total_return_pct";
      case RankKey::RProfitFactor:
	return "r_profit_factor";
      }
    return "objective_score";
  }

  RankKey rankKeyFromString(const std::string& text)
  {
    static const RankKey allKeys[] = {
      RankKey::ObjectiveScore, RankKey::TotalR, RankKey::AvgR, RankKey::WinRate,
      RankKey::ProfitFactor, RankKey::ExpectancyPct, RankKey::RiskAdjTotalReturnPct,
      RankKey::RProfitFactor
    };

    for (RankKey key : allKeys)
      if (rankKeyToString(key) == text)
	return key;

    throw ConfigurationException("Unknown rank key: " + text);
  }

  double OptimizationResult::rankValue(RankKey key) const
  {
    switch (key)
      {
      case RankKey::ObjectiveScore:
	return objective.finalScore;
      case RankKey::TotalR:
	return summary.totalR;
      case RankKey::AvgR:
	return summary.avgR;
      case RankKey::WinRate:
	return summary.winRate;
      case RankKey::ProfitFactor:
	return std::isinf(summary.profitFactor) ? kProfitFactorCap : summary.profitFactor;
      case RankKey::ExpectancyPct:
	return summary.expectancyPct;
      case RankKey::RiskAdjTotalReturnPct:
	return summary.riskAdjTotalReturnPct;
      case RankKey::RProfitFactor:
	return std::isinf(summary.rProfitFactor) ? kProfitFactorCap : summary.rProfitFactor;
      }
    return objective.finalScore;
  }

  OptimizationRun::OptimizationRun(const std::string& runId)
    : mRunId(runId),
      mResults(),
      mPhaseTimings()
  {}

  void OptimizationRun::append(const OptimizationResult& result)
  {
    mResults.push_back(result);
  }

  std::size_t OptimizationRun::failedCount() const
  {
    return static_cast<std::size_t>(std::count_if(mResults.begin(), mResults.end(),
						  [](const OptimizationResult& r) {
						    return r.isFailed();
						  }));
  }

  std::vector<OptimizationResult> OptimizationRun::rankBy(RankKey key) const
  {
    std::vector<OptimizationResult> ranked(mResults);
    std::stable_sort(ranked.begin(), ranked.end(),
		     [key](const OptimizationResult& lhs, const OptimizationResult& rhs) {
		       if (lhs.isFailed() != rhs.isFailed())
			 return rhs.isFailed();
		       if (lhs.isFailed())
			 return false;
		       return lhs.rankValue(key) > rhs.rankValue(key);
		     });
    return ranked;
  }

  std::optional<OptimizationResult> OptimizationRun::getBest(RankKey key) const
  {
    const std::vector<OptimizationResult> ranked = rankBy(key);
    if (ranked.empty() || ranked.front().isFailed())
      return std::nullopt;
    return ranked.front();
  }

  void OptimizationRun::recordPhase(const std::string& phase, double seconds)
  {
    mPhaseTimings[phase] += seconds;
  }
}
