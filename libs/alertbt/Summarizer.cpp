#include "Summarizer.h"
#include "StatUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <boost/algorithm/string/trim.hpp>

namespace alertbt
{
  namespace
  {
    double profitFactorOf(double grossProfit, double grossLoss)
    {
      if (grossLoss > 0.0)
	return grossProfit / grossLoss;
      return grossProfit > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }

    double averageOr(const std::vector<double>& xs, double fallback)
    {
      return xs.empty() ? fallback : stats::mean(xs);
    }

    void pushIfPresent(std::vector<double>& xs, const std::optional<double>& v)
    {
      if (v && std::isfinite(*v))
	xs.push_back(*v);
    }

    void pushIfPresent(std::vector<double>& xs, const std::optional<long>& v)
    {
      if (v)
	xs.push_back(static_cast<double>(*v));
    }
  }

  Summarizer::Summarizer(double riskPerTrade)
    : mRiskPerTrade(riskPerTrade)
  {
    if (!std::isfinite(riskPerTrade) || riskPerTrade <= 0.0 || riskPerTrade > 1.0)
      throw std::invalid_argument("Summarizer: risk_per_trade must be in (0, 1]");
  }

  RunSummary Summarizer::summarize(const std::vector<AlertResult>& rows,
				   const PolicyConfig& policy) const
  {
    RunSummary s;
    s.alertsTotal = rows.size();

    const StatusCounts counts = countStatuses(rows);
    s.alertsOk = counts.ok;
    s.alertsMissing = counts.missing;
    s.alertsBadEntry = counts.badEntry;
    s.alertsError = counts.error;

    const double maxLossFraction = policy.getMaxLossFraction();
    const double positionSize = mRiskPerTrade / maxLossFraction;
    s.riskPerTradePct = mRiskPerTrade * 100.0;
    s.positionSizePct = positionSize * 100.0;

    if (!s.hasEligibleTrades())
      return s;

    std::vector<double> ath, ddInitial, ddOverall, ddAfter2x, ddAfter3x, ddAfterAth;
    std::vector<double> peakPnl, retEnd, t2x, t4x, ddPre2xOrHorizon;
    std::vector<double> returns;
    std::array<std::size_t, kTierCount> tierHits{};

    for (const AlertResult& row : rows)
      {
	if (!row.isOk())
	  continue;

	const PathMetrics& m = row.metrics;
	ath.push_back(m.athMult);
	ddInitial.push_back(m.ddInitial);
	ddOverall.push_back(m.ddOverall);
	pushIfPresent(ddAfter2x, m.ddAfter(2.0));
	pushIfPresent(ddAfter3x, m.ddAfter(3.0));
	pushIfPresent(ddAfterAth, m.ddAfterAth);
	peakPnl.push_back(m.peakPnlPct);
	retEnd.push_back(m.retEnd);
	pushIfPresent(t2x, m.timeToTier(2.0));
	pushIfPresent(t4x, m.timeToTier(4.0));
	ddPre2xOrHorizon.push_back(m.ddPre2xOrHorizon);

	for (std::size_t i = 0; i < kTierCount; ++i)
	  if (m.timeToTierSeconds[i])
	    ++tierHits[i];

	if (row.exit)
	  {
	    returns.push_back(row.exit->netReturn);
	    ++s.exitReasonCounts[static_cast<std::size_t>(row.exit->reason)];
	  }
      }

    const double okCount = static_cast<double>(s.alertsOk);

    s.medianAthMult = stats::median(ath);
    s.medianDdInitial = stats::median(ddInitial);
    s.medianDdOverall = stats::median(ddOverall);
    s.medianDdAfter2x = stats::median(ddAfter2x);
    s.medianDdAfter3x = stats::median(ddAfter3x);
    s.medianDdAfterAth = stats::median(ddAfterAth);
    s.medianPeakPnlPct = stats::median(peakPnl);
    s.medianRetEnd = stats::median(retEnd);
    s.medianTimeTo2xSeconds = stats::median(t2x);
    s.medianTimeTo4xSeconds = stats::median(t4x);

    for (std::size_t i = 0; i < kTierCount; ++i)
      s.pctHitTier[i] = static_cast<double>(tierHits[i]) / okCount;

    s.p25AthMult = stats::percentile(ath, 0.25);
    s.p75AthMult = stats::percentile(ath, 0.75);
    s.p95AthMult = stats::percentile(ath, 0.95);

    s.ddPre2xMedian = stats::median(ddPre2xOrHorizon);
    if (s.medianTimeTo2xSeconds)
      s.timeTo2xMedianMin = *s.medianTimeTo2xSeconds / 60.0;

    // Raw returns
    std::vector<double> wins, losses;
    for (double r : returns)
      {
	if (r > 0.0)
	  wins.push_back(r);
	else if (r < 0.0)
	  losses.push_back(r);
      }

    const double totalReturn = stats::sum(returns);
    s.totalReturnPct = totalReturn * 100.0;
    s.avgReturnPct = averageOr(returns, 0.0) * 100.0;
    s.winRate = static_cast<double>(wins.size()) / okCount;
    s.avgWinPct = averageOr(wins, 0.0) * 100.0;
    s.avgLossPct = averageOr(losses, 0.0) * 100.0;
    s.profitFactor = profitFactorOf(stats::sum(wins), std::fabs(stats::sum(losses)));
    s.expectancyPct = s.avgReturnPct;

    // Risk-adjusted, non-compounding
    s.riskAdjTotalReturnPct = totalReturn * positionSize * 100.0;
    s.riskAdjAvgReturnPct = s.avgReturnPct * positionSize;
    s.riskAdjAvgWinPct = s.avgWinPct * positionSize;
    s.riskAdjAvgLossPct = s.avgLossPct * positionSize;

    // R multiples
    std::vector<double> rWins, rLosses;
    for (double r : returns)
      {
	const double rMult = r / maxLossFraction;
	s.totalR += rMult;
	if (rMult > 0.0)
	  rWins.push_back(rMult);
	else
	  rLosses.push_back(rMult);
      }

    s.avgR = returns.empty() ? 0.0 : s.totalR / static_cast<double>(returns.size());
    s.avgRWin = averageOr(rWins, 0.0);
    s.avgRLoss = averageOr(rLosses, 0.0);
    s.rProfitFactor = profitFactorOf(stats::sum(rWins), std::fabs(stats::sum(rLosses)));

    return s;
  }

  std::vector<CallerSummary> Summarizer::summarizeByCaller(const std::vector<AlertResult>& rows,
							   const PolicyConfig& policy,
							   std::size_t minTrades) const
  {
    std::map<std::string, std::vector<AlertResult>> byCaller;
    for (const AlertResult& row : rows)
      {
	if (!row.isOk())
	  continue;

	const std::string caller = boost::algorithm::trim_copy(row.alert.getCaller());
	if (caller.empty())
	  continue;

	byCaller[caller].push_back(row);
      }

    std::vector<CallerSummary> board;
    for (const auto& entry : byCaller)
      {
	if (entry.second.size() < minTrades)
	  continue;

	CallerSummary cs;
	cs.caller = entry.first;
	cs.summary = summarize(entry.second, policy);
	board.push_back(std::move(cs));
      }

    std::stable_sort(board.begin(), board.end(),
		     [](const CallerSummary& lhs, const CallerSummary& rhs) {
		       return lhs.summary.riskAdjTotalReturnPct > rhs.summary.riskAdjTotalReturnPct;
		     });
    return board;
  }
}
