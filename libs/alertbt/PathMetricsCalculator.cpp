#include "PathMetricsCalculator.h"
#include "TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace alertbt
{
  namespace
  {
    void takeMin(std::optional<double>& acc, double value)
    {
      if (!acc || value < *acc)
	acc = value;
    }

    // Drawdown of a window's lowest low against a reference level, never positive
    std::optional<double> drawdownFrom(const std::optional<double>& minLow, double reference)
    {
      if (!minLow)
	return std::nullopt;
      return std::min(*minLow / reference - 1.0, 0.0);
    }

    std::optional<double> fraction(std::size_t numerator, std::size_t denominator)
    {
      if (denominator == 0)
	return std::nullopt;
      return static_cast<double>(numerator) / static_cast<double>(denominator);
    }
  }

  PathMetrics PathMetricsCalculator::compute(double entryPrice, const CandleSeries& candles) const
  {
    if (candles.empty())
      return compute(entryPrice, candles, ptime());

    return compute(entryPrice, candles, candles.front().getTime());
  }

  PathMetrics PathMetricsCalculator::compute(double entryPrice,
					     const CandleSeries& candles,
					     const ptime& entryTime,
					     const EvaluationDeadline* deadline) const
  {
    PathMetrics metrics;
    metrics.entryPrice = entryPrice;
    metrics.candleCount = candles.size();

    if (candles.size() < 2)
      {
	metrics.status = AlertStatus::Missing;
	return metrics;
      }

    if (!std::isfinite(entryPrice) || entryPrice <= 0.0)
      {
	metrics.status = AlertStatus::BadEntry;
	return metrics;
      }

    validateCandleSeries(candles);

    const std::size_t i1p2 = tierIndex(1.2);
    const std::size_t i1p5 = tierIndex(1.5);
    const std::size_t i2x  = tierIndex(2.0);

    std::array<std::optional<std::size_t>, kTierCount> touchIndex{};
    std::array<std::optional<double>, kTierCount> minLowAfterTouch{};
    std::array<std::size_t, kTierCount> candlesAfterTouch{};

    std::optional<double> runningMinLow;
    double maxHigh = -std::numeric_limits<double>::infinity();
    std::size_t athIndex = 0;
    std::optional<double> minLowAfterAth;

    std::optional<std::size_t> recoveryIndex;
    std::optional<double> minLowPreRecovery;
    std::size_t candlesPreRecovery = 0;
    std::size_t candlesUnderwater = 0;
    std::size_t candlesPostRecovery = 0;
    std::size_t candlesInProfit = 0;

    std::optional<double> minLowBand1p2To1p5;
    std::optional<double> minLowBand1p5To2;
    std::optional<double> minLowHeadfakeWindow;

    std::size_t retained1p2Above1p1 = 0;
    std::size_t retained1p5Above1p3 = 0;
    std::size_t stallCandles = 0;

    PathQuality& quality = metrics.quality;
    quality.totalCandles = candles.size();

    for (std::size_t i = 0; i < candles.size(); ++i)
      {
	if (deadline)
	  deadline->checkAt(i, "path metrics");

	const Candle& c = candles[i];
	const double high = c.getHigh();
	const double low = c.getLow();
	const double close = c.getClose();

	std::array<bool, kTierCount> touchesNow{};
	for (std::size_t t = 0; t < kTierCount; ++t)
	  touchesNow[t] = !touchIndex[t] && high >= entryPrice * kTierLadder[t];

	auto touchedBefore = [&](std::size_t t) { return touchIndex[t].has_value(); };

	// Windows strictly after an earlier first touch
	for (std::size_t t = 0; t < kTierCount; ++t)
	  {
	    if (!touchedBefore(t))
	      continue;

	    takeMin(minLowAfterTouch[t], low);
	    ++candlesAfterTouch[t];
	  }

	if (touchedBefore(i1p2) && low >= entryPrice * 1.1)
	  ++retained1p2Above1p1;
	if (touchedBefore(i1p5) && low >= entryPrice * 1.3)
	  ++retained1p5Above1p3;

	// Tier bands (A touch, B touch]
	if (touchedBefore(i1p2) && !touchedBefore(i1p5))
	  takeMin(minLowBand1p2To1p5, low);
	if (touchedBefore(i1p5) && !touchedBefore(i2x))
	  takeMin(minLowBand1p5To2, low);

	// Head-fake window (1.2x touch, 1.5x touch)
	if (touchedBefore(i1p2) && !touchedBefore(i1p5) && !touchesNow[i1p5])
	  takeMin(minLowHeadfakeWindow, low);

	// Drawdown strictly before each newly touched tier
	for (std::size_t t = 0; t < kTierCount; ++t)
	  {
	    if (!touchesNow[t])
	      continue;

	    // A tier touched on the entry candle has no dip before it
	    metrics.ddPreTier[t] = drawdownFrom(runningMinLow, entryPrice).value_or(0.0);
	    metrics.timeToTierSeconds[t] = secondsBetween(entryTime, c.getTime());
	  }

	if (!recoveryIndex && high > entryPrice)
	  {
	    recoveryIndex = i;
	    minLowPreRecovery = runningMinLow;
	    metrics.timeToRecoverySeconds = secondsBetween(entryTime, c.getTime());
	  }

	if (recoveryIndex)
	  {
	    ++candlesPostRecovery;
	    if (low >= entryPrice)
	      ++candlesInProfit;
	  }
	else
	  {
	    ++candlesPreRecovery;
	    if (low < entryPrice)
	      ++candlesUnderwater;
	  }

	if (i == 0 || high > maxHigh)
	  {
	    const double tolerance = kAthTolerance * std::max(std::fabs(maxHigh), 1.0);
	    if (i == 0 || high - maxHigh > tolerance)
	      {
		athIndex = i;
		minLowAfterAth.reset();
	      }
	    else
	      {
		takeMin(minLowAfterAth, low);
	      }
	    maxHigh = high;
	  }
	else
	  {
	    takeMin(minLowAfterAth, low);
	  }

	if (close < entryPrice)
	  ++quality.candlesBelowEntry;
	else if (close < entryPrice * 1.2)
	  ++quality.candles1p0To1p2;
	else if (close < entryPrice * 1.5)
	  ++quality.candles1p2To1p5;
	else if (close < entryPrice * 2.0)
	  ++quality.candles1p5To2p0;
	else
	  ++quality.candles2p0Plus;

	if (close >= entryPrice * 1.05 && close < entryPrice * 1.15)
	  ++stallCandles;

	takeMin(runningMinLow, low);

	for (std::size_t t = 0; t < kTierCount; ++t)
	  if (touchesNow[t])
	    touchIndex[t] = i;
      }

    const double minLow = *runningMinLow;

    metrics.status = AlertStatus::Ok;
    metrics.athMult = maxHigh / entryPrice;
    metrics.timeToAthSeconds = secondsBetween(entryTime, candles[athIndex].getTime());
    metrics.ddOverall = std::min(minLow / entryPrice - 1.0, 0.0);

    if (!recoveryIndex)
      metrics.ddInitial = metrics.ddOverall;
    else if (minLowPreRecovery)
      metrics.ddInitial = std::min(*minLowPreRecovery / entryPrice - 1.0, 0.0);
    else
      metrics.ddInitial = 0.0;

    for (std::size_t t = 0; t < kTierCount; ++t)
      if (touchIndex[t])
	metrics.ddAfterTier[t] = drawdownFrom(minLowAfterTouch[t], entryPrice * kTierLadder[t]);

    if (touchIndex[i1p2] && touchIndex[i1p5])
      metrics.ddBand1p2To1p5 = drawdownFrom(minLowBand1p2To1p5, entryPrice * 1.2);
    if (touchIndex[i1p5] && touchIndex[i2x])
      metrics.ddBand1p5To2 = drawdownFrom(minLowBand1p5To2, entryPrice * 1.5);

    metrics.ddAfterAth = drawdownFrom(minLowAfterAth, maxHigh);
    metrics.ddPre2xOrHorizon = touchIndex[i2x] ? *metrics.ddPreTier[i2x] : metrics.ddOverall;

    metrics.peakPnlPct = (metrics.athMult - 1.0) * 100.0;
    metrics.retEnd = candles.back().getClose() / entryPrice - 1.0;

    quality.timeUnderwaterPct = fraction(candlesUnderwater, candlesPreRecovery).value_or(0.0);
    if (recoveryIndex)
      quality.timeInProfitPct = fraction(candlesInProfit, candlesPostRecovery);
    quality.stallScore = fraction(stallCandles, candles.size()).value_or(0.0);

    if (touchIndex[i1p2])
      {
	quality.retention1p2xAbove1p1x = fraction(retained1p2Above1p1, candlesAfterTouch[i1p2]);
	quality.floorHoldAfter1p2x = minLowAfterTouch[i1p2] && *minLowAfterTouch[i1p2] >= entryPrice;
      }

    if (touchIndex[i1p5])
      {
	quality.retention1p5xAbove1p3x = fraction(retained1p5Above1p3, candlesAfterTouch[i1p5]);
	quality.floorHoldAfter1p5x = minLowAfterTouch[i1p5] && *minLowAfterTouch[i1p5] >= entryPrice;
      }

    quality.givebackAfter1p5x = metrics.ddAfterTier[i1p5];
    quality.givebackAfter2x = metrics.ddAfterTier[i2x];

    if (touchIndex[i1p2] && minLowHeadfakeWindow && *minLowHeadfakeWindow < entryPrice)
      {
	quality.isHeadfake = true;
	quality.headfakeDepth = *minLowHeadfakeWindow / entryPrice - 1.0;
	quality.headfakeRecovered = touchIndex[i1p5].has_value();
      }

    return metrics;
  }
}
