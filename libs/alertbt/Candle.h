#pragma once

#include <cmath>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AlertBacktestException.h"

namespace alertbt
{
  using boost::posix_time::ptime;

  /**
   * @brief One OHLCV bar of a token's price history.
   *
   * Candles are immutable once built. A sequence handed to the engine must be
   * ordered by ascending time.
   */
  class Candle
  {
  public:
    Candle(const ptime& time, double open, double high, double low, double close,
	   double volume = 0.0)
      : mTime(time),
	mOpen(open),
	mHigh(high),
	mLow(low),
	mClose(close),
	mVolume(volume)
    {}

    const ptime& getTime() const
    {
      return mTime;
    }

    double getOpen() const
    {
      return mOpen;
    }

    double getHigh() const
    {
      return mHigh;
    }

    double getLow() const
    {
      return mLow;
    }

    double getClose() const
    {
      return mClose;
    }

    double getVolume() const
    {
      return mVolume;
    }

  private:
    ptime mTime;
    double mOpen;
    double mHigh;
    double mLow;
    double mClose;
    double mVolume;
  };

  using CandleSeries = std::vector<Candle>;

  /**
   * @brief Throws AlertBacktestException if the series is not strictly
   * ascending in time or a candle carries non-finite or inconsistent prices.
   */
  inline void validateCandleSeries(const CandleSeries& candles)
  {
    for (std::size_t i = 0; i < candles.size(); ++i)
      {
	const Candle& c = candles[i];
	if (!std::isfinite(c.getOpen()) || !std::isfinite(c.getHigh()) ||
	    !std::isfinite(c.getLow()) || !std::isfinite(c.getClose()))
	  throw AlertBacktestException("Malformed candle at index " + std::to_string(i) +
				       ": non-finite price");

	if (c.getHigh() < c.getLow())
	  throw AlertBacktestException("Malformed candle at index " + std::to_string(i) +
				       ": high below low");

	if (i > 0 && !(candles[i - 1].getTime() < c.getTime()))
	  throw AlertBacktestException("Candle series not strictly ascending at index " +
				       std::to_string(i));
      }
  }
}
