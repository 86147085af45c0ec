#pragma once

#include <string>
#include <utility>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include "../Alert.h"
#include "../Candle.h"

namespace alertbt
{
  namespace test
  {
    using boost::posix_time::ptime;

    // 2024-01-01 00:00:00, minute aligned
    inline ptime baseTime()
    {
      return ptime(boost::gregorian::date(2024, 1, 1));
    }

    inline ptime minutesAfterBase(long minutes)
    {
      return baseTime() + boost::posix_time::minutes(minutes);
    }

    inline Candle makeCandle(long minute, double open, double high, double low, double close)
    {
      return Candle(minutesAfterBase(minute), open, high, low, close, 1000.0);
    }

    /**
     * Builds one-minute candles from (high, low) pairs starting at @p startMinute.
     * The first candle opens at @p firstOpen; every close is the bar midpoint and
     * every later open is the previous close.
     */
    inline CandleSeries makeSeries(const std::vector<std::pair<double, double>>& highLow,
				   double firstOpen = 1.0,
				   long startMinute = 0)
    {
      CandleSeries series;
      double open = firstOpen;
      for (std::size_t i = 0; i < highLow.size(); ++i)
	{
	  const double high = highLow[i].first;
	  const double low = highLow[i].second;
	  const double close = (high + low) / 2.0;
	  series.push_back(makeCandle(startMinute + static_cast<long>(i), open, high, low, close));
	  open = close;
	}
      return series;
    }

    // Flat path whose every bar is (high, low) = (level, level)
    inline CandleSeries makeFlatSeries(std::size_t count, double level, long startMinute = 0)
    {
      return makeSeries(std::vector<std::pair<double, double>>(count, std::make_pair(level, level)),
			level, startMinute);
    }

    inline Alert makeAlert(const std::string& token, long minute, const std::string& caller = "caller_a")
    {
      return Alert(token, minutesAfterBase(minute), caller);
    }
  }
}
