#include "DataSources.h"
#include "AlertBacktestException.h"
#include "TimeUtils.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <boost/algorithm/string/trim.hpp>

namespace alertbt
{
  void InMemoryCandleLookup::addCandles(const std::string& tokenId, const CandleSeries& candles)
  {
    CandleSeries& series = mCandlesByToken[tokenId];
    series.insert(series.end(), candles.begin(), candles.end());
    std::stable_sort(series.begin(), series.end(),
		     [](const Candle& a, const Candle& b) { return a.getTime() < b.getTime(); });
  }

  CandleSeries InMemoryCandleLookup::loadCandles(const std::string& tokenId,
						 const ptime& start,
						 const ptime& end,
						 long) const
  {
    CandleSeries window;

    auto it = mCandlesByToken.find(tokenId);
    if (it == mCandlesByToken.end())
      return window;

    for (const Candle& c : it->second)
      if (!(c.getTime() < start) && c.getTime() < end)
	window.push_back(c);

    return window;
  }

  std::vector<Alert> selectAlerts(const std::vector<Alert>& alerts,
				  const std::string& chain,
				  const ptime& from,
				  const ptime& to)
  {
    std::vector<Alert> selected;
    for (const Alert& a : alerts)
      {
	if (!chain.empty() && !a.getChain().empty() && a.getChain() != chain)
	  continue;
	if (a.getAlertTime() < from || to < a.getAlertTime())
	  continue;
	selected.push_back(a);
      }

    if (selected.empty())
      throw DataSourceException("No alerts found for " + chain + " between " +
				toIsoString(from) + " and " + toIsoString(to));

    std::sort(selected.begin(), selected.end(), alertTimeTokenLess);
    return selected;
  }

  std::vector<Alert> filterByCallers(const std::vector<Alert>& alerts,
				     const std::vector<std::string>& callerIds)
  {
    if (callerIds.empty())
      return alerts;

    std::set<std::string> wanted;
    for (const std::string& id : callerIds)
      wanted.insert(boost::algorithm::trim_copy(id));

    std::vector<Alert> filtered;
    std::copy_if(alerts.begin(), alerts.end(), std::back_inserter(filtered),
		 [&wanted](const Alert& a) {
		   return wanted.count(boost::algorithm::trim_copy(a.getCaller())) > 0;
		 });
    return filtered;
  }

  std::vector<Alert> InMemoryAlertSource::loadAlerts(const std::string& chain,
						     const ptime& from,
						     const ptime& to) const
  {
    return selectAlerts(mAlerts, chain, from, to);
  }
}
