#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "Alert.h"
#include "Candle.h"

namespace alertbt
{
  using boost::posix_time::ptime;

  /**
   * @brief Supplies candles for one token and time window.
   *
   * Implementations return candles with time in [start, end), ascending. An
   * empty sequence means no data for the window and is not an error.
   * Implementations may block on I/O; loadCandles may be called concurrently.
   */
  class ICandleLookup
  {
  public:
    virtual ~ICandleLookup() = default;

    virtual CandleSeries loadCandles(const std::string& tokenId,
				     const ptime& start,
				     const ptime& end,
				     long intervalSeconds) const = 0;
  };

  /**
   * @brief Supplies alerts for a chain and time range, sorted by
   * (alert time, token id). Throws DataSourceException when the range holds
   * no alerts.
   */
  class IAlertSource
  {
  public:
    virtual ~IAlertSource() = default;

    virtual std::vector<Alert> loadAlerts(const std::string& chain,
					  const ptime& from,
					  const ptime& to) const = 0;
  };

  class InMemoryCandleLookup : public ICandleLookup
  {
  public:
    InMemoryCandleLookup() = default;

    void addCandles(const std::string& tokenId, const CandleSeries& candles);

    CandleSeries loadCandles(const std::string& tokenId,
			     const ptime& start,
			     const ptime& end,
			     long intervalSeconds) const override;

  private:
    std::map<std::string, CandleSeries> mCandlesByToken;
  };

  class InMemoryAlertSource : public IAlertSource
  {
  public:
    explicit InMemoryAlertSource(std::vector<Alert> alerts)
      : mAlerts(std::move(alerts))
    {}

    std::vector<Alert> loadAlerts(const std::string& chain,
				  const ptime& from,
				  const ptime& to) const override;

  private:
    std::vector<Alert> mAlerts;
  };

  /** @brief Common filtering shared by alert sources: chain match, [from, to], sort. */
  std::vector<Alert> selectAlerts(const std::vector<Alert>& alerts,
				  const std::string& chain,
				  const ptime& from,
				  const ptime& to);

  /** @brief Keeps only alerts whose trimmed caller is in @p callerIds (no-op when empty). */
  std::vector<Alert> filterByCallers(const std::vector<Alert>& alerts,
				     const std::vector<std::string>& callerIds);
}
