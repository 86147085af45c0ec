#pragma once

#include <string>
#include <vector>

#include "DataSources.h"

namespace alertbt
{
  /**
   * @brief Candle lookup backed by a directory holding one "<token>.csv" per
   * token with a header row "timestamp,open,high,low,close,volume".
   *
   * Timestamps may be "YYYY-MM-DD HH:MM:SS", ISO-8601 or epoch seconds. A token
   * without a file yields an empty series.
   */
  class CsvCandleDirectoryLookup : public ICandleLookup
  {
  public:
    explicit CsvCandleDirectoryLookup(const std::string& directory);

    CandleSeries loadCandles(const std::string& tokenId,
			     const ptime& start,
			     const ptime& end,
			     long intervalSeconds) const override;

    const std::string& getDirectory() const
    {
      return mDirectory;
    }

  private:
    std::string mDirectory;
  };

  /**
   * @brief Alert source reading a CSV file with the header
   * "token_id,chain,alert_time,caller,market_cap_usd". The chain, caller and
   * market cap columns are optional.
   */
  class CsvAlertSource : public IAlertSource
  {
  public:
    explicit CsvAlertSource(const std::string& fileName);

    std::vector<Alert> loadAlerts(const std::string& chain,
				  const ptime& from,
				  const ptime& to) const override;

    /** @return every alert in the file, in file order */
    std::vector<Alert> readAll() const;

  private:
    std::string mFileName;
  };
}
