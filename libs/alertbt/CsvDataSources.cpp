#include "CsvDataSources.h"
#include "AlertBacktestException.h"
#include "Logger.h"
#include "TimeUtils.h"

#include <algorithm>
#include <fstream>
#include <boost/filesystem.hpp>
#include "csv.h"

namespace alertbt
{
  namespace fs = boost::filesystem;

  namespace
  {
    double parsePrice(const std::string& text, const std::string& context)
    {
      try
	{
	  std::size_t consumed = 0;
	  const double value = std::stod(text, &consumed);
	  if (consumed != text.size())
	    throw std::invalid_argument("trailing characters");
	  return value;
	}
      catch (const std::exception& e)
	{
	  throw DataSourceException("Cannot parse number '" + text + "' in " + context + ": " + e.what());
	}
    }
  }

  CsvCandleDirectoryLookup::CsvCandleDirectoryLookup(const std::string& directory)
    : mDirectory(directory)
  {
    if (!fs::is_directory(fs::path(mDirectory)))
      throw DataSourceException("Candle directory does not exist: " + mDirectory);
  }

  CandleSeries CsvCandleDirectoryLookup::loadCandles(const std::string& tokenId,
						     const ptime& start,
						     const ptime& end,
						     long) const
  {
    CandleSeries window;
    const fs::path file = fs::path(mDirectory) / (tokenId + ".csv");
    if (!fs::exists(file))
      {
	ALERTBT_LOG_DEBUG("No candle file for token {}", tokenId);
	return window;
      }

    try
      {
	io::CSVReader<6, io::trim_chars<' '>, io::double_quote_escape<',', '\"'>> csvFile(file.string());
	csvFile.read_header(io::ignore_extra_column,
			    "timestamp", "open", "high", "low", "close", "volume");

	std::string timeString, openString, highString, lowString, closeString, volumeString;
	while (csvFile.read_row(timeString, openString, highString, lowString, closeString, volumeString))
	  {
	    const ptime t = parseTimestamp(timeString);
	    if (t < start || !(t < end))
	      continue;

	    const std::string context = file.string();
	    window.emplace_back(t,
				parsePrice(openString, context),
				parsePrice(highString, context),
				parsePrice(lowString, context),
				parsePrice(closeString, context),
				volumeString.empty() ? 0.0 : parsePrice(volumeString, context));
	  }
      }
    catch (const io::error::base& e)
      {
	throw DataSourceException("Error reading candle file " + file.string() + ": " + e.what());
      }
    catch (const std::invalid_argument& e)
      {
	throw DataSourceException("Bad timestamp in candle file " + file.string() + ": " + e.what());
      }

    std::stable_sort(window.begin(), window.end(),
		     [](const Candle& a, const Candle& b) { return a.getTime() < b.getTime(); });
    return window;
  }

  CsvAlertSource::CsvAlertSource(const std::string& fileName)
    : mFileName(fileName)
  {
    std::ifstream fin(mFileName);
    if (!fin.is_open())
      throw DataSourceException("Cannot open alert file: " + mFileName);
  }

  std::vector<Alert> CsvAlertSource::readAll() const
  {
    std::vector<Alert> alerts;

    try
      {
	io::CSVReader<5, io::trim_chars<' '>, io::double_quote_escape<',', '\"'>> csvFile(mFileName);
	csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
			    "token_id", "chain", "alert_time", "caller", "market_cap_usd");

	if (!csvFile.has_column("token_id") || !csvFile.has_column("alert_time"))
	  throw DataSourceException("Alert file " + mFileName + " needs token_id and alert_time columns");

	std::string tokenId, chain, alertTime, caller, marketCap;
	while (csvFile.read_row(tokenId, chain, alertTime, caller, marketCap))
	  {
	    std::optional<double> marketCapUsd;
	    if (!marketCap.empty())
	      marketCapUsd = parsePrice(marketCap, mFileName);

	    alerts.emplace_back(tokenId,
				parseTimestamp(alertTime),
				caller,
				marketCapUsd,
				chain.empty() ? std::string("solana") : chain);

	    chain.clear();
	    caller.clear();
	    marketCap.clear();
	  }
      }
    catch (const io::error::base& e)
      {
	throw DataSourceException("Error reading alert file " + mFileName + ": " + e.what());
      }
    catch (const std::invalid_argument& e)
      {
	throw DataSourceException("Bad timestamp in alert file " + mFileName + ": " + e.what());
      }

    return alerts;
  }

  std::vector<Alert> CsvAlertSource::loadAlerts(const std::string& chain,
						const ptime& from,
						const ptime& to) const
  {
    return selectAlerts(readAll(), chain, from, to);
  }
}
