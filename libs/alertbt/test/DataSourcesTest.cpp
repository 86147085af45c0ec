// DataSourcesTest.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fstream>
#include <boost/filesystem.hpp>

#include "DataSources.h"
#include "CsvDataSources.h"
#include "AlertBacktestException.h"
#include "TimeUtils.h"
#include "TestUtils.h"

using namespace alertbt;
using namespace alertbt::test;
using Catch::Approx;

namespace fs = boost::filesystem;

namespace
{
  // Scratch directory removed at scope exit
  class ScratchDirectory
  {
  public:
    ScratchDirectory()
      : mPath(fs::temp_directory_path() / fs::unique_path("alertbt-test-%%%%-%%%%"))
    {
      fs::create_directories(mPath);
    }

    ~ScratchDirectory()
    {
      boost::system::error_code ec;
      fs::remove_all(mPath, ec);
    }

    std::string write(const std::string& name, const std::string& contents) const
    {
      const fs::path file = mPath / name;
      std::ofstream out(file.string());
      out << contents;
      return file.string();
    }

    std::string path() const
    {
      return mPath.string();
    }

  private:
    fs::path mPath;
  };
}

TEST_CASE("Time helpers", "[DataSources]")
{
  SECTION("Ceil to interval")
  {
    REQUIRE(ceilToInterval(minutesAfterBase(5), 60) == minutesAfterBase(5));
    REQUIRE(ceilToInterval(minutesAfterBase(5) + boost::posix_time::seconds(1), 60) == minutesAfterBase(6));
    REQUIRE(ceilToInterval(minutesAfterBase(7), 300) == minutesAfterBase(10));
    REQUIRE_THROWS_AS(ceilToInterval(minutesAfterBase(0), 0), std::invalid_argument);
  }

  SECTION("Timestamp formats")
  {
    const ptime expected = minutesAfterBase(90);
    REQUIRE(parseTimestamp("2024-01-01 01:30:00") == expected);
    REQUIRE(parseTimestamp("2024-01-01T01:30:00Z") == expected);
    REQUIRE(parseTimestamp(std::to_string(toEpochSeconds(expected))) == expected);
    REQUIRE_THROWS_AS(parseTimestamp("yesterday"), std::invalid_argument);
    REQUIRE(toIsoString(expected) == "2024-01-01T01:30:00Z");
  }
}

TEST_CASE("InMemoryCandleLookup windows", "[DataSources]")
{
  InMemoryCandleLookup lookup;
  lookup.addCandles("TOK", makeFlatSeries(10, 1.0));

  SECTION("Window is half-open")
  {
    const CandleSeries window = lookup.loadCandles("TOK", minutesAfterBase(2), minutesAfterBase(5), 60);
    REQUIRE(window.size() == 3);
    REQUIRE(window.front().getTime() == minutesAfterBase(2));
    REQUIRE(window.back().getTime() == minutesAfterBase(4));
  }

  SECTION("Unknown token yields no data")
  {
    REQUIRE(lookup.loadCandles("NOPE", minutesAfterBase(0), minutesAfterBase(60), 60).empty());
  }
}

TEST_CASE("Alert selection", "[DataSources]")
{
  const std::vector<Alert> alerts{Alert("B", minutesAfterBase(10), "x"),
				  Alert("A", minutesAfterBase(10), "y"),
				  Alert("C", minutesAfterBase(5), " x "),
				  Alert("D", minutesAfterBase(50), "z"),
				  Alert("E", minutesAfterBase(7), "x", std::nullopt, "base")};

  SECTION("Sorted by time then token, filtered by chain and range")
  {
    const std::vector<Alert> picked = selectAlerts(alerts, "solana", minutesAfterBase(0), minutesAfterBase(30));
    REQUIRE(picked.size() == 3);
    REQUIRE(picked[0].getTokenId() == "C");
    REQUIRE(picked[1].getTokenId() == "A");
    REQUIRE(picked[2].getTokenId() == "B");
  }

  SECTION("An empty range is a data source error")
  {
    REQUIRE_THROWS_AS(selectAlerts(alerts, "solana", minutesAfterBase(100), minutesAfterBase(200)),
		      DataSourceException);
  }

  SECTION("Caller filter trims names")
  {
    const std::vector<Alert> picked = filterByCallers(alerts, {"x"});
    REQUIRE(picked.size() == 3);
    REQUIRE(filterByCallers(alerts, {}).size() == alerts.size());
  }

  SECTION("In-memory source applies the same selection")
  {
    const InMemoryAlertSource source(alerts);
    REQUIRE(source.loadAlerts("base", minutesAfterBase(0), minutesAfterBase(60)).size() == 1);
  }
}

TEST_CASE("CSV candle directory", "[DataSources][Csv]")
{
  ScratchDirectory dir;
  dir.write("TOK.csv",
	    "timestamp,open,high,low,close,volume\n"
	    "2024-01-01 00:02:00,1.10,1.30,1.00,1.20,500\n"
	    "2024-01-01 00:00:00,1.00,1.10,0.90,1.05,100\n"
	    "2024-01-01 00:01:00,1.05,1.20,1.00,1.10,\n"
	    "2024-01-01 00:03:00,1.20,1.25,1.10,1.15,50\n");
  dir.write("BAD.csv",
	    "timestamp,open,high,low,close,volume\n"
	    "2024-01-01 00:00:00,abc,1.10,0.90,1.05,100\n");

  const CsvCandleDirectoryLookup lookup(dir.path());

  SECTION("Rows inside the window come back sorted")
  {
    const CandleSeries candles = lookup.loadCandles("TOK", minutesAfterBase(0), minutesAfterBase(3), 60);
    REQUIRE(candles.size() == 3);
    REQUIRE(candles[0].getTime() == minutesAfterBase(0));
    REQUIRE(candles[1].getVolume() == 0.0);
    REQUIRE(candles[2].getHigh() == Approx(1.30));
  }

  SECTION("A missing file is an empty series")
  {
    REQUIRE(lookup.loadCandles("NONE", minutesAfterBase(0), minutesAfterBase(3), 60).empty());
  }

  SECTION("A malformed number is a data source error")
  {
    REQUIRE_THROWS_AS(lookup.loadCandles("BAD", minutesAfterBase(0), minutesAfterBase(3), 60),
		      DataSourceException);
  }

  SECTION("A missing directory is rejected")
  {
    REQUIRE_THROWS_AS(CsvCandleDirectoryLookup(dir.path() + "/missing"), DataSourceException);
  }
}

TEST_CASE("CSV alert file", "[DataSources][Csv]")
{
  ScratchDirectory dir;
  const std::string file = dir.write("alerts.csv",
				     "token_id,chain,alert_time,caller,market_cap_usd\n"
				     "TOK2,solana,2024-01-01T00:10:00Z,alice,250000\n"
				     "TOK1,solana,2024-01-01 00:05:00,bob,\n"
				     "TOK3,base,2024-01-01 00:06:00,alice,\n");

  const CsvAlertSource source(file);

  SECTION("Every row is read in file order")
  {
    const std::vector<Alert> all = source.readAll();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].getTokenId() == "TOK2");
    REQUIRE(all[0].getMarketCapUsd() == 250000.0);
    REQUIRE_FALSE(all[1].getMarketCapUsd().has_value());
    REQUIRE(all[2].getChain() == "base");
  }

  SECTION("Loading filters by chain and sorts by time")
  {
    const std::vector<Alert> picked = source.loadAlerts("solana", minutesAfterBase(0), minutesAfterBase(60));
    REQUIRE(picked.size() == 2);
    REQUIRE(picked[0].getTokenId() == "TOK1");
    REQUIRE(picked[0].getCaller() == "bob");
  }

  SECTION("A missing file is rejected at construction")
  {
    REQUIRE_THROWS_AS(CsvAlertSource(dir.path() + "/none.csv"), DataSourceException);
  }
}
