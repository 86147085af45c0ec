#pragma once

#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace alertbt
{
  using boost::posix_time::ptime;

  /**
   * @brief A timestamped signal on a token that triggers a hypothetical entry.
   */
  class Alert
  {
  public:
    Alert(const std::string& tokenId,
	  const ptime& alertTime,
	  const std::string& caller = std::string(),
	  std::optional<double> marketCapUsd = std::nullopt,
	  const std::string& chain = std::string("solana"))
      : mTokenId(tokenId),
	mAlertTime(alertTime),
	mCaller(caller),
	mMarketCapUsd(marketCapUsd),
	mChain(chain)
    {}

    const std::string& getTokenId() const
    {
      return mTokenId;
    }

    const ptime& getAlertTime() const
    {
      return mAlertTime;
    }

    const std::string& getCaller() const
    {
      return mCaller;
    }

    const std::optional<double>& getMarketCapUsd() const
    {
      return mMarketCapUsd;
    }

    const std::string& getChain() const
    {
      return mChain;
    }

  private:
    std::string mTokenId;
    ptime mAlertTime;
    std::string mCaller;
    std::optional<double> mMarketCapUsd;
    std::string mChain;
  };

  // Ordering used by alert sources: (alert time, token id)
  inline bool alertTimeTokenLess(const Alert& lhs, const Alert& rhs)
  {
    if (lhs.getAlertTime() != rhs.getAlertTime())
      return lhs.getAlertTime() < rhs.getAlertTime();
    return lhs.getTokenId() < rhs.getTokenId();
  }
}
