#pragma once

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace alertbt
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  inline const ptime& unixEpoch()
  {
    static const ptime epoch(boost::gregorian::date(1970, 1, 1));
    return epoch;
  }

  inline long long toEpochSeconds(const ptime& t)
  {
    return (t - unixEpoch()).total_seconds();
  }

  inline ptime fromEpochSeconds(long long seconds)
  {
    return unixEpoch() + boost::posix_time::seconds(static_cast<long>(seconds));
  }

  /**
   * @brief Rounds a timestamp up to the next multiple of @p intervalSeconds
   * counted from the Unix epoch. Timestamps already on a boundary are returned
   * unchanged.
   */
  inline ptime ceilToInterval(const ptime& t, long intervalSeconds)
  {
    if (intervalSeconds <= 0)
      throw std::invalid_argument("ceilToInterval: interval must be positive");

    const long long micros = (t - unixEpoch()).total_microseconds();
    const long long step = static_cast<long long>(intervalSeconds) * 1000000LL;

    long long q = micros / step;
    if (micros > 0 && (micros % step) != 0)
      ++q;

    return unixEpoch() + boost::posix_time::microseconds(q * step);
  }

  inline long secondsBetween(const ptime& from, const ptime& to)
  {
    return static_cast<long>((to - from).total_seconds());
  }

  inline std::string toIsoString(const ptime& t)
  {
    return boost::posix_time::to_iso_extended_string(t) + "Z";
  }

  /**
   * @brief Parses "YYYY-MM-DD HH:MM:SS", its ISO-8601 "T"/"Z" variant, or a
   * bare count of epoch seconds.
   */
  inline ptime parseTimestamp(std::string text)
  {
    text.erase(std::remove_if(text.begin(), text.end(),
			      [](unsigned char c) { return c == '"'; }),
	       text.end());
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
      text.pop_back();
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
      text.erase(text.begin());

    if (text.empty())
      throw std::invalid_argument("parseTimestamp: empty timestamp");

    if (std::all_of(text.begin(), text.end(),
		    [](unsigned char c) { return std::isdigit(c) != 0; }))
      return fromEpochSeconds(std::stoll(text));

    if (text.back() == 'Z')
      text.pop_back();
    std::replace(text.begin(), text.end(), 'T', ' ');

    try
      {
	const ptime parsed = boost::posix_time::time_from_string(text);
	if (parsed.is_special())
	  throw std::invalid_argument("parseTimestamp: not a valid time: " + text);
	return parsed;
      }
    catch (const std::invalid_argument&)
      {
	throw;
      }
    catch (const std::exception& e)
      {
	throw std::invalid_argument("parseTimestamp: cannot parse '" + text + "': " + e.what());
      }
  }
}
