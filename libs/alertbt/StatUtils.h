#pragma once

#include <algorithm>
#include <optional>
#include <vector>

namespace alertbt
{
  namespace stats
  {
    /**
     * @brief Median of a sample. Sorts a local copy so the caller's data is not
     * mutated; returns nullopt for an empty sample.
     */
    inline std::optional<double> median(std::vector<double> data)
    {
      if (data.empty())
	return std::nullopt;

      std::sort(data.begin(), data.end());
      const std::size_t n = data.size();
      if ((n % 2) == 0)
	return (data[n / 2 - 1] + data[n / 2]) / 2.0;
      else
	return data[n / 2];
    }

    /**
     * @brief Nearest-rank style percentile: sorted[min(floor(n * p), n - 1)].
     */
    inline std::optional<double> percentile(std::vector<double> data, double p)
    {
      if (data.empty())
	return std::nullopt;

      std::sort(data.begin(), data.end());
      const double clamped = std::min(std::max(p, 0.0), 1.0);
      std::size_t idx = static_cast<std::size_t>(static_cast<double>(data.size()) * clamped);
      idx = std::min(idx, data.size() - 1);
      return data[idx];
    }

    inline double sum(const std::vector<double>& data)
    {
      double total = 0.0;
      for (double v : data)
	total += v;
      return total;
    }

    inline double mean(const std::vector<double>& data)
    {
      return data.empty() ? 0.0 : sum(data) / static_cast<double>(data.size());
    }
  }
}
