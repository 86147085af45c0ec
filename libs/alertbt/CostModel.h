#pragma once

#include <cmath>
#include <stdexcept>

namespace alertbt
{
  /**
   * @brief Converts raw entry/exit prices into a net return after costs.
   *
   * Slippage is paid on both legs; the fee is charged on the exit leg:
   *   effective_entry = entry * (1 + slippage_bps / 10000)
   *   effective_exit  = exit  * (1 - (fee_bps + slippage_bps) / 10000)
   *   net_return      = effective_exit / effective_entry - 1
   */
  class CostModel
  {
  public:
    static constexpr double kBasisPointsPerUnit = 10000.0;

    CostModel(double feeBps, double slippageBps)
      : mFeeBps(feeBps),
	mSlippageBps(slippageBps)
    {
      if (!std::isfinite(feeBps) || feeBps < 0.0)
	throw std::invalid_argument("CostModel: fee_bps must be finite and >= 0");
      if (!std::isfinite(slippageBps) || slippageBps < 0.0)
	throw std::invalid_argument("CostModel: slippage_bps must be finite and >= 0");
    }

    double apply(double entryPrice, double exitPrice) const
    {
      return netReturn(entryPrice, exitPrice, mFeeBps, mSlippageBps);
    }

    double getFeeBps() const
    {
      return mFeeBps;
    }

    double getSlippageBps() const
    {
      return mSlippageBps;
    }

    static double effectiveEntry(double entryPrice, double slippageBps)
    {
      return entryPrice * (1.0 + slippageBps / kBasisPointsPerUnit);
    }

    static double effectiveExit(double exitPrice, double feeBps, double slippageBps)
    {
      return exitPrice * (1.0 - (feeBps + slippageBps) / kBasisPointsPerUnit);
    }

    static double netReturn(double entryPrice, double exitPrice, double feeBps, double slippageBps)
    {
      if (!(entryPrice > 0.0) || !std::isfinite(entryPrice))
	throw std::invalid_argument("CostModel::netReturn: entry price must be > 0");

      return effectiveExit(exitPrice, feeBps, slippageBps) / effectiveEntry(entryPrice, slippageBps) - 1.0;
    }

  private:
    double mFeeBps;
    double mSlippageBps;
  };
}
