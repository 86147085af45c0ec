#pragma once

#include <optional>
#include <string>

namespace alertbt
{
  /**
   * @brief Resolution order when a single candle touches both the take-profit
   * and the stop. SlFirst is the conservative default.
   */
  enum class IntrabarOrder
    {
      SlFirst,
      TpFirst
    };

  std::string intrabarOrderToString(IntrabarOrder order);
  IntrabarOrder intrabarOrderFromString(const std::string& text);

  /**
   * @brief Move the stop to entry * (1 + offset) once the running maximum high
   * is at least trigger above entry.
   */
  class BreakevenRule
  {
  public:
    explicit BreakevenRule(double triggerPct, double offsetPct = 0.0);

    double getTriggerPct() const
    {
      return mTriggerPct;
    }

    double getOffsetPct() const
    {
      return mOffsetPct;
    }

  private:
    double mTriggerPct;
    double mOffsetPct;
  };

  /**
   * @brief Trail the stop at running_max_high * (1 - distance) once the running
   * maximum high is at least activation above entry.
   */
  class TrailingRule
  {
  public:
    TrailingRule(double activationPct, double distancePct);

    double getActivationPct() const
    {
      return mActivationPct;
    }

    double getDistancePct() const
    {
      return mDistancePct;
    }

  private:
    double mActivationPct;
    double mDistancePct;
  };

  /**
   * @brief Immutable exit policy for one backtest run.
   *
   * Construction validates the structural constraints and throws
   * PolicyConfigException before any candle data is touched:
   *  - tpMult, slMult finite and > 0
   *  - feeBps, slippageBps finite and >= 0
   *  - timeStopHours, when present, > 0
   *  - the optional break-even and trailing rules validate themselves
   */
  class PolicyConfig
  {
  public:
    PolicyConfig(double tpMult,
		 double slMult,
		 IntrabarOrder intrabarOrder = IntrabarOrder::SlFirst,
		 double feeBps = 30.0,
		 double slippageBps = 50.0,
		 std::optional<double> timeStopHours = std::nullopt,
		 std::optional<BreakevenRule> breakeven = std::nullopt,
		 std::optional<TrailingRule> trailing = std::nullopt);

    double getTpMult() const
    {
      return mTpMult;
    }

    double getSlMult() const
    {
      return mSlMult;
    }

    IntrabarOrder getIntrabarOrder() const
    {
      return mIntrabarOrder;
    }

    double getFeeBps() const
    {
      return mFeeBps;
    }

    double getSlippageBps() const
    {
      return mSlippageBps;
    }

    const std::optional<double>& getTimeStopHours() const
    {
      return mTimeStopHours;
    }

    const std::optional<BreakevenRule>& getBreakeven() const
    {
      return mBreakeven;
    }

    const std::optional<TrailingRule>& getTrailing() const
    {
      return mTrailing;
    }

    /**
     * @brief Fraction of the position lost when the fixed stop fills
     * (1 - slMult), falling back to 0.5 when the stop is at or above entry.
     * This is the unit used to express returns as R multiples.
     */
    double getMaxLossFraction() const;

    /** @return short human readable description, used in log lines */
    std::string describe() const;

  private:
    double mTpMult;
    double mSlMult;
    IntrabarOrder mIntrabarOrder;
    double mFeeBps;
    double mSlippageBps;
    std::optional<double> mTimeStopHours;
    std::optional<BreakevenRule> mBreakeven;
    std::optional<TrailingRule> mTrailing;
  };
}
