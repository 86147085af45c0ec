#include "PolicyConfig.h"
#include "AlertBacktestException.h"

#include <cmath>
#include <sstream>
#include <iomanip>

namespace alertbt
{
  namespace
  {
    void requirePositive(double value, const char* name)
    {
      if (!std::isfinite(value) || value <= 0.0)
	{
	  std::ostringstream msg;
	  msg << "PolicyConfig: " << name << " must be a finite value > 0, got " << value;
	  throw PolicyConfigException(msg.str());
	}
    }

    void requireNonNegative(double value, const char* name)
    {
      if (!std::isfinite(value) || value < 0.0)
	{
	  std::ostringstream msg;
	  msg << "PolicyConfig: " << name << " must be a finite value >= 0, got " << value;
	  throw PolicyConfigException(msg.str());
	}
    }
  }

  std::string intrabarOrderToString(IntrabarOrder order)
  {
    return order == IntrabarOrder::TpFirst ? "tp_first" : "sl_first";
  }

  IntrabarOrder intrabarOrderFromString(const std::string& text)
  {
    if (text == "sl_first" || text == "SL_FIRST")
      return IntrabarOrder::SlFirst;
    if (text == "tp_first" || text == "TP_FIRST")
      return IntrabarOrder::TpFirst;

    throw PolicyConfigException("Unknown intrabar order: " + text);
  }

  BreakevenRule::BreakevenRule(double triggerPct, double offsetPct)
    : mTriggerPct(triggerPct),
      mOffsetPct(offsetPct)
  {
    requirePositive(triggerPct, "breakeven trigger_pct");
    if (!std::isfinite(offsetPct) || offsetPct <= -1.0)
      throw PolicyConfigException("PolicyConfig: breakeven offset_pct must be finite and > -1");
  }

  TrailingRule::TrailingRule(double activationPct, double distancePct)
    : mActivationPct(activationPct),
      mDistancePct(distancePct)
  {
    requirePositive(activationPct, "trailing activation_pct");
    if (!std::isfinite(distancePct) || distancePct <= 0.0 || distancePct >= 1.0)
      throw PolicyConfigException("PolicyConfig: trailing distance_pct must lie in (0, 1)");
  }

  PolicyConfig::PolicyConfig(double tpMult,
			     double slMult,
			     IntrabarOrder intrabarOrder,
			     double feeBps,
			     double slippageBps,
			     std::optional<double> timeStopHours,
			     std::optional<BreakevenRule> breakeven,
			     std::optional<TrailingRule> trailing)
    : mTpMult(tpMult),
      mSlMult(slMult),
      mIntrabarOrder(intrabarOrder),
      mFeeBps(feeBps),
      mSlippageBps(slippageBps),
      mTimeStopHours(timeStopHours),
      mBreakeven(std::move(breakeven)),
      mTrailing(std::move(trailing))
  {
    requirePositive(mTpMult, "tp_mult");
    requirePositive(mSlMult, "sl_mult");
    requireNonNegative(mFeeBps, "fee_bps");
    requireNonNegative(mSlippageBps, "slippage_bps");

    if (mTimeStopHours)
      requirePositive(*mTimeStopHours, "time_stop_hours");
  }

  double PolicyConfig::getMaxLossFraction() const
  {
    const double maxLoss = 1.0 - mSlMult;
    return maxLoss > 0.0 ? maxLoss : 0.5;
  }

  std::string PolicyConfig::describe() const
  {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
	<< "tp=" << mTpMult << "x sl=" << mSlMult << "x "
	<< intrabarOrderToString(mIntrabarOrder);

    if (mTimeStopHours)
      out << " time_stop=" << *mTimeStopHours << "h";
    if (mBreakeven)
      out << " be=" << mBreakeven->getTriggerPct() << "/" << mBreakeven->getOffsetPct();
    if (mTrailing)
      out << " trail=" << mTrailing->getActivationPct() << "/" << mTrailing->getDistancePct();

    return out.str();
  }
}
