#include "ParameterSpace.h"
#include "AlertBacktestException.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace alertbt
{
  namespace
  {
    double roundTo(double value, int decimals)
    {
      const double scale = std::pow(10.0, decimals);
      return std::round(value * scale) / scale;
    }

    void requireFinite(double v, const char* what)
    {
      if (!std::isfinite(v))
	throw ParameterSpaceException(std::string("RangeSpec: ") + what + " must be finite");
    }

    std::vector<std::optional<std::pair<double, double>>>
    expandPairs(bool enabled, const RangeSpec& first, const RangeSpec& second)
    {
      std::vector<std::optional<std::pair<double, double>>> cells;
      if (!enabled)
	{
	  cells.push_back(std::nullopt);
	  return cells;
	}

      const std::vector<double> a = first.expand();
      const std::vector<double> b = second.expand();
      for (double x : a)
	for (double y : b)
	  cells.push_back(std::make_pair(x, y));
      return cells;
    }
  }

  RangeSpec::RangeSpec(Kind kind, const std::vector<double>& values, double start, double end, double step)
    : mKind(kind),
      mValues(values),
      mStart(start),
      mEnd(end),
      mStep(step)
  {}

  RangeSpec RangeSpec::values(const std::vector<double>& values)
  {
    if (values.empty())
      throw ParameterSpaceException("RangeSpec: explicit value list is empty");
    for (double v : values)
      requireFinite(v, "value");

    return RangeSpec(Kind::Values, values, 0.0, 0.0, 0.0);
  }

  RangeSpec RangeSpec::linear(double start, double end, double step)
  {
    requireFinite(start, "start");
    requireFinite(end, "end");
    requireFinite(step, "step");
    if (step <= 0.0)
      throw ParameterSpaceException("RangeSpec: linear step must be > 0");
    if (start > end)
      throw ParameterSpaceException("RangeSpec: start must be <= end");

    return RangeSpec(Kind::Linear, {}, start, end, step);
  }

  RangeSpec RangeSpec::logScale(double start, double end, int steps)
  {
    requireFinite(start, "start");
    requireFinite(end, "end");
    if (start <= 0.0 || end <= 0.0)
      throw ParameterSpaceException("RangeSpec: log scale requires positive start and end");
    if (steps < 1)
      throw ParameterSpaceException("RangeSpec: log scale requires at least one step");

    return RangeSpec(Kind::Log, {}, start, end, static_cast<double>(steps));
  }

  std::vector<double> RangeSpec::expand() const
  {
    if (mKind == Kind::Values)
      return mValues;

    std::vector<double> out;

    if (mKind == Kind::Log)
      {
	const int n = static_cast<int>(mStep);
	const double logStart = std::log10(mStart);
	const double logEnd = std::log10(mEnd);
	out.reserve(static_cast<std::size_t>(n) + 1);
	for (int i = 0; i <= n; ++i)
	  {
	    const double t = static_cast<double>(i) / static_cast<double>(n);
	    out.push_back(roundTo(std::pow(10.0, logStart + t * (logEnd - logStart)), 4));
	  }
	return out;
      }

    double current = mStart;
    while (current <= mEnd + 1e-9)
      {
	out.push_back(roundTo(current, 6));
	current += mStep;
      }
    return out;
  }

  ParameterGrid::ParameterGrid(const ParameterSpace& space, double feeBps, double slippageBps)
    : mTpValues(space.tpSl.tpMult.expand()),
      mSlValues(space.tpSl.slMult.expand()),
      mOrders(space.tpSl.intrabarOrders),
      mTimeStops(),
      mBreakevens(expandPairs(space.breakeven.enabled, space.breakeven.triggerPct,
			      space.breakeven.offsetPct)),
      mTrailings(expandPairs(space.trailing.enabled, space.trailing.activationPct,
			     space.trailing.distancePct)),
      mFeeBps(feeBps),
      mSlippageBps(slippageBps),
      mSize(0)
  {
    if (mOrders.empty())
      throw ParameterSpaceException("ParameterGrid: at least one intrabar order is required");

    if (space.timeStop.enabled)
      {
	for (double h : space.timeStop.hours.expand())
	  mTimeStops.push_back(h);
      }
    else
      mTimeStops.push_back(std::nullopt);

    mSize = mTpValues.size() * mSlValues.size() * mOrders.size() *
      mTimeStops.size() * mBreakevens.size() * mTrailings.size();
  }

  PolicyConfig ParameterGrid::cellAt(std::size_t index) const
  {
    if (index >= mSize)
      throw std::out_of_range("ParameterGrid: cell index " + std::to_string(index) +
			      " out of range (size " + std::to_string(mSize) + ")");

    std::size_t rest = index;
    const std::size_t trail = rest % mTrailings.size();
    rest /= mTrailings.size();
    const std::size_t be = rest % mBreakevens.size();
    rest /= mBreakevens.size();
    const std::size_t time = rest % mTimeStops.size();
    rest /= mTimeStops.size();
    const std::size_t order = rest % mOrders.size();
    rest /= mOrders.size();
    const std::size_t sl = rest % mSlValues.size();
    rest /= mSlValues.size();
    const std::size_t tp = rest;

    std::optional<BreakevenRule> breakeven;
    if (mBreakevens[be])
      breakeven = BreakevenRule(mBreakevens[be]->first, mBreakevens[be]->second);

    std::optional<TrailingRule> trailing;
    if (mTrailings[trail])
      trailing = TrailingRule(mTrailings[trail]->first, mTrailings[trail]->second);

    return PolicyConfig(mTpValues[tp], mSlValues[sl], mOrders[order], mFeeBps, mSlippageBps,
			mTimeStops[time], breakeven, trailing);
  }
}
