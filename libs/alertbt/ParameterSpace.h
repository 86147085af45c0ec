#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "PolicyConfig.h"

namespace alertbt
{
  /**
   * @brief Declarative description of one numeric grid dimension.
   *
   *  - Values : an explicit list, used as given
   *  - Linear : start, start + step, ... while <= end (+1e-9), rounded to 6 decimals
   *  - Log    : step + 1 points evenly spaced in log10 between start and end,
   *             rounded to 4 decimals; start and end must be > 0
   *
   * Construction validates the description and throws ParameterSpaceException.
   */
  class RangeSpec
  {
  public:
    enum class Kind
      {
	Values,
	Linear,
	Log
      };

    static constexpr double kDefaultLinearStep = 0.1;
    static constexpr int kDefaultLogSteps = 10;

    static RangeSpec values(const std::vector<double>& values);
    static RangeSpec linear(double start, double end, double step = kDefaultLinearStep);
    static RangeSpec logScale(double start, double end, int steps = kDefaultLogSteps);

    std::vector<double> expand() const;

    std::size_t count() const
    {
      return expand().size();
    }

    Kind getKind() const
    {
      return mKind;
    }

    const std::vector<double>& getValues() const
    {
      return mValues;
    }

    double getStart() const
    {
      return mStart;
    }

    double getEnd() const
    {
      return mEnd;
    }

    double getStep() const
    {
      return mStep;
    }

  private:
    RangeSpec(Kind kind, const std::vector<double>& values, double start, double end, double step);

    Kind mKind;
    std::vector<double> mValues;
    double mStart;
    double mEnd;
    double mStep;
  };

  struct TpSlSpace
  {
    RangeSpec tpMult = RangeSpec::values({1.5, 2.0, 3.0});
    RangeSpec slMult = RangeSpec::values({0.5, 0.7});
    std::vector<IntrabarOrder> intrabarOrders{IntrabarOrder::SlFirst};
  };

  struct TimeStopSpace
  {
    bool enabled = false;
    RangeSpec hours = RangeSpec::values({24.0});
  };

  struct BreakevenSpace
  {
    bool enabled = false;
    RangeSpec triggerPct = RangeSpec::values({0.20});
    RangeSpec offsetPct = RangeSpec::values({0.0});
  };

  struct TrailingSpace
  {
    bool enabled = false;
    RangeSpec activationPct = RangeSpec::values({0.30});
    RangeSpec distancePct = RangeSpec::values({0.15});
  };

  /**
   * @brief The policy search space: TP/SL is always present; each extension
   * contributes a dimension only when enabled, otherwise a single disabled cell.
   */
  struct ParameterSpace
  {
    TpSlSpace tpSl;
    TimeStopSpace timeStop;
    BreakevenSpace breakeven;
    TrailingSpace trailing;
  };

  /**
   * @brief Indexed view of the Cartesian product of a ParameterSpace.
   *
   * Each dimension is expanded once; cells are built on demand by cellAt(), so
   * the product itself is never materialized. Cell order is
   * tp x sl x intrabar order x time stop x break-even x trailing, with the
   * last dimension varying fastest.
   */
  class ParameterGrid
  {
  public:
    ParameterGrid(const ParameterSpace& space, double feeBps, double slippageBps);

    std::size_t size() const
    {
      return mSize;
    }

    /**
     * @throws std::out_of_range for an index >= size()
     * @throws PolicyConfigException when the cell's parameters are structurally invalid
     */
    PolicyConfig cellAt(std::size_t index) const;

  private:
    std::vector<double> mTpValues;
    std::vector<double> mSlValues;
    std::vector<IntrabarOrder> mOrders;
    std::vector<std::optional<double>> mTimeStops;
    std::vector<std::optional<std::pair<double, double>>> mBreakevens;
    std::vector<std::optional<std::pair<double, double>>> mTrailings;
    double mFeeBps;
    double mSlippageBps;
    std::size_t mSize;
  };
}
