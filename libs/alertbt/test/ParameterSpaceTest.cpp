// ParameterSpaceTest.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <set>

#include "ParameterSpace.h"
#include "AlertBacktestException.h"

using namespace alertbt;
using Catch::Approx;

TEST_CASE("RangeSpec expansion", "[ParameterSpace]")
{
  SECTION("Explicit values are used as given")
  {
    const RangeSpec spec = RangeSpec::values({3.0, 1.5, 2.0});
    REQUIRE(spec.expand() == std::vector<double>{3.0, 1.5, 2.0});
    REQUIRE(spec.count() == 3);
    REQUIRE(spec.getKind() == RangeSpec::Kind::Values);
  }

  SECTION("Linear range includes the end point")
  {
    const std::vector<double> v = RangeSpec::linear(1.0, 2.0, 0.5).expand();
    REQUIRE(v == std::vector<double>{1.0, 1.5, 2.0});
  }

  SECTION("Linear range absorbs floating point drift")
  {
    const std::vector<double> v = RangeSpec::linear(0.1, 0.5, 0.1).expand();
    REQUIRE(v.size() == 5);
    REQUIRE(v[2] == 0.3);
    REQUIRE(v.back() == 0.5);
  }

  SECTION("A step larger than the span yields only the start")
  {
    REQUIRE(RangeSpec::linear(1.0, 1.5, 2.0).expand() == std::vector<double>{1.0});
  }

  SECTION("Log range has steps + 1 points between start and end")
  {
    const std::vector<double> v = RangeSpec::logScale(1.0, 100.0, 2).expand();
    REQUIRE(v.size() == 3);
    REQUIRE(v[0] == Approx(1.0));
    REQUIRE(v[1] == Approx(10.0));
    REQUIRE(v[2] == Approx(100.0));
  }

  SECTION("Log range values are rounded to four decimals")
  {
    const std::vector<double> v = RangeSpec::logScale(1.0, 2.0, 3).expand();
    REQUIRE(v.size() == 4);
    REQUIRE(v[1] == 1.2599);
  }
}

TEST_CASE("RangeSpec validation", "[ParameterSpace]")
{
  REQUIRE_THROWS_AS(RangeSpec::values({}), ParameterSpaceException);
  REQUIRE_THROWS_AS(RangeSpec::linear(1.0, 2.0, 0.0), ParameterSpaceException);
  REQUIRE_THROWS_AS(RangeSpec::linear(3.0, 2.0, 0.5), ParameterSpaceException);
  REQUIRE_THROWS_AS(RangeSpec::logScale(0.0, 2.0, 5), ParameterSpaceException);
  REQUIRE_THROWS_AS(RangeSpec::logScale(1.0, 2.0, 0), ParameterSpaceException);
}

TEST_CASE("ParameterGrid enumeration", "[ParameterSpace]")
{
  SECTION("Default space is tp x sl with extensions disabled")
  {
    const ParameterGrid grid(ParameterSpace(), 30.0, 50.0);
    REQUIRE(grid.size() == 6);

    const PolicyConfig first = grid.cellAt(0);
    REQUIRE(first.getTpMult() == 1.5);
    REQUIRE(first.getSlMult() == 0.5);
    REQUIRE(first.getFeeBps() == 30.0);
    REQUIRE(first.getSlippageBps() == 50.0);
    REQUIRE_FALSE(first.getTimeStopHours().has_value());
    REQUIRE_FALSE(first.getBreakeven().has_value());
    REQUIRE_FALSE(first.getTrailing().has_value());
  }

  SECTION("Stop loss varies faster than take profit")
  {
    const ParameterGrid grid(ParameterSpace(), 30.0, 50.0);
    REQUIRE(grid.cellAt(1).getTpMult() == 1.5);
    REQUIRE(grid.cellAt(1).getSlMult() == 0.7);
    REQUIRE(grid.cellAt(2).getTpMult() == 2.0);
    REQUIRE(grid.cellAt(2).getSlMult() == 0.5);
    REQUIRE(grid.cellAt(5).getTpMult() == 3.0);
  }

  SECTION("Enabled extensions multiply the grid")
  {
    ParameterSpace space;
    space.tpSl.intrabarOrders = {IntrabarOrder::SlFirst, IntrabarOrder::TpFirst};
    space.timeStop.enabled = true;
    space.timeStop.hours = RangeSpec::values({6.0, 12.0});
    space.trailing.enabled = true;
    space.trailing.activationPct = RangeSpec::values({0.3, 0.5});

    const ParameterGrid grid(space, 0.0, 0.0);
    REQUIRE(grid.size() == 3 * 2 * 2 * 2 * 1 * 2);

    const PolicyConfig c0 = grid.cellAt(0);
    const PolicyConfig c1 = grid.cellAt(1);
    REQUIRE(c0.getTrailing()->getActivationPct() == 0.3);
    REQUIRE(c1.getTrailing()->getActivationPct() == 0.5);
    REQUIRE(c1.getTimeStopHours() == 6.0);
    REQUIRE(grid.cellAt(2).getTimeStopHours() == 12.0);
    REQUIRE(grid.cellAt(4).getIntrabarOrder() == IntrabarOrder::TpFirst);
  }

  SECTION("Every cell is distinct")
  {
    ParameterSpace space;
    space.breakeven.enabled = true;
    space.breakeven.triggerPct = RangeSpec::linear(0.1, 0.3, 0.1);
    const ParameterGrid grid(space, 30.0, 50.0);

    std::set<std::string> seen;
    for (std::size_t i = 0; i < grid.size(); ++i)
      seen.insert(grid.cellAt(i).describe());
    REQUIRE(seen.size() == grid.size());
  }

  SECTION("Out of range index throws")
  {
    const ParameterGrid grid(ParameterSpace(), 30.0, 50.0);
    REQUIRE_THROWS_AS(grid.cellAt(grid.size()), std::out_of_range);
  }

  SECTION("Structurally invalid values surface when the cell is built")
  {
    ParameterSpace space;
    space.tpSl.slMult = RangeSpec::values({0.5, -0.2});
    const ParameterGrid grid(space, 30.0, 50.0);

    REQUIRE_NOTHROW(grid.cellAt(0));
    REQUIRE_THROWS_AS(grid.cellAt(1), PolicyConfigException);
  }

  SECTION("An empty intrabar order list is rejected")
  {
    ParameterSpace space;
    space.tpSl.intrabarOrders.clear();
    REQUIRE_THROWS_AS(ParameterGrid(space, 30.0, 50.0), ParameterSpaceException);
  }
}
