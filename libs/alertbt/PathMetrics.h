#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace alertbt
{
  /**
   * @brief Outcome class of one alert's evaluation.
   *
   *  - Ok       : evaluated normally
   *  - Missing  : fewer than two candles in the window (a coverage gap, not an error)
   *  - BadEntry : entry price non-positive or undefined
   *  - Error    : evaluation threw or exceeded its candle/time budget
   */
  enum class AlertStatus
    {
      Ok,
      Missing,
      BadEntry,
      Error
    };

  std::string alertStatusToString(AlertStatus status);

  constexpr std::size_t kTierCount = 7;

  // Price multiples of entry used as timing and drawdown milestones
  constexpr std::array<double, kTierCount> kTierLadder{{1.2, 1.5, 2.0, 3.0, 4.0, 5.0, 10.0}};

  /** @return position of @p multiple in kTierLadder; throws std::invalid_argument if absent */
  std::size_t tierIndex(double multiple);

  /** @return field-name label for a ladder tier, e.g. "1_2x", "2x", "10x" */
  std::string tierLabel(std::size_t index);

  /**
   * @brief Shape-of-path statistics beyond the core drawdown ladder.
   */
  struct PathQuality
  {
    std::size_t totalCandles = 0;
    std::size_t candlesBelowEntry = 0;
    std::size_t candles1p0To1p2 = 0;
    std::size_t candles1p2To1p5 = 0;
    std::size_t candles1p5To2p0 = 0;
    std::size_t candles2p0Plus = 0;

    double timeUnderwaterPct = 0.0;
    std::optional<double> timeInProfitPct;
    double stallScore = 0.0;

    std::optional<double> retention1p2xAbove1p1x;
    std::optional<double> retention1p5xAbove1p3x;
    bool floorHoldAfter1p2x = false;
    bool floorHoldAfter1p5x = false;
    std::optional<double> givebackAfter1p5x;
    std::optional<double> givebackAfter2x;

    bool isHeadfake = false;
    std::optional<double> headfakeDepth;
    bool headfakeRecovered = false;
  };

  /**
   * @brief Per-alert price path statistics relative to the entry price.
   *
   * Time offsets are whole seconds since the entry time. Drawdowns are
   * negative-or-zero ratios (min_low / reference - 1). Every tier-keyed field is
   * empty when that tier was never reached.
   *
   * Numeric fields are only meaningful when status is Ok.
   */
  struct PathMetrics
  {
    AlertStatus status = AlertStatus::Missing;
    double entryPrice = 0.0;
    std::size_t candleCount = 0;

    double athMult = 0.0;
    long timeToAthSeconds = 0;
    std::array<std::optional<long>, kTierCount> timeToTierSeconds{};
    std::optional<long> timeToRecoverySeconds;

    double ddInitial = 0.0;
    double ddOverall = 0.0;
    std::array<std::optional<double>, kTierCount> ddPreTier{};
    std::array<std::optional<double>, kTierCount> ddAfterTier{};
    std::optional<double> ddBand1p2To1p5;
    std::optional<double> ddBand1p5To2;
    std::optional<double> ddAfterAth;
    double ddPre2xOrHorizon = 0.0;

    double peakPnlPct = 0.0;
    double retEnd = 0.0;

    PathQuality quality;

    bool isOk() const
    {
      return status == AlertStatus::Ok;
    }

    bool tierReached(double multiple) const
    {
      return timeToTierSeconds[tierIndex(multiple)].has_value();
    }

    const std::optional<long>& timeToTier(double multiple) const
    {
      return timeToTierSeconds[tierIndex(multiple)];
    }

    const std::optional<double>& ddPre(double multiple) const
    {
      return ddPreTier[tierIndex(multiple)];
    }

    const std::optional<double>& ddAfter(double multiple) const
    {
      return ddAfterTier[tierIndex(multiple)];
    }
  };
}
