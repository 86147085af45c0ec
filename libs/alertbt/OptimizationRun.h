#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ObjectiveScorer.h"
#include "PolicyConfig.h"
#include "RunSummary.h"

namespace alertbt
{
  /**
   * @brief Keys an OptimizationRun can be ranked by. Higher is better for all.
   */
  enum class RankKey
    {
      ObjectiveScore,
      TotalR,
      AvgR,
      WinRate,
      ProfitFactor,
      ExpectancyPct,
      RiskAdjTotalReturnPct,
      RProfitFactor
    };

  std::string rankKeyToString(RankKey key);
  RankKey rankKeyFromString(const std::string& text);

  // Infinite profit factors rank as this value
  constexpr double kProfitFactorCap = 999.99;

  /**
   * @brief Outcome of one grid cell. A failed cell carries the failure text and
   * no statistics; its policy is empty when the cell's parameters could not
   * form a PolicyConfig at all.
   */
  struct OptimizationResult
  {
    std::size_t cellIndex = 0;
    std::string runId;
    std::optional<PolicyConfig> policy;
    RunSummary summary;
    ObjectiveComponents objective;
    double durationSeconds = 0.0;
    std::optional<std::string> failure;

    bool isFailed() const
    {
      return failure.has_value();
    }

    double rankValue(RankKey key) const;
  };

  /**
   * @brief Append-only collection of the results of one grid run, plus
   * per-phase wall-clock timings. Ranking never reorders the stored results;
   * it returns a sorted copy with failed cells last.
   */
  class OptimizationRun
  {
  public:
    explicit OptimizationRun(const std::string& runId);

    void append(const OptimizationResult& result);

    const std::vector<OptimizationResult>& getResults() const
    {
      return mResults;
    }

    std::size_t size() const
    {
      return mResults.size();
    }

    std::size_t failedCount() const;

    std::vector<OptimizationResult> rankBy(RankKey key) const;

    /** @return the best successful cell, or nullopt when every cell failed */
    std::optional<OptimizationResult> getBest(RankKey key = RankKey::ObjectiveScore) const;

    void recordPhase(const std::string& phase, double seconds);

    const std::map<std::string, double>& getPhaseTimings() const
    {
      return mPhaseTimings;
    }

    const std::string& getRunId() const
    {
      return mRunId;
    }

  private:
    std::string mRunId;
    std::vector<OptimizationResult> mResults;
    std::map<std::string, double> mPhaseTimings;
  };

  /**
   * @brief Wall-clock stopwatch started at construction.
   */
  class PhaseTimer
  {
  public:
    PhaseTimer()
      : mStart(std::chrono::steady_clock::now())
    {}

    double elapsedSeconds() const
    {
      return std::chrono::duration<double>(std::chrono::steady_clock::now() - mStart).count();
    }

  private:
    std::chrono::steady_clock::time_point mStart;
  };
}
