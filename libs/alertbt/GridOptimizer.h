#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "Alert.h"
#include "BatchRunner.h"
#include "DataSources.h"
#include "ObjectiveScorer.h"
#include "OptimizationRun.h"
#include "ParameterSpace.h"
#include "Summarizer.h"
#include "IParallelExecutor.h"

namespace alertbt
{
  /**
   * @brief Fixed settings shared by every cell of a grid run.
   */
  struct GridOptimizerOptions
  {
    long intervalSeconds = 60;
    double horizonHours = 48.0;
    double feeBps = 30.0;
    double slippageBps = 50.0;
    double riskPerTrade = 0.02;
    EvaluationLimits limits;
    std::size_t maxConcurrentCells = 0;   // 0 = executor concurrency
    ObjectiveConfig objective;
  };

  /**
   * @brief Sweeps a ParameterSpace: for every grid cell builds a PolicyConfig,
   * runs the batch, summarizes and scores it.
   *
   * Candle windows are loaded once per run and shared read-only by all cells.
   * Cells are dispatched on the supplied executor with at most
   * maxConcurrentCells in flight; alerts inside a cell are evaluated
   * sequentially on the cell's worker. A cell that throws becomes a failed
   * result and the sweep continues.
   */
  class GridOptimizer
  {
  public:
    explicit GridOptimizer(const GridOptimizerOptions& options = GridOptimizerOptions());

    /**
     * @throws ParameterSpaceException when the space cannot be expanded
     */
    OptimizationRun run(const std::vector<Alert>& alerts,
			const ICandleLookup& candleLookup,
			const ParameterSpace& space,
			concurrency::IParallelExecutor& executor,
			const std::string& runId = std::string("grid")) const;

    const GridOptimizerOptions& getOptions() const
    {
      return mOptions;
    }

    const ObjectiveScorer& getScorer() const
    {
      return mScorer;
    }

    /** Log the top cells, the best cell's objective breakdown and the loss R check. */
    static void logRunReport(const OptimizationRun& run, const ObjectiveConfig& config,
			     std::size_t topN = 5);

  private:
    OptimizationResult evaluateCell(std::size_t cellIndex,
				    const ParameterGrid& grid,
				    const BatchRunner& runner,
				    const std::vector<AlertWindow>& windows,
				    const std::string& runId) const;

    GridOptimizerOptions mOptions;
    Summarizer mSummarizer;
    ObjectiveScorer mScorer;
  };

  // Flag cells whose average losing trade drifts this far from -1R
  constexpr double kLossRDriftTolerance = 0.3;
}
