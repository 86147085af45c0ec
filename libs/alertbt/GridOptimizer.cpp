#include "GridOptimizer.h"
#include "AlertBacktestException.h"
#include "Logger.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

#include <atomic>
#include <cmath>
#include <exception>

namespace alertbt
{
  GridOptimizer::GridOptimizer(const GridOptimizerOptions& options)
    : mOptions(options),
      mSummarizer(options.riskPerTrade),
      mScorer(options.objective)
  {}

  OptimizationResult GridOptimizer::evaluateCell(std::size_t cellIndex,
						 const ParameterGrid& grid,
						 const BatchRunner& runner,
						 const std::vector<AlertWindow>& windows,
						 const std::string& runId) const
  {
    const PhaseTimer timer;
    OptimizationResult result;
    result.cellIndex = cellIndex;
    result.runId = runId;

    try
      {
	result.policy = grid.cellAt(cellIndex);

	// Cells already run on the pool; alerts stay on this worker
	concurrency::SingleThreadExecutor inlineExecutor;
	const std::vector<AlertResult> rows = runner.evaluateWindows(windows, *result.policy, inlineExecutor);

	result.summary = mSummarizer.summarize(rows, *result.policy);
	result.objective = mScorer.score(result.summary);
      }
    catch (const std::exception& e)
      {
	result.failure = std::string(e.what());
	ALERTBT_LOG_ERROR("Grid cell {} failed: {}", cellIndex, e.what());
      }

    result.durationSeconds = timer.elapsedSeconds();
    return result;
  }

  OptimizationRun GridOptimizer::run(const std::vector<Alert>& alerts,
				     const ICandleLookup& candleLookup,
				     const ParameterSpace& space,
				     concurrency::IParallelExecutor& executor,
				     const std::string& runId) const
  {
    const ParameterGrid grid(space, mOptions.feeBps, mOptions.slippageBps);
    const BatchRunner runner(candleLookup, mOptions.intervalSeconds, mOptions.horizonHours,
			     mOptions.limits);

    OptimizationRun run(runId);
    const std::size_t total = grid.size();

    ALERTBT_LOG_INFO("Grid run {}: {} alerts x {} cells", runId, alerts.size(), total);

    // Candle loads and cells share one cap on in-flight work
    concurrency::BoundedExecutor bounded(executor, mOptions.maxConcurrentCells);

    const PhaseTimer loadTimer;
    const std::vector<AlertWindow> windows = runner.prepareWindows(alerts, bounded);
    run.recordPhase("load_candles", loadTimer.elapsedSeconds());

    std::vector<OptimizationResult> slots(total);
    std::atomic<std::size_t> completed{0};

    const PhaseTimer gridTimer;
    concurrency::parallel_for(total, bounded,
			      [&](std::size_t i) {
				slots[i] = evaluateCell(i, grid, runner, windows, runId);
				const std::size_t done = ++completed;
				const OptimizationResult& r = slots[i];
				if (r.isFailed())
				  ALERTBT_LOG_WARN("[{}/{}] cell {} failed", done, total, i);
				else
				  ALERTBT_LOG_INFO("[{}/{}] {} ok={} score={:.4f} total_r={:+.2f}",
						   done, total, r.policy->describe(),
						   r.summary.alertsOk, r.objective.finalScore,
						   r.summary.totalR);
			      },
			      total);
    run.recordPhase("grid", gridTimer.elapsedSeconds());

    for (const OptimizationResult& r : slots)
      run.append(r);

    ALERTBT_LOG_INFO("Grid run {} finished: {} cells, {} failed", runId, run.size(), run.failedCount());
    return run;
  }

  void GridOptimizer::logRunReport(const OptimizationRun& run, const ObjectiveConfig& config,
				   std::size_t topN)
  {
    const std::vector<OptimizationResult> byScore = run.rankBy(RankKey::ObjectiveScore);
    ALERTBT_LOG_INFO("Top {} by objective score:", topN);
    for (std::size_t i = 0; i < byScore.size() && i < topN; ++i)
      {
	const OptimizationResult& r = byScore[i];
	if (r.isFailed())
	  break;
	ALERTBT_LOG_INFO("  {}. {} score={:+.4f} avg_r={:+.2f} win_rate={:.1f}% loss_r={:.2f}",
			 i + 1, r.policy->describe(), r.objective.finalScore, r.summary.avgR,
			 r.summary.winRate * 100.0, r.summary.avgRLoss);
      }

    const std::optional<OptimizationResult> best = run.getBest(RankKey::ObjectiveScore);
    if (best)
      {
	const ObjectiveComponents& c = best->objective;
	ALERTBT_LOG_INFO("Best objective breakdown ({}):", best->policy->describe());
	ALERTBT_LOG_INFO("  base ({}):       {:+.4f}", primaryMetricToString(config.primaryMetric), c.baseValue);
	ALERTBT_LOG_INFO("  dd penalty:      -{:.4f} x {}", c.ddPenalty, config.ddPenaltyWeight);
	ALERTBT_LOG_INFO("  time boost:      +{:.4f} x {}", c.timeBoost, config.timeBoostWeight);
	ALERTBT_LOG_INFO("  discipline:      +{:.4f}", c.disciplineBonus);
	ALERTBT_LOG_INFO("  tail bonus:      +{:.4f}", c.tailBonus);
	ALERTBT_LOG_INFO("  win rate pen.:   -{:.4f} x {}", c.winRatePenalty, config.winRatePenaltyWeight);
	ALERTBT_LOG_INFO("  loss R pen.:     -{:.4f} x {}", c.lossRPenalty, config.lossRPenaltyWeight);
	ALERTBT_LOG_INFO("  confidence:      {:.4f}", c.confidence);
	ALERTBT_LOG_INFO("  final score:     {:+.4f}", c.finalScore);
      }
    else
      ALERTBT_LOG_WARN("No successful grid cell to report");

    const std::vector<OptimizationResult> byTotalR = run.rankBy(RankKey::TotalR);
    ALERTBT_LOG_INFO("Top {} by total R:", topN);
    for (std::size_t i = 0; i < byTotalR.size() && i < topN; ++i)
      {
	const OptimizationResult& r = byTotalR[i];
	if (r.isFailed())
	  break;
	ALERTBT_LOG_INFO("  {}. {} total_r={:+.2f} avg_r={:+.3f} pf={:.2f}", i + 1,
			 r.policy->describe(), r.summary.totalR, r.summary.avgR,
			 r.rankValue(RankKey::ProfitFactor));
      }

    ALERTBT_LOG_INFO("Implied loss R check (expected -1R +/- {}):", kLossRDriftTolerance);
    for (const OptimizationResult& r : run.getResults())
      {
	if (r.isFailed() || !r.summary.hasEligibleTrades())
	  continue;
	const double drift = std::fabs(r.summary.avgRLoss + 1.0);
	if (drift > kLossRDriftTolerance)
	  ALERTBT_LOG_WARN("  {} loss_r={:.3f} drift={:.3f} CHECK", r.policy->describe(),
			   r.summary.avgRLoss, drift);
	else
	  ALERTBT_LOG_INFO("  {} loss_r={:.3f} ok", r.policy->describe(), r.summary.avgRLoss);
      }
  }
}
