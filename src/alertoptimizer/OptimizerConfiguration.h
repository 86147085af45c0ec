#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ObjectiveScorer.h"
#include "OptimizationRun.h"
#include "ParameterSpace.h"

namespace alertoptimizer {

/**
 * @brief Settings of one optimizer invocation
 *
 * Loaded from and saved to JSON. Every field has a default, so a partial
 * file only overrides what it names. The objective block may name a preset
 * ("default", "conservative", "aggressive") and then override single weights.
 */
class OptimizerConfiguration {
public:
    OptimizerConfiguration();

    /**
     * @brief Load configuration from JSON file
     * @return true if loaded successfully, false otherwise (see getLastError())
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * @brief Load configuration from JSON string
     * @return true if parsed successfully, false otherwise (see getLastError())
     */
    bool loadFromString(const std::string& jsonContent);

    /**
     * @brief Save current configuration to JSON file
     */
    bool saveToFile(const std::string& configPath) const;

    std::string toJsonString() const;

    /**
     * @brief Validate the configuration
     * @return Vector of validation errors (empty if valid)
     */
    std::vector<std::string> validate() const;

    const std::string& getLastError() const { return lastError_; }

    static OptimizerConfiguration createDefault();

    long getIntervalSeconds() const { return intervalSeconds_; }
    void setIntervalSeconds(long seconds) { intervalSeconds_ = seconds; }

    double getHorizonHours() const { return horizonHours_; }
    void setHorizonHours(double hours) { horizonHours_ = hours; }

    double getFeeBps() const { return feeBps_; }
    double getSlippageBps() const { return slippageBps_; }
    double getRiskPerTrade() const { return riskPerTrade_; }

    std::size_t getThreads() const { return threads_; }
    void setThreads(std::size_t threads) { threads_ = threads; }

    std::size_t getMaxConcurrentCells() const { return maxConcurrentCells_; }
    std::size_t getMaxCandlesPerAlert() const { return maxCandlesPerAlert_; }
    long getMaxEvalMillis() const { return maxEvalMillis_; }

    const std::string& getChain() const { return chain_; }
    const std::string& getDateFrom() const { return dateFrom_; }
    const std::string& getDateTo() const { return dateTo_; }

    const std::vector<std::string>& getCallerIds() const { return callerIds_; }
    std::size_t getMinTrades() const { return minTrades_; }

    const std::string& getOutputPath() const { return outputPath_; }
    void setOutputPath(const std::string& path) { outputPath_ = path; }

    const std::string& getRankBy() const { return rankBy_; }
    void setRankBy(const std::string& key) { rankBy_ = key; }

    const alertbt::ParameterSpace& getParameterSpace() const { return parameterSpace_; }
    void setParameterSpace(const alertbt::ParameterSpace& space) { parameterSpace_ = space; }

    const std::string& getObjectivePreset() const { return objectivePreset_; }
    const alertbt::ObjectiveConfig& getObjectiveConfig() const { return objective_; }
    void setObjectiveConfig(const alertbt::ObjectiveConfig& config) { objective_ = config; }

private:
    long intervalSeconds_;
    double horizonHours_;
    double feeBps_;
    double slippageBps_;
    double riskPerTrade_;
    std::size_t threads_;
    std::size_t maxConcurrentCells_;
    std::size_t maxCandlesPerAlert_;
    long maxEvalMillis_;
    std::string chain_;
    std::string dateFrom_;
    std::string dateTo_;
    std::vector<std::string> callerIds_;
    std::size_t minTrades_;
    std::string outputPath_;
    std::string rankBy_;
    alertbt::ParameterSpace parameterSpace_;
    std::string objectivePreset_;
    alertbt::ObjectiveConfig objective_;
    mutable std::string lastError_;

    bool parseJson(const std::string& jsonContent);

    void setError(const std::string& error) const { lastError_ = error; }
};

} // namespace alertoptimizer
