#pragma once

#include <string>
#include <vector>

#include "BatchRunner.h"
#include "OptimizationRun.h"
#include "RunSummary.h"

#include <rapidjson/document.h>

namespace alertoptimizer {

class OptimizerConfiguration;

/**
 * @brief Writes optimizer output as JSON with stable, snake_case field names
 *
 * Absent optional values are written as null and infinite ratios as the
 * string "inf", so the output stays valid JSON for downstream tooling.
 */
class ResultSerializer {
public:
    /**
     * @brief Serialize a whole grid run: configuration, per-phase timings and
     * every cell ranked by @p rankBy (failed cells last)
     */
    static std::string runToJson(const alertbt::OptimizationRun& run,
                                 const OptimizerConfiguration& config,
                                 alertbt::RankKey rankBy);

    /**
     * @brief Serialize @p run and write it to @p filePath.
     *
     * The time spent building the document is recorded on @p run as the
     * "save" phase and written as timing.save_s; the file write itself is
     * not part of it.
     * @return True if successful, false otherwise
     */
    static bool saveRun(alertbt::OptimizationRun& run,
                        const OptimizerConfiguration& config,
                        alertbt::RankKey rankBy,
                        const std::string& filePath);

    /**
     * @brief Serialize one policy run: the policy, its summary, the caller
     * leaderboard and every per-alert row
     */
    static std::string batchToJson(const alertbt::PolicyConfig& policy,
                                   const alertbt::RunSummary& summary,
                                   const std::vector<alertbt::CallerSummary>& callers,
                                   const std::vector<alertbt::AlertResult>& rows);

    /**
     * @brief Write @p json to @p filePath
     * @return True if successful, false otherwise
     */
    static bool saveToFile(const std::string& json, const std::string& filePath);

    static rapidjson::Value serializePolicy(const alertbt::PolicyConfig& policy,
                                            rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeSummary(const alertbt::RunSummary& summary,
                                             rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeObjective(const alertbt::ObjectiveComponents& objective,
                                               rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeResult(const alertbt::OptimizationResult& result,
                                            rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeAlertResult(const alertbt::AlertResult& row,
                                                 rapidjson::Document::AllocatorType& allocator);

private:
    static void buildRunDocument(const alertbt::OptimizationRun& run,
                                 const OptimizerConfiguration& config,
                                 alertbt::RankKey rankBy,
                                 rapidjson::Document& doc);
    static std::string toPrettyString(const rapidjson::Document& doc);
};

} // namespace alertoptimizer
