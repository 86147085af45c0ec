#include "ResultSerializer.h"
#include "OptimizerConfiguration.h"
#include "TimeUtils.h"

#include <cmath>
#include <fstream>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace alertoptimizer {

namespace {

using Allocator = Document::AllocatorType;

Value number(double v, Allocator& allocator) {
    if (std::isnan(v))
        return Value(kNullType);
    if (std::isinf(v))
        return Value(v > 0 ? "inf" : "-inf", allocator);
    return Value(v);
}

Value optionalNumber(const std::optional<double>& v, Allocator& allocator) {
    return v ? number(*v, allocator) : Value(kNullType);
}

Value optionalSeconds(const std::optional<long>& v) {
    return v ? Value(static_cast<int64_t>(*v)) : Value(kNullType);
}

Value text(const std::string& s, Allocator& allocator) {
    return Value(s.c_str(), allocator);
}

void add(Value& obj, const std::string& key, Value& value, Allocator& allocator) {
    Value name(key.c_str(), allocator);
    obj.AddMember(name, value, allocator);
}

void add(Value& obj, const std::string& key, Value&& value, Allocator& allocator) {
    add(obj, key, value, allocator);
}

} // namespace

Value ResultSerializer::serializePolicy(const alertbt::PolicyConfig& policy, Allocator& allocator) {
    Value out(kObjectType);
    add(out, "tp_mult", number(policy.getTpMult(), allocator), allocator);
    add(out, "sl_mult", number(policy.getSlMult(), allocator), allocator);
    add(out, "intrabar_order", text(alertbt::intrabarOrderToString(policy.getIntrabarOrder()), allocator), allocator);
    add(out, "fee_bps", number(policy.getFeeBps(), allocator), allocator);
    add(out, "slippage_bps", number(policy.getSlippageBps(), allocator), allocator);
    add(out, "time_stop_hours", optionalNumber(policy.getTimeStopHours(), allocator), allocator);

    if (policy.getBreakeven()) {
        add(out, "breakeven_trigger_pct", number(policy.getBreakeven()->getTriggerPct(), allocator), allocator);
        add(out, "breakeven_offset_pct", number(policy.getBreakeven()->getOffsetPct(), allocator), allocator);
    }
    else {
        add(out, "breakeven_trigger_pct", Value(kNullType), allocator);
        add(out, "breakeven_offset_pct", Value(kNullType), allocator);
    }

    if (policy.getTrailing()) {
        add(out, "trail_activation_pct", number(policy.getTrailing()->getActivationPct(), allocator), allocator);
        add(out, "trail_distance_pct", number(policy.getTrailing()->getDistancePct(), allocator), allocator);
    }
    else {
        add(out, "trail_activation_pct", Value(kNullType), allocator);
        add(out, "trail_distance_pct", Value(kNullType), allocator);
    }

    add(out, "description", text(policy.describe(), allocator), allocator);
    return out;
}

Value ResultSerializer::serializeSummary(const alertbt::RunSummary& s, Allocator& allocator) {
    Value out(kObjectType);
    add(out, "alerts_total", Value(static_cast<uint64_t>(s.alertsTotal)), allocator);
    add(out, "alerts_ok", Value(static_cast<uint64_t>(s.alertsOk)), allocator);
    add(out, "alerts_missing", Value(static_cast<uint64_t>(s.alertsMissing)), allocator);
    add(out, "alerts_bad_entry", Value(static_cast<uint64_t>(s.alertsBadEntry)), allocator);
    add(out, "alerts_error", Value(static_cast<uint64_t>(s.alertsError)), allocator);
    add(out, "has_eligible_trades", Value(s.hasEligibleTrades()), allocator);

    add(out, "median_ath_mult", optionalNumber(s.medianAthMult, allocator), allocator);
    add(out, "median_dd_initial", optionalNumber(s.medianDdInitial, allocator), allocator);
    add(out, "median_dd_overall", optionalNumber(s.medianDdOverall, allocator), allocator);
    add(out, "median_dd_after_2x", optionalNumber(s.medianDdAfter2x, allocator), allocator);
    add(out, "median_dd_after_3x", optionalNumber(s.medianDdAfter3x, allocator), allocator);
    add(out, "median_dd_after_ath", optionalNumber(s.medianDdAfterAth, allocator), allocator);
    add(out, "median_peak_pnl_pct", optionalNumber(s.medianPeakPnlPct, allocator), allocator);
    add(out, "median_ret_end", optionalNumber(s.medianRetEnd, allocator), allocator);
    add(out, "median_time_to_2x_s", optionalNumber(s.medianTimeTo2xSeconds, allocator), allocator);
    add(out, "median_time_to_4x_s", optionalNumber(s.medianTimeTo4xSeconds, allocator), allocator);

    for (std::size_t i = 0; i < alertbt::kTierCount; ++i)
        add(out, "pct_hit_" + alertbt::tierLabel(i), number(s.pctHitTier[i], allocator), allocator);

    add(out, "p25_ath", optionalNumber(s.p25AthMult, allocator), allocator);
    add(out, "p75_ath", optionalNumber(s.p75AthMult, allocator), allocator);
    add(out, "p95_ath", optionalNumber(s.p95AthMult, allocator), allocator);

    Value exits(kObjectType);
    for (std::size_t i = 0; i < alertbt::kExitReasonCount; ++i) {
        const auto reason = static_cast<alertbt::ExitReason>(i);
        add(exits, alertbt::exitReasonToString(reason), Value(static_cast<uint64_t>(s.exitCount(reason))), allocator);
    }
    add(out, "exit_reasons", exits, allocator);

    add(out, "tp_sl_total_return_pct", number(s.totalReturnPct, allocator), allocator);
    add(out, "tp_sl_avg_return_pct", number(s.avgReturnPct, allocator), allocator);
    add(out, "tp_sl_win_rate", number(s.winRate, allocator), allocator);
    add(out, "tp_sl_avg_win_pct", number(s.avgWinPct, allocator), allocator);
    add(out, "tp_sl_avg_loss_pct", number(s.avgLossPct, allocator), allocator);
    add(out, "tp_sl_profit_factor", number(s.profitFactor, allocator), allocator);
    add(out, "tp_sl_expectancy_pct", number(s.expectancyPct, allocator), allocator);

    add(out, "risk_per_trade_pct", number(s.riskPerTradePct, allocator), allocator);
    add(out, "position_size_pct", number(s.positionSizePct, allocator), allocator);
    add(out, "risk_adj_total_return_pct", number(s.riskAdjTotalReturnPct, allocator), allocator);
    add(out, "risk_adj_avg_return_pct", number(s.riskAdjAvgReturnPct, allocator), allocator);
    add(out, "risk_adj_avg_win_pct", number(s.riskAdjAvgWinPct, allocator), allocator);
    add(out, "risk_adj_avg_loss_pct", number(s.riskAdjAvgLossPct, allocator), allocator);

    add(out, "total_r", number(s.totalR, allocator), allocator);
    add(out, "avg_r", number(s.avgR, allocator), allocator);
    add(out, "avg_r_win", number(s.avgRWin, allocator), allocator);
    add(out, "avg_r_loss", number(s.avgRLoss, allocator), allocator);
    add(out, "r_profit_factor", number(s.rProfitFactor, allocator), allocator);

    add(out, "dd_pre2x_median", optionalNumber(s.ddPre2xMedian, allocator), allocator);
    add(out, "time_to_2x_median_min", optionalNumber(s.timeTo2xMedianMin, allocator), allocator);
    return out;
}

Value ResultSerializer::serializeObjective(const alertbt::ObjectiveComponents& c, Allocator& allocator) {
    Value out(kObjectType);
    add(out, "base_value", number(c.baseValue, allocator), allocator);
    add(out, "dd_penalty", number(c.ddPenalty, allocator), allocator);
    add(out, "time_boost", number(c.timeBoost, allocator), allocator);
    add(out, "discipline_bonus", number(c.disciplineBonus, allocator), allocator);
    add(out, "tail_bonus", number(c.tailBonus, allocator), allocator);
    add(out, "win_rate_penalty", number(c.winRatePenalty, allocator), allocator);
    add(out, "loss_r_penalty", number(c.lossRPenalty, allocator), allocator);
    add(out, "confidence", number(c.confidence, allocator), allocator);
    add(out, "raw_score", number(c.rawScore, allocator), allocator);
    add(out, "final_score", number(c.finalScore, allocator), allocator);
    return out;
}

Value ResultSerializer::serializeResult(const alertbt::OptimizationResult& r, Allocator& allocator) {
    Value out(kObjectType);
    add(out, "cell_index", Value(static_cast<uint64_t>(r.cellIndex)), allocator);
    add(out, "run_id", text(r.runId, allocator), allocator);
    add(out, "duration_s", number(r.durationSeconds, allocator), allocator);
    add(out, "failed", Value(r.isFailed()), allocator);
    add(out, "error_message", r.failure ? text(*r.failure, allocator) : Value(kNullType), allocator);
    add(out, "params", r.policy ? serializePolicy(*r.policy, allocator) : Value(kNullType), allocator);

    if (r.isFailed()) {
        add(out, "summary", Value(kNullType), allocator);
        add(out, "objective", Value(kNullType), allocator);
    }
    else {
        add(out, "summary", serializeSummary(r.summary, allocator), allocator);
        add(out, "objective", serializeObjective(r.objective, allocator), allocator);
    }
    return out;
}

Value ResultSerializer::serializeAlertResult(const alertbt::AlertResult& row, Allocator& allocator) {
    const alertbt::Alert& a = row.alert;
    const alertbt::PathMetrics& m = row.metrics;

    Value out(kObjectType);
    add(out, "token_id", text(a.getTokenId(), allocator), allocator);
    add(out, "chain", text(a.getChain(), allocator), allocator);
    add(out, "caller", text(a.getCaller(), allocator), allocator);
    add(out, "alert_time", text(alertbt::toIsoString(a.getAlertTime()), allocator), allocator);
    add(out, "market_cap_usd", optionalNumber(a.getMarketCapUsd(), allocator), allocator);
    add(out, "status", text(alertbt::alertStatusToString(row.status), allocator), allocator);
    add(out, "entry_time", row.entryTime.is_special() ? Value(kNullType)
        : text(alertbt::toIsoString(row.entryTime), allocator), allocator);
    add(out, "entry_price", optionalNumber(row.entryPrice, allocator), allocator);
    add(out, "error_message", row.errorMessage.empty() ? Value(kNullType)
        : text(row.errorMessage, allocator), allocator);

    add(out, "candles", Value(static_cast<uint64_t>(m.candleCount)), allocator);
    if (!row.isOk())
        return out;

    add(out, "ath_mult", number(m.athMult, allocator), allocator);
    add(out, "time_to_ath_s", Value(static_cast<int64_t>(m.timeToAthSeconds)), allocator);
    add(out, "time_to_recovery_s", optionalSeconds(m.timeToRecoverySeconds), allocator);

    for (std::size_t i = 0; i < alertbt::kTierCount; ++i) {
        const std::string label = alertbt::tierLabel(i);
        add(out, "time_to_" + label + "_s", optionalSeconds(m.timeToTierSeconds[i]), allocator);
        add(out, "dd_pre_" + label, optionalNumber(m.ddPreTier[i], allocator), allocator);
        add(out, "dd_after_" + label, optionalNumber(m.ddAfterTier[i], allocator), allocator);
    }

    add(out, "dd_initial", number(m.ddInitial, allocator), allocator);
    add(out, "dd_overall", number(m.ddOverall, allocator), allocator);
    add(out, "dd_band_1_2x_to_1_5x", optionalNumber(m.ddBand1p2To1p5, allocator), allocator);
    add(out, "dd_band_1_5x_to_2x", optionalNumber(m.ddBand1p5To2, allocator), allocator);
    add(out, "dd_after_ath", optionalNumber(m.ddAfterAth, allocator), allocator);
    add(out, "dd_pre2x_or_horizon", number(m.ddPre2xOrHorizon, allocator), allocator);
    add(out, "peak_pnl_pct", number(m.peakPnlPct, allocator), allocator);
    add(out, "ret_end", number(m.retEnd, allocator), allocator);

    const alertbt::PathQuality& q = m.quality;
    add(out, "candles_below_entry", Value(static_cast<uint64_t>(q.candlesBelowEntry)), allocator);
    add(out, "candles_1_0x_to_1_2x", Value(static_cast<uint64_t>(q.candles1p0To1p2)), allocator);
    add(out, "candles_1_2x_to_1_5x", Value(static_cast<uint64_t>(q.candles1p2To1p5)), allocator);
    add(out, "candles_1_5x_to_2x", Value(static_cast<uint64_t>(q.candles1p5To2p0)), allocator);
    add(out, "candles_2x_plus", Value(static_cast<uint64_t>(q.candles2p0Plus)), allocator);
    add(out, "time_underwater_pct", number(q.timeUnderwaterPct, allocator), allocator);
    add(out, "time_in_profit_pct", optionalNumber(q.timeInProfitPct, allocator), allocator);
    add(out, "stall_score", number(q.stallScore, allocator), allocator);
    add(out, "retention_1_2x_above_1_1x", optionalNumber(q.retention1p2xAbove1p1x, allocator), allocator);
    add(out, "retention_1_5x_above_1_3x", optionalNumber(q.retention1p5xAbove1p3x, allocator), allocator);
    add(out, "floor_hold_after_1_2x", Value(q.floorHoldAfter1p2x), allocator);
    add(out, "floor_hold_after_1_5x", Value(q.floorHoldAfter1p5x), allocator);
    add(out, "giveback_after_1_5x", optionalNumber(q.givebackAfter1p5x, allocator), allocator);
    add(out, "giveback_after_2x", optionalNumber(q.givebackAfter2x, allocator), allocator);
    add(out, "is_headfake", Value(q.isHeadfake), allocator);
    add(out, "headfake_depth", optionalNumber(q.headfakeDepth, allocator), allocator);
    add(out, "headfake_recovered", Value(q.headfakeRecovered), allocator);

    if (row.exit) {
        const alertbt::ExitOutcome& e = *row.exit;
        add(out, "exit_reason", text(alertbt::exitReasonToString(e.reason), allocator), allocator);
        add(out, "exit_price", number(e.exitPrice, allocator), allocator);
        add(out, "exit_time", text(alertbt::toIsoString(e.exitTime), allocator), allocator);
        add(out, "exit_offset_s", Value(static_cast<int64_t>(e.exitOffsetSeconds)), allocator);
        add(out, "exit_candle_index", Value(static_cast<uint64_t>(e.exitCandleIndex)), allocator);
        add(out, "net_return", number(e.netReturn, allocator), allocator);
        add(out, "r_multiple", number(e.rMultiple, allocator), allocator);
        add(out, "stop_level", optionalNumber(e.stopLevel, allocator), allocator);
        add(out, "target_price", optionalNumber(e.targetPrice, allocator), allocator);
        add(out, "max_high_before_exit", number(e.maxHighBeforeExit, allocator), allocator);
        add(out, "breakeven_activated", Value(e.breakevenActivated), allocator);
        add(out, "trailing_activated", Value(e.trailingActivated), allocator);
    }
    return out;
}

void ResultSerializer::buildRunDocument(const alertbt::OptimizationRun& run,
                                        const OptimizerConfiguration& config,
                                        alertbt::RankKey rankBy,
                                        Document& doc) {
    doc.SetObject();
    Allocator& allocator = doc.GetAllocator();

    add(doc, "run_id", text(run.getRunId(), allocator), allocator);
    add(doc, "rank_by", text(alertbt::rankKeyToString(rankBy), allocator), allocator);
    add(doc, "cells", Value(static_cast<uint64_t>(run.size())), allocator);
    add(doc, "failed_cells", Value(static_cast<uint64_t>(run.failedCount())), allocator);

    Document configDoc(&allocator);
    configDoc.Parse(config.toJsonString().c_str());
    Value configValue(kObjectType);
    if (!configDoc.HasParseError())
        configValue.CopyFrom(configDoc, allocator);
    add(doc, "config", configValue, allocator);

    Value timing(kObjectType);
    for (const auto& phase : run.getPhaseTimings())
        add(timing, phase.first + "_s", number(phase.second, allocator), allocator);
    add(doc, "timing", timing, allocator);

    Value results(kArrayType);
    for (const alertbt::OptimizationResult& r : run.rankBy(rankBy))
        results.PushBack(serializeResult(r, allocator), allocator);
    add(doc, "results", results, allocator);
}

std::string ResultSerializer::runToJson(const alertbt::OptimizationRun& run,
                                        const OptimizerConfiguration& config,
                                        alertbt::RankKey rankBy) {
    Document doc;
    buildRunDocument(run, config, rankBy, doc);
    return toPrettyString(doc);
}

bool ResultSerializer::saveRun(alertbt::OptimizationRun& run,
                               const OptimizerConfiguration& config,
                               alertbt::RankKey rankBy,
                               const std::string& filePath) {
    const alertbt::PhaseTimer saveTimer;
    Document doc;
    buildRunDocument(run, config, rankBy, doc);

    const double seconds = saveTimer.elapsedSeconds();
    run.recordPhase("save", seconds);
    add(doc["timing"], "save_s", number(seconds, doc.GetAllocator()), doc.GetAllocator());

    return saveToFile(toPrettyString(doc), filePath);
}

std::string ResultSerializer::batchToJson(const alertbt::PolicyConfig& policy,
                                          const alertbt::RunSummary& summary,
                                          const std::vector<alertbt::CallerSummary>& callers,
                                          const std::vector<alertbt::AlertResult>& rows) {
    Document doc;
    doc.SetObject();
    Allocator& allocator = doc.GetAllocator();

    add(doc, "params", serializePolicy(policy, allocator), allocator);
    add(doc, "summary", serializeSummary(summary, allocator), allocator);

    Value leaderboard(kArrayType);
    for (const alertbt::CallerSummary& c : callers) {
        Value entry(kObjectType);
        add(entry, "caller", text(c.caller, allocator), allocator);
        add(entry, "summary", serializeSummary(c.summary, allocator), allocator);
        leaderboard.PushBack(entry, allocator);
    }
    add(doc, "callers", leaderboard, allocator);

    Value alerts(kArrayType);
    for (const alertbt::AlertResult& row : rows)
        alerts.PushBack(serializeAlertResult(row, allocator), allocator);
    add(doc, "alerts", alerts, allocator);

    return toPrettyString(doc);
}

bool ResultSerializer::saveToFile(const std::string& json, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open())
        return false;

    file << json;
    file.close();
    return !file.fail();
}

std::string ResultSerializer::toPrettyString(const Document& doc) {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

} // namespace alertoptimizer
