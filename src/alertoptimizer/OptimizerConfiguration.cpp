#include "OptimizerConfiguration.h"
#include "AlertBacktestException.h"
#include "TimeUtils.h"

#include <fstream>
#include <initializer_list>
#include <sstream>
#include <utility>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace alertoptimizer {

namespace {

using alertbt::ConfigurationException;
using alertbt::ObjectiveConfig;
using alertbt::RangeSpec;

// Numeric objective settings, read and written by name
const std::pair<const char*, double ObjectiveConfig::*> kObjectiveFields[] = {
    {"avg_r_weight", &ObjectiveConfig::avgRWeight},
    {"total_r_weight", &ObjectiveConfig::totalRWeight},
    {"dd_penalty_threshold", &ObjectiveConfig::ddPenaltyThreshold},
    {"dd_penalty_k", &ObjectiveConfig::ddPenaltyK},
    {"dd_brutal_threshold", &ObjectiveConfig::ddBrutalThreshold},
    {"dd_brutal_multiplier", &ObjectiveConfig::ddBrutalMultiplier},
    {"dd_penalty_weight", &ObjectiveConfig::ddPenaltyWeight},
    {"time_boost_max", &ObjectiveConfig::timeBoostMax},
    {"time_boost_half_life_minutes", &ObjectiveConfig::timeBoostHalfLifeMinutes},
    {"time_boost_weight", &ObjectiveConfig::timeBoostWeight},
    {"discipline_hit_rate_2x", &ObjectiveConfig::disciplineHitRate2x},
    {"discipline_max_drawdown", &ObjectiveConfig::disciplineMaxDrawdown},
    {"discipline_bonus", &ObjectiveConfig::disciplineBonus},
    {"tail_bonus_weight", &ObjectiveConfig::tailBonusWeight},
    {"tail_p75_weight", &ObjectiveConfig::tailP75Weight},
    {"tail_p95_weight", &ObjectiveConfig::tailP95Weight},
    {"min_win_rate", &ObjectiveConfig::minWinRate},
    {"win_rate_penalty_k", &ObjectiveConfig::winRatePenaltyK},
    {"win_rate_penalty_weight", &ObjectiveConfig::winRatePenaltyWeight},
    {"expected_loss_r", &ObjectiveConfig::expectedLossR},
    {"loss_r_tolerance", &ObjectiveConfig::lossRTolerance},
    {"loss_r_penalty_k", &ObjectiveConfig::lossRPenaltyK},
    {"loss_r_penalty_weight", &ObjectiveConfig::lossRPenaltyWeight},
    {"confidence_k", &ObjectiveConfig::confidenceK}
};

double readDouble(const Value& obj, const char* key, double fallback) {
    if (!obj.HasMember(key))
        return fallback;
    if (!obj[key].IsNumber())
        throw ConfigurationException(std::string("'") + key + "' must be a number");
    return obj[key].GetDouble();
}

long readLong(const Value& obj, const char* key, long fallback) {
    if (!obj.HasMember(key))
        return fallback;
    if (!obj[key].IsInt64())
        throw ConfigurationException(std::string("'") + key + "' must be an integer");
    return static_cast<long>(obj[key].GetInt64());
}

std::size_t readSize(const Value& obj, const char* key, std::size_t fallback) {
    if (!obj.HasMember(key))
        return fallback;
    if (!obj[key].IsUint64())
        throw ConfigurationException(std::string("'") + key + "' must be a non-negative integer");
    return static_cast<std::size_t>(obj[key].GetUint64());
}

bool readBool(const Value& obj, const char* key, bool fallback) {
    if (!obj.HasMember(key))
        return fallback;
    if (!obj[key].IsBool())
        throw ConfigurationException(std::string("'") + key + "' must be true or false");
    return obj[key].GetBool();
}

std::string readString(const Value& obj, const char* key, const std::string& fallback) {
    if (!obj.HasMember(key))
        return fallback;
    if (!obj[key].IsString())
        throw ConfigurationException(std::string("'") + key + "' must be a string");
    return obj[key].GetString();
}

const Value* readObject(const Value& obj, const char* key) {
    if (!obj.HasMember(key))
        return nullptr;
    if (!obj[key].IsObject())
        throw ConfigurationException(std::string("'") + key + "' must be an object");
    return &obj[key];
}

std::vector<double> readNumberArray(const Value& arr, const char* key) {
    std::vector<double> values;
    for (const auto& v : arr.GetArray()) {
        if (!v.IsNumber())
            throw ConfigurationException(std::string("'") + key + "' values must be numbers");
        values.push_back(v.GetDouble());
    }
    return values;
}

// A range is a number, an array of numbers, or {values} / {start, end, step[, log_scale]}
RangeSpec readRange(const Value& obj, const char* key, const RangeSpec& fallback) {
    if (!obj.HasMember(key))
        return fallback;

    const Value& v = obj[key];
    if (v.IsNumber())
        return RangeSpec::values({v.GetDouble()});
    if (v.IsArray())
        return RangeSpec::values(readNumberArray(v, key));
    if (!v.IsObject())
        throw ConfigurationException(std::string("'") + key + "' must be a number, array or range object");

    if (v.HasMember("values")) {
        if (!v["values"].IsArray())
            throw ConfigurationException(std::string("'") + key + ".values' must be an array");
        return RangeSpec::values(readNumberArray(v["values"], key));
    }

    if (!v.HasMember("start") || !v.HasMember("end"))
        throw ConfigurationException(std::string("'") + key + "' requires either 'values' or 'start'/'end'");

    const double start = readDouble(v, "start", 0.0);
    const double end = readDouble(v, "end", 0.0);
    if (readBool(v, "log_scale", false))
        return RangeSpec::logScale(start, end,
                                   static_cast<int>(readLong(v, "step", RangeSpec::kDefaultLogSteps)));
    return RangeSpec::linear(start, end, readDouble(v, "step", RangeSpec::kDefaultLinearStep));
}

Value writeRange(const RangeSpec& range, Document::AllocatorType& allocator) {
    Value out(kObjectType);
    if (range.getKind() == RangeSpec::Kind::Values) {
        Value values(kArrayType);
        for (double v : range.getValues())
            values.PushBack(v, allocator);
        out.AddMember("values", values, allocator);
        return out;
    }

    out.AddMember("start", range.getStart(), allocator);
    out.AddMember("end", range.getEnd(), allocator);
    if (range.getKind() == RangeSpec::Kind::Log) {
        out.AddMember("step", static_cast<int64_t>(range.getStep()), allocator);
        out.AddMember("log_scale", true, allocator);
    }
    else {
        out.AddMember("step", range.getStep(), allocator);
    }
    return out;
}

} // namespace

OptimizerConfiguration::OptimizerConfiguration()
    : intervalSeconds_(60),
      horizonHours_(48.0),
      feeBps_(30.0),
      slippageBps_(50.0),
      riskPerTrade_(0.02),
      threads_(0),
      maxConcurrentCells_(0),
      maxCandlesPerAlert_(0),
      maxEvalMillis_(0),
      chain_("solana"),
      dateFrom_(),
      dateTo_(),
      callerIds_(),
      minTrades_(5),
      outputPath_(),
      rankBy_("objective_score"),
      parameterSpace_(),
      objectivePreset_("default"),
      objective_(),
      lastError_() {
}

bool OptimizerConfiguration::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return loadFromString(buffer.str());
}

bool OptimizerConfiguration::loadFromString(const std::string& jsonContent) {
    return parseJson(jsonContent);
}

bool OptimizerConfiguration::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open file for writing: " + configPath);
        return false;
    }

    file << toJsonString();
    file.close();
    return true;
}

bool OptimizerConfiguration::parseJson(const std::string& jsonContent) {
    Document doc;
    doc.Parse(jsonContent.c_str());
    if (doc.HasParseError()) {
        setError(std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
                 ": " + GetParseError_En(doc.GetParseError()));
        return false;
    }
    if (!doc.IsObject()) {
        setError("Configuration root must be a JSON object");
        return false;
    }

    // Parse into a copy so a failed load leaves this configuration untouched
    OptimizerConfiguration parsed(*this);

    try {
        parsed.intervalSeconds_ = readLong(doc, "interval_seconds", intervalSeconds_);
        parsed.horizonHours_ = readDouble(doc, "horizon_hours", horizonHours_);
        parsed.feeBps_ = readDouble(doc, "fee_bps", feeBps_);
        parsed.slippageBps_ = readDouble(doc, "slippage_bps", slippageBps_);
        parsed.riskPerTrade_ = readDouble(doc, "risk_per_trade", riskPerTrade_);
        parsed.threads_ = readSize(doc, "threads", threads_);
        parsed.maxConcurrentCells_ = readSize(doc, "max_concurrent_cells", maxConcurrentCells_);
        parsed.maxCandlesPerAlert_ = readSize(doc, "max_candles_per_alert", maxCandlesPerAlert_);
        parsed.maxEvalMillis_ = readLong(doc, "max_eval_millis", maxEvalMillis_);
        parsed.chain_ = readString(doc, "chain", chain_);
        parsed.dateFrom_ = readString(doc, "date_from", dateFrom_);
        parsed.dateTo_ = readString(doc, "date_to", dateTo_);
        parsed.minTrades_ = readSize(doc, "min_trades", minTrades_);
        parsed.outputPath_ = readString(doc, "output_path", outputPath_);
        parsed.rankBy_ = readString(doc, "rank_by", rankBy_);

        if (doc.HasMember("caller_ids")) {
            if (!doc["caller_ids"].IsArray())
                throw ConfigurationException("'caller_ids' must be an array of strings");
            parsed.callerIds_.clear();
            for (const auto& v : doc["caller_ids"].GetArray()) {
                if (!v.IsString())
                    throw ConfigurationException("'caller_ids' must be an array of strings");
                parsed.callerIds_.push_back(v.GetString());
            }
        }

        if (const Value* space = readObject(doc, "parameter_space")) {
            alertbt::ParameterSpace& ps = parsed.parameterSpace_;

            if (const Value* tpSl = readObject(*space, "tp_sl")) {
                ps.tpSl.tpMult = readRange(*tpSl, "tp_mult", ps.tpSl.tpMult);
                ps.tpSl.slMult = readRange(*tpSl, "sl_mult", ps.tpSl.slMult);
                if (tpSl->HasMember("intrabar_order")) {
                    const Value& orders = (*tpSl)["intrabar_order"];
                    ps.tpSl.intrabarOrders.clear();
                    if (orders.IsString()) {
                        ps.tpSl.intrabarOrders.push_back(alertbt::intrabarOrderFromString(orders.GetString()));
                    }
                    else if (orders.IsArray()) {
                        for (const auto& o : orders.GetArray()) {
                            if (!o.IsString())
                                throw ConfigurationException("'intrabar_order' entries must be strings");
                            ps.tpSl.intrabarOrders.push_back(alertbt::intrabarOrderFromString(o.GetString()));
                        }
                    }
                    else {
                        throw ConfigurationException("'intrabar_order' must be a string or an array");
                    }
                }
            }

            if (const Value* ts = readObject(*space, "time_stop")) {
                ps.timeStop.enabled = readBool(*ts, "enabled", ps.timeStop.enabled);
                ps.timeStop.hours = readRange(*ts, "hours", ps.timeStop.hours);
            }

            if (const Value* be = readObject(*space, "breakeven")) {
                ps.breakeven.enabled = readBool(*be, "enabled", ps.breakeven.enabled);
                ps.breakeven.triggerPct = readRange(*be, "trigger_pct", ps.breakeven.triggerPct);
                ps.breakeven.offsetPct = readRange(*be, "offset_pct", ps.breakeven.offsetPct);
            }

            if (const Value* tr = readObject(*space, "trailing")) {
                ps.trailing.enabled = readBool(*tr, "enabled", ps.trailing.enabled);
                ps.trailing.activationPct = readRange(*tr, "activation_pct", ps.trailing.activationPct);
                ps.trailing.distancePct = readRange(*tr, "distance_pct", ps.trailing.distancePct);
            }
        }

        if (const Value* obj = readObject(doc, "objective")) {
            if (obj->HasMember("preset")) {
                parsed.objectivePreset_ = readString(*obj, "preset", objectivePreset_);
                parsed.objective_ = ObjectiveConfig::preset(parsed.objectivePreset_);
            }

            ObjectiveConfig& oc = parsed.objective_;
            if (obj->HasMember("primary_metric"))
                oc.primaryMetric = alertbt::primaryMetricFromString(readString(*obj, "primary_metric", ""));
            if (obj->HasMember("tail_bonus_metric"))
                oc.tailBonusMetric = alertbt::tailBonusMetricFromString(readString(*obj, "tail_bonus_metric", ""));

            for (const auto& field : kObjectiveFields)
                oc.*(field.second) = readDouble(*obj, field.first, oc.*(field.second));
        }
    }
    catch (const std::exception& e) {
        setError("Invalid configuration: " + std::string(e.what()));
        return false;
    }

    parsed.lastError_.clear();
    *this = parsed;
    return true;
}

std::string OptimizerConfiguration::toJsonString() const {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("interval_seconds", static_cast<int64_t>(intervalSeconds_), allocator);
    doc.AddMember("horizon_hours", horizonHours_, allocator);
    doc.AddMember("fee_bps", feeBps_, allocator);
    doc.AddMember("slippage_bps", slippageBps_, allocator);
    doc.AddMember("risk_per_trade", riskPerTrade_, allocator);
    doc.AddMember("threads", static_cast<uint64_t>(threads_), allocator);
    doc.AddMember("max_concurrent_cells", static_cast<uint64_t>(maxConcurrentCells_), allocator);
    doc.AddMember("max_candles_per_alert", static_cast<uint64_t>(maxCandlesPerAlert_), allocator);
    doc.AddMember("max_eval_millis", static_cast<int64_t>(maxEvalMillis_), allocator);
    doc.AddMember("chain", Value(chain_.c_str(), allocator), allocator);
    doc.AddMember("date_from", Value(dateFrom_.c_str(), allocator), allocator);
    doc.AddMember("date_to", Value(dateTo_.c_str(), allocator), allocator);

    Value callers(kArrayType);
    for (const std::string& id : callerIds_)
        callers.PushBack(Value(id.c_str(), allocator), allocator);
    doc.AddMember("caller_ids", callers, allocator);

    doc.AddMember("min_trades", static_cast<uint64_t>(minTrades_), allocator);
    doc.AddMember("output_path", Value(outputPath_.c_str(), allocator), allocator);
    doc.AddMember("rank_by", Value(rankBy_.c_str(), allocator), allocator);

    const alertbt::ParameterSpace& ps = parameterSpace_;
    Value space(kObjectType);

    Value tpSl(kObjectType);
    tpSl.AddMember("tp_mult", writeRange(ps.tpSl.tpMult, allocator), allocator);
    tpSl.AddMember("sl_mult", writeRange(ps.tpSl.slMult, allocator), allocator);
    Value orders(kArrayType);
    for (alertbt::IntrabarOrder o : ps.tpSl.intrabarOrders)
        orders.PushBack(Value(alertbt::intrabarOrderToString(o).c_str(), allocator), allocator);
    tpSl.AddMember("intrabar_order", orders, allocator);
    space.AddMember("tp_sl", tpSl, allocator);

    Value timeStop(kObjectType);
    timeStop.AddMember("enabled", ps.timeStop.enabled, allocator);
    timeStop.AddMember("hours", writeRange(ps.timeStop.hours, allocator), allocator);
    space.AddMember("time_stop", timeStop, allocator);

    Value breakeven(kObjectType);
    breakeven.AddMember("enabled", ps.breakeven.enabled, allocator);
    breakeven.AddMember("trigger_pct", writeRange(ps.breakeven.triggerPct, allocator), allocator);
    breakeven.AddMember("offset_pct", writeRange(ps.breakeven.offsetPct, allocator), allocator);
    space.AddMember("breakeven", breakeven, allocator);

    Value trailing(kObjectType);
    trailing.AddMember("enabled", ps.trailing.enabled, allocator);
    trailing.AddMember("activation_pct", writeRange(ps.trailing.activationPct, allocator), allocator);
    trailing.AddMember("distance_pct", writeRange(ps.trailing.distancePct, allocator), allocator);
    space.AddMember("trailing", trailing, allocator);

    doc.AddMember("parameter_space", space, allocator);

    Value objective(kObjectType);
    objective.AddMember("preset", Value(objectivePreset_.c_str(), allocator), allocator);
    objective.AddMember("primary_metric",
                        Value(alertbt::primaryMetricToString(objective_.primaryMetric).c_str(), allocator),
                        allocator);
    objective.AddMember("tail_bonus_metric",
                        Value(alertbt::tailBonusMetricToString(objective_.tailBonusMetric).c_str(), allocator),
                        allocator);
    for (const auto& field : kObjectiveFields) {
        Value name(field.first, allocator);
        Value value(objective_.*(field.second));
        objective.AddMember(name, value, allocator);
    }
    doc.AddMember("objective", objective, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

std::vector<std::string> OptimizerConfiguration::validate() const {
    std::vector<std::string> errors;

    if (intervalSeconds_ <= 0)
        errors.push_back("interval_seconds must be > 0");
    if (!(horizonHours_ > 0.0))
        errors.push_back("horizon_hours must be > 0");
    if (feeBps_ < 0.0)
        errors.push_back("fee_bps must be >= 0");
    if (slippageBps_ < 0.0)
        errors.push_back("slippage_bps must be >= 0");
    if (!(riskPerTrade_ > 0.0) || riskPerTrade_ > 1.0)
        errors.push_back("risk_per_trade must be in (0, 1]");
    if (maxEvalMillis_ < 0)
        errors.push_back("max_eval_millis must be >= 0");

    try {
        alertbt::rankKeyFromString(rankBy_);
    }
    catch (const std::exception& e) {
        errors.push_back(e.what());
    }

    for (const std::string* date : {&dateFrom_, &dateTo_}) {
        if (date->empty())
            continue;
        try {
            alertbt::parseTimestamp(*date);
        }
        catch (const std::exception& e) {
            errors.push_back("Invalid date '" + *date + "': " + e.what());
        }
    }

    // Expanding the grid checks ranges and builds every dimension once
    try {
        const alertbt::ParameterGrid grid(parameterSpace_, feeBps_, slippageBps_);
        if (grid.size() == 0)
            errors.push_back("parameter_space expands to zero cells");
    }
    catch (const std::exception& e) {
        errors.push_back("parameter_space: " + std::string(e.what()));
    }

    for (const std::string& e : objective_.validate())
        errors.push_back("objective: " + e);

    return errors;
}

OptimizerConfiguration OptimizerConfiguration::createDefault() {
    OptimizerConfiguration config;

    alertbt::ParameterSpace space;
    space.tpSl.tpMult = RangeSpec::values({1.5, 2.0, 3.0, 5.0});
    space.tpSl.slMult = RangeSpec::values({0.5, 0.6, 0.7});
    space.timeStop.hours = RangeSpec::values({12.0, 24.0});
    space.breakeven.triggerPct = RangeSpec::values({0.20});
    space.breakeven.offsetPct = RangeSpec::values({0.0});
    space.trailing.activationPct = RangeSpec::values({0.30, 0.50});
    space.trailing.distancePct = RangeSpec::values({0.15, 0.25});
    config.parameterSpace_ = space;

    return config;
}

} // namespace alertoptimizer
