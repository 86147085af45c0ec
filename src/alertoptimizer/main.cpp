#include "CsvDataSources.h"
#include "GridOptimizer.h"
#include "Logger.h"
#include "OptimizerConfiguration.h"
#include "ParallelExecutors.h"
#include "ResultSerializer.h"
#include "Summarizer.h"
#include "TimeUtils.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;
using namespace alertbt;

void printUsage(const po::options_description& desc) {
    std::cout << "Alert Backtest Optimizer - sweep exit policies over alert-triggered trades\n\n";
    std::cout << "Usage: alertbt_optimizer --alerts <csv> --candles <dir> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Write a starting configuration\n";
    std::cout << "  alertbt_optimizer --write-default-config optimizer.json\n\n";
    std::cout << "  # Sweep the configured grid on 8 threads\n";
    std::cout << "  alertbt_optimizer --alerts alerts.csv --candles candles/ --config optimizer.json --threads 8\n\n";
    std::cout << "  # Evaluate only the first grid cell and print every alert\n";
    std::cout << "  alertbt_optimizer --alerts alerts.csv --candles candles/ --single\n";
}

std::unique_ptr<concurrency::IParallelExecutor> makeExecutor(const std::string& kind, std::size_t threads) {
    if (kind == "single" || threads == 1)
        return std::make_unique<concurrency::SingleThreadExecutor>();
    if (kind == "asio")
        return std::make_unique<concurrency::BoostRunnerExecutor>(threads);
    if (kind == "pool")
        return std::make_unique<concurrency::ThreadPoolExecutor>(threads);

    throw ConfigurationException("Unknown executor '" + kind + "' (expected pool, asio or single)");
}

ptime boundOrDefault(const std::string& text, const ptime& fallback) {
    return text.empty() ? fallback : parseTimestamp(text);
}

void printAlertRows(const std::vector<AlertResult>& rows) {
    std::cout << std::left << std::setw(14) << "token" << std::setw(22) << "alert_time"
              << std::setw(10) << "status" << std::right << std::setw(10) << "ath"
              << std::setw(10) << "dd" << std::setw(11) << "exit" << std::setw(11) << "net_ret"
              << std::setw(9) << "R" << "\n";

    for (const AlertResult& r : rows) {
        std::cout << std::left << std::setw(14) << r.alert.getTokenId().substr(0, 13)
                  << std::setw(22) << toIsoString(r.alert.getAlertTime())
                  << std::setw(10) << alertStatusToString(r.status) << std::right
                  << std::fixed << std::setprecision(3);
        if (r.isOk() && r.exit) {
            std::cout << std::setw(10) << r.metrics.athMult
                      << std::setw(10) << r.metrics.ddOverall
                      << std::setw(11) << exitReasonToString(r.exit->reason)
                      << std::setw(11) << r.exit->netReturn
                      << std::setw(9) << r.exit->rMultiple;
        }
        else if (!r.errorMessage.empty()) {
            std::cout << "  " << r.errorMessage;
        }
        std::cout << "\n";
    }
}

void printSummary(const RunSummary& s, const ObjectiveComponents& c) {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\nAlerts: " << s.alertsTotal << " total, " << s.alertsOk << " ok, "
              << s.alertsMissing << " missing, " << s.alertsBadEntry << " bad entry, "
              << s.alertsError << " error\n";

    if (!s.hasEligibleTrades()) {
        std::cout << "No eligible trades: objective score 0\n";
        return;
    }

    std::cout << "Win rate:        " << s.winRate * 100.0 << "%\n";
    std::cout << "Total R:         " << s.totalR << "\n";
    std::cout << "Avg R:           " << s.avgR << "\n";
    std::cout << "Avg loss R:      " << s.avgRLoss << "\n";
    std::cout << "Risk-adj return: " << s.riskAdjTotalReturnPct << "%\n";
    std::cout << "Objective score: " << c.finalScore << " (confidence " << c.confidence << ")\n";
}

void printRanking(const OptimizationRun& run, RankKey key, std::size_t topN) {
    const std::vector<OptimizationResult> ranked = run.rankBy(key);
    std::cout << "\nTop " << topN << " by " << rankKeyToString(key) << ":\n";
    std::cout << std::fixed << std::setprecision(4);
    for (std::size_t i = 0; i < ranked.size() && i < topN; ++i) {
        const OptimizationResult& r = ranked[i];
        if (r.isFailed())
            break;
        std::cout << std::setw(3) << (i + 1) << ". " << std::left << std::setw(52) << r.policy->describe()
                  << std::right << " " << rankKeyToString(key) << "=" << r.rankValue(key)
                  << " ok=" << r.summary.alertsOk << "\n";
    }
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("alerts,a", po::value<std::string>(), "Alert CSV file (token_id,chain,alert_time,caller,market_cap_usd)")
            ("candles,c", po::value<std::string>(), "Directory holding one <token_id>.csv candle file per token")
            ("config", po::value<std::string>(), "Optimizer configuration JSON file")
            ("output,o", po::value<std::string>(), "Write results JSON to this file")
            ("threads,t", po::value<std::size_t>(), "Worker threads (0 = hardware concurrency)")
            ("executor", po::value<std::string>()->default_value("pool"), "Worker pool: pool, asio or single")
            ("log-level", po::value<std::string>()->default_value("info"), "debug, info, warn, error or off")
            ("log-file", po::value<std::string>(), "Also log to this rotating file")
            ("rank-by", po::value<std::string>(), "Ranking key (objective_score, total_r, avg_r, win_rate, profit_factor, expectancy_pct, risk_adj_total_return_pct, r_profit_factor)")
            ("top", po::value<std::size_t>()->default_value(10), "Number of ranked cells to print")
            ("single", "Evaluate only the first grid cell and print per-alert rows")
            ("write-default-config", po::value<std::string>(), "Write the default configuration to a file and exit");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        Logger::getInstance().initialize(vm["log-level"].as<std::string>(),
                                         vm.count("log-file") ? vm["log-file"].as<std::string>() : std::string());

        if (vm.count("write-default-config")) {
            const std::string path = vm["write-default-config"].as<std::string>();
            const alertoptimizer::OptimizerConfiguration defaults = alertoptimizer::OptimizerConfiguration::createDefault();
            if (!defaults.saveToFile(path)) {
                std::cerr << "Error: " << defaults.getLastError() << std::endl;
                return 1;
            }
            std::cout << "Default configuration written to " << path << std::endl;
            return 0;
        }

        alertoptimizer::OptimizerConfiguration config = alertoptimizer::OptimizerConfiguration::createDefault();
        if (vm.count("config") && !config.loadFromFile(vm["config"].as<std::string>())) {
            std::cerr << "Error: " << config.getLastError() << std::endl;
            return 1;
        }
        if (vm.count("threads"))
            config.setThreads(vm["threads"].as<std::size_t>());
        if (vm.count("output"))
            config.setOutputPath(vm["output"].as<std::string>());
        if (vm.count("rank-by"))
            config.setRankBy(vm["rank-by"].as<std::string>());

        const std::vector<std::string> errors = config.validate();
        if (!errors.empty()) {
            std::cerr << "Configuration errors:\n";
            for (const std::string& e : errors)
                std::cerr << "  - " << e << "\n";
            return 1;
        }

        if (!vm.count("alerts") || !vm.count("candles")) {
            std::cerr << "Error: --alerts and --candles are required\n\n";
            printUsage(desc);
            return 1;
        }

        const RankKey rankBy = rankKeyFromString(config.getRankBy());
        const std::size_t topN = vm["top"].as<std::size_t>();
        const std::string runId = "run_" + boost::posix_time::to_iso_string(
            boost::posix_time::second_clock::universal_time());

        // Load alerts
        const PhaseTimer loadTimer;
        const CsvAlertSource alertSource(vm["alerts"].as<std::string>());
        const std::vector<Alert> alerts = filterByCallers(
            alertSource.loadAlerts(config.getChain(),
                                   boundOrDefault(config.getDateFrom(), ptime(boost::posix_time::min_date_time)),
                                   boundOrDefault(config.getDateTo(), ptime(boost::posix_time::max_date_time))),
            config.getCallerIds());
        const double loadSeconds = loadTimer.elapsedSeconds();
        ALERTBT_LOG_INFO("Loaded {} alerts in {:.2f}s", alerts.size(), loadSeconds);
        if (alerts.empty())
            ALERTBT_LOG_WARN("No alerts left after caller filtering");

        const CsvCandleDirectoryLookup candles(vm["candles"].as<std::string>());
        std::unique_ptr<concurrency::IParallelExecutor> executor =
            makeExecutor(vm["executor"].as<std::string>(), config.getThreads());

        const EvaluationLimits limits(config.getMaxCandlesPerAlert(), config.getMaxEvalMillis());

        if (vm.count("single")) {
            const ParameterGrid grid(config.getParameterSpace(), config.getFeeBps(), config.getSlippageBps());
            const PolicyConfig policy = grid.cellAt(0);
            const BatchRunner runner(candles, config.getIntervalSeconds(), config.getHorizonHours(), limits);
            const Summarizer summarizer(config.getRiskPerTrade());
            const ObjectiveScorer scorer(config.getObjectiveConfig());

            const std::vector<AlertResult> rows = runner.run(alerts, policy, *executor);
            const RunSummary summary = summarizer.summarize(rows, policy);
            const std::vector<CallerSummary> callers =
                summarizer.summarizeByCaller(rows, policy, config.getMinTrades());

            std::cout << "Policy: " << policy.describe() << "\n\n";
            printAlertRows(rows);
            printSummary(summary, scorer.score(summary));

            if (!config.getOutputPath().empty()) {
                const std::string json = alertoptimizer::ResultSerializer::batchToJson(policy, summary, callers, rows);
                if (!alertoptimizer::ResultSerializer::saveToFile(json, config.getOutputPath())) {
                    std::cerr << "Error: could not write " << config.getOutputPath() << std::endl;
                    return 1;
                }
                std::cout << "\nResults written to " << config.getOutputPath() << std::endl;
            }
            return 0;
        }

        GridOptimizerOptions options;
        options.intervalSeconds = config.getIntervalSeconds();
        options.horizonHours = config.getHorizonHours();
        options.feeBps = config.getFeeBps();
        options.slippageBps = config.getSlippageBps();
        options.riskPerTrade = config.getRiskPerTrade();
        options.limits = limits;
        options.maxConcurrentCells = config.getMaxConcurrentCells();
        options.objective = config.getObjectiveConfig();

        const GridOptimizer optimizer(options);

        const PhaseTimer backtestTimer;
        OptimizationRun run = optimizer.run(alerts, candles, config.getParameterSpace(), *executor, runId);
        run.recordPhase("load_alerts", loadSeconds);
        run.recordPhase("backtest", backtestTimer.elapsedSeconds());

        GridOptimizer::logRunReport(run, options.objective);
        printRanking(run, rankBy, topN);

        if (!config.getOutputPath().empty()) {
            const PhaseTimer writeTimer;
            if (!alertoptimizer::ResultSerializer::saveRun(run, config, rankBy, config.getOutputPath())) {
                std::cerr << "Error: could not write " << config.getOutputPath() << std::endl;
                return 1;
            }
            ALERTBT_LOG_INFO("Results written to {} in {:.2f}s", config.getOutputPath(),
                             writeTimer.elapsedSeconds());
        }

        return 0;
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\nUse --help for usage." << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
