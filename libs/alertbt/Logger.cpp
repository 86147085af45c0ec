#include "Logger.h"
#include "AlertBacktestException.h"

#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace alertbt
{
  Logger& Logger::getInstance()
  {
    static Logger instance;
    return instance;
  }

  void Logger::initialize(const std::string& level, const std::string& logFile)
  {
    try
      {
	auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
	consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

	std::vector<spdlog::sink_ptr> sinks{consoleSink};
	if (!logFile.empty())
	  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 1024 * 1024 * 10, 3));

	auto logger = std::make_shared<spdlog::logger>("alertbt", sinks.begin(), sinks.end());
	logger->flush_on(spdlog::level::warn);

	mLogger = logger;
	setLevel(level);

	// Route spdlog's default logger (used by the worker-pool runner) here too
	spdlog::set_default_logger(logger);
      }
    catch (const spdlog::spdlog_ex& e)
      {
	throw ConfigurationException(std::string("Log initialization failed: ") + e.what());
      }
  }

  void Logger::setLevel(const std::string& level)
  {
    if (!mLogger)
      return;

    const spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off")
      throw ConfigurationException("Unknown log level: " + level);

    mLogger->set_level(parsed);
    spdlog::set_level(parsed);
  }
}
