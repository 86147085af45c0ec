#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace alertbt
{
  /**
   * @brief Process-wide spdlog front end.
   *
   * Until initialize() is called every log call is a no-op, so library code and
   * unit tests can log unconditionally.
   */
  class Logger
  {
  public:
    static Logger& getInstance();

    /**
     * @brief Create the console sink and, when @p logFile is non-empty, a
     * rotating file sink. Calling it again replaces the sinks.
     * @param level one of "trace", "debug", "info", "warn", "error", "off"
     */
    void initialize(const std::string& level = "info", const std::string& logFile = std::string());

    void setLevel(const std::string& level);

    bool isInitialized() const
    {
      return mLogger != nullptr;
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
      if (mLogger)
	mLogger->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
      if (mLogger)
	mLogger->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
      if (mLogger)
	mLogger->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
      if (mLogger)
	mLogger->error(fmt, std::forward<Args>(args)...);
    }

  private:
    Logger() = default;

    std::shared_ptr<spdlog::logger> mLogger;
  };
}

#define ALERTBT_LOG_DEBUG(...) alertbt::Logger::getInstance().debug(__VA_ARGS__)
#define ALERTBT_LOG_INFO(...) alertbt::Logger::getInstance().info(__VA_ARGS__)
#define ALERTBT_LOG_WARN(...) alertbt::Logger::getInstance().warn(__VA_ARGS__)
#define ALERTBT_LOG_ERROR(...) alertbt::Logger::getInstance().error(__VA_ARGS__)
