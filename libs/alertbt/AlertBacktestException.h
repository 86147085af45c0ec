#pragma once

#include <stdexcept>
#include <string>

namespace alertbt
{
  class AlertBacktestException : public std::runtime_error
  {
  public:
    explicit AlertBacktestException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~AlertBacktestException() = default;
  };

  /**
   * @brief Thrown when a PolicyConfig can never be valid for any alert
   * (non-positive multiples, negative costs, out-of-range trailing distance).
   */
  class PolicyConfigException : public AlertBacktestException
  {
  public:
    explicit PolicyConfigException(const std::string& msg)
      : AlertBacktestException(msg)
    {}
  };

  class ParameterSpaceException : public AlertBacktestException
  {
  public:
    explicit ParameterSpaceException(const std::string& msg)
      : AlertBacktestException(msg)
    {}
  };

  class ConfigurationException : public AlertBacktestException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : AlertBacktestException(msg)
    {}
  };

  class DataSourceException : public AlertBacktestException
  {
  public:
    explicit DataSourceException(const std::string& msg)
      : AlertBacktestException(msg)
    {}
  };

  // Raised when a single alert exceeds its candle-count or wall-clock budget
  class EvaluationLimitException : public AlertBacktestException
  {
  public:
    explicit EvaluationLimitException(const std::string& msg)
      : AlertBacktestException(msg)
    {}
  };
}
