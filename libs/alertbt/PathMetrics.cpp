#include "PathMetrics.h"

#include <cmath>
#include <stdexcept>

namespace alertbt
{
  std::string alertStatusToString(AlertStatus status)
  {
    switch (status)
      {
      case AlertStatus::Ok:
	return "ok";
      case AlertStatus::Missing:
	return "missing";
      case AlertStatus::BadEntry:
	return "bad_entry";
      case AlertStatus::Error:
	return "error";
      }

    return "error";
  }

  std::size_t tierIndex(double multiple)
  {
    for (std::size_t i = 0; i < kTierCount; ++i)
      if (std::fabs(kTierLadder[i] - multiple) < 1e-9)
	return i;

    throw std::invalid_argument("tierIndex: " + std::to_string(multiple) + " is not a ladder tier");
  }

  std::string tierLabel(std::size_t index)
  {
    static const std::array<const char*, kTierCount> labels{{"1_2x", "1_5x", "2x", "3x", "4x", "5x", "10x"}};

    if (index >= kTierCount)
      throw std::out_of_range("tierLabel: tier index out of range");

    return labels[index];
  }
}
