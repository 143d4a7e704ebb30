#include "pm/core/Errors.hpp"

namespace pm {

PointMetricsError::PointMetricsError(const std::string& message)
    : std::runtime_error(message)
{
}

PointMetricsError::PointMetricsError(const std::string& message, size_t pointIndex)
    : std::runtime_error("point " + std::to_string(pointIndex) + ": " + message),
      _pointIndex(pointIndex)
{
}

} // namespace pm
