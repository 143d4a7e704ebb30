#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace pm {

/**
 * @brief Base of every error raised by the point metrics engine.
 *
 * Carries the index of the offending point when the failure can be tied to
 * one. The index is also part of what() so a caller that only logs the
 * message can still locate the point.
 */
class PointMetricsError : public std::runtime_error
{
public:
    explicit PointMetricsError(const std::string& message);
    PointMetricsError(const std::string& message, size_t pointIndex);

    std::optional<size_t> pointIndex() const { return _pointIndex; }

private:
    std::optional<size_t> _pointIndex;
};

// Empty or malformed point set, unreadable point cloud file
class InvalidInputError : public PointMetricsError
{
public:
    using PointMetricsError::PointMetricsError;
};

// Out-of-range k, unknown field, bad parameter value
class InvalidArgumentError : public PointMetricsError
{
public:
    using PointMetricsError::PointMetricsError;
};

// Filter predicate could not be evaluated for a point
class PredicateEvaluationError : public PointMetricsError
{
public:
    using PointMetricsError::PointMetricsError;
};

// Aggregation threw, returned nothing or changed its output shape
class AggregationError : public PointMetricsError
{
public:
    using PointMetricsError::PointMetricsError;
};

} // namespace pm
