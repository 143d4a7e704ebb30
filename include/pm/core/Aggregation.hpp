#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pm {

class NeighborBuffer;

// One named metric; a scalar holds a single value
struct Metric {
    std::string name;
    std::vector<double> values;
};

/**
 * @brief Metrics produced by one call of an aggregation
 *
 * Metrics keep insertion order, which becomes the column order of the
 * result table. A single unnamed scalar is allowed for aggregations that
 * compute one value; its column is named after the aggregation.
 */
class AggregationOutput
{
public:
    AggregationOutput() = default;

    static AggregationOutput scalar(double value);

    // Replaces an existing metric of the same name
    AggregationOutput& set(const std::string& name, double value);
    AggregationOutput& set(const std::string& name, std::vector<double> values);

    bool empty() const { return _metrics.empty(); }
    size_t size() const { return _metrics.size(); }
    const std::vector<Metric>& metrics() const { return _metrics; }

    bool isUnnamedScalar() const;

    const Metric* find(const std::string& name) const;
    // @throws std::out_of_range if there is no such metric
    double value(const std::string& name, size_t i = 0) const;

    bool operator==(const AggregationOutput& other) const;

private:
    std::vector<Metric> _metrics;
};

using AggregateFunction = std::function<AggregationOutput(const NeighborBuffer&)>;

struct Aggregation {
    Aggregation() = default;
    Aggregation(AggregateFunction fn, std::string declaredName = {}, bool isThreadSafe = false)
        : function(std::move(fn)), name(std::move(declaredName)), threadSafe(isThreadSafe)
    {
    }

    AggregateFunction function;
    // Column name used when the output is a single unnamed scalar
    std::string name;
    // May be called concurrently from several threads
    bool threadSafe = false;
};

// Metric names and value counts; fixed by the first output of a run
struct MetricSchema {
    std::vector<std::string> names;
    std::vector<size_t> arity;

    static MetricSchema of(const AggregationOutput& output);

    bool matches(const AggregationOutput& output) const;
    size_t columnCount() const;
    std::string describe() const;
};

std::string describeMetrics(const AggregationOutput& output);

/**
 * @brief Calls the aggregation on each neighborhood and checks what it returns
 *
 * The first successful output fixes the schema of the run; any later output
 * with other metric names, order or value counts is rejected.
 * One invoker per thread.
 */
class AggregationInvoker
{
public:
    // @throws InvalidArgumentError if the aggregation has no function
    explicit AggregationInvoker(const Aggregation& aggregation);

    /**
     * @throws AggregationError with buffer.queryIndex() if the function throws,
     *         returns an empty or malformed output, or changes shape
     */
    AggregationOutput invoke(const NeighborBuffer& buffer);

    const std::optional<MetricSchema>& schema() const { return _schema; }

private:
    const Aggregation& _aggregation;
    std::optional<MetricSchema> _schema;
};

} // namespace pm
