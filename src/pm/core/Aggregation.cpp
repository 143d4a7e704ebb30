#include "pm/core/Aggregation.hpp"
#include "pm/core/Errors.hpp"
#include "pm/core/NeighborBuffer.hpp"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace pm {

AggregationOutput AggregationOutput::scalar(double value)
{
    AggregationOutput out;
    out._metrics.push_back({std::string(), {value}});
    return out;
}

AggregationOutput& AggregationOutput::set(const std::string& name, double value)
{
    return set(name, std::vector<double>{value});
}

AggregationOutput& AggregationOutput::set(const std::string& name, std::vector<double> values)
{
    for (auto& m : _metrics) {
        if (m.name == name) {
            m.values = std::move(values);
            return *this;
        }
    }
    _metrics.push_back({name, std::move(values)});
    return *this;
}

bool AggregationOutput::isUnnamedScalar() const
{
    return _metrics.size() == 1 && _metrics[0].name.empty() && _metrics[0].values.size() == 1;
}

const Metric* AggregationOutput::find(const std::string& name) const
{
    for (const auto& m : _metrics) {
        if (m.name == name) {
            return &m;
        }
    }
    return nullptr;
}

double AggregationOutput::value(const std::string& name, size_t i) const
{
    const Metric* m = find(name);
    if (!m || i >= m->values.size()) {
        throw std::out_of_range("No metric value '" + name + "'[" + std::to_string(i) + "]");
    }
    return m->values[i];
}

bool AggregationOutput::operator==(const AggregationOutput& other) const
{
    if (_metrics.size() != other._metrics.size()) return false;
    for (size_t i = 0; i < _metrics.size(); i++) {
        if (_metrics[i].name != other._metrics[i].name || _metrics[i].values != other._metrics[i].values) {
            return false;
        }
    }
    return true;
}

MetricSchema MetricSchema::of(const AggregationOutput& output)
{
    MetricSchema schema;
    for (const auto& m : output.metrics()) {
        schema.names.push_back(m.name);
        schema.arity.push_back(m.values.size());
    }
    return schema;
}

bool MetricSchema::matches(const AggregationOutput& output) const
{
    const auto& metrics = output.metrics();
    if (metrics.size() != names.size()) return false;
    for (size_t i = 0; i < metrics.size(); i++) {
        if (metrics[i].name != names[i] || metrics[i].values.size() != arity[i]) {
            return false;
        }
    }
    return true;
}

size_t MetricSchema::columnCount() const
{
    size_t n = 0;
    for (size_t a : arity) n += a;
    return n;
}

std::string MetricSchema::describe() const
{
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < names.size(); i++) {
        if (i) oss << ", ";
        oss << (names[i].empty() ? "<unnamed>" : names[i]);
        if (arity[i] != 1) oss << "[" << arity[i] << "]";
    }
    oss << "}";
    return oss.str();
}

std::string describeMetrics(const AggregationOutput& output)
{
    return MetricSchema::of(output).describe();
}

namespace {

// Empty values, duplicate names, or an unnamed metric next to others
void checkWellFormed(const AggregationOutput& output, size_t pointIndex)
{
    if (output.empty()) {
        throw AggregationError("aggregation returned no value", pointIndex);
    }
    std::unordered_set<std::string> seen;
    for (const auto& m : output.metrics()) {
        if (m.values.empty()) {
            throw AggregationError("metric '" + m.name + "' has no value", pointIndex);
        }
        if (m.name.empty() && output.size() > 1) {
            throw AggregationError("unnamed metric mixed with named metrics " + describeMetrics(output),
                                   pointIndex);
        }
        if (!seen.insert(m.name).second) {
            throw AggregationError("metric '" + m.name + "' returned twice", pointIndex);
        }
    }
}

} // anonymous namespace

AggregationInvoker::AggregationInvoker(const Aggregation& aggregation) : _aggregation(aggregation)
{
    if (!_aggregation.function) {
        throw InvalidArgumentError("Aggregation has no function");
    }
}

AggregationOutput AggregationInvoker::invoke(const NeighborBuffer& buffer)
{
    const size_t pointIndex = buffer.queryIndex();

    AggregationOutput output;
    try {
        output = _aggregation.function(buffer);
    } catch (const std::exception& e) {
        throw AggregationError(std::string("aggregation failed: ") + e.what(), pointIndex);
    } catch (...) {
        throw AggregationError("aggregation failed with a non-standard exception", pointIndex);
    }

    checkWellFormed(output, pointIndex);

    if (!_schema) {
        _schema = MetricSchema::of(output);
    } else if (!_schema->matches(output)) {
        throw AggregationError("aggregation output changed shape: expected " + _schema->describe() +
                               ", got " + describeMetrics(output),
                               pointIndex);
    }
    return output;
}

} // namespace pm
