#include "pm/core/util/NeighborhoodStats.hpp"
#include "pm/core/Errors.hpp"
#include "pm/core/NeighborBuffer.hpp"
#include "pm/core/util/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pm::stats {

namespace column {

double mean(const Column& values)
{
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double sd(const Column& values)
{
    if (values.size() < 2) return std::numeric_limits<double>::quiet_NaN();

    const double m = mean(values);
    double acc = 0.0;
    for (double v : values) {
        acc += (v - m) * (v - m);
    }
    return std::sqrt(acc / static_cast<double>(values.size() - 1));
}

double min(const Column& values)
{
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
    return *std::min_element(values.begin(), values.end());
}

double max(const Column& values)
{
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
    return *std::max_element(values.begin(), values.end());
}

} // namespace column

Aggregation describe(const std::string& field)
{
    auto fn = [field](const NeighborBuffer& buffer) {
        const Column& values = buffer.column(field);
        AggregationOutput out;
        out.set(field + "_mean", column::mean(values));
        out.set(field + "_sd", column::sd(values));
        out.set(field + "_min", column::min(values));
        out.set(field + "_max", column::max(values));
        return out;
    };
    return Aggregation(fn, "describe_" + field, true);
}

Aggregation mean(const std::string& field)
{
    auto fn = [field](const NeighborBuffer& buffer) {
        return AggregationOutput::scalar(column::mean(buffer.column(field)));
    };
    return Aggregation(fn, field + "_mean", true);
}

Aggregation eigenFeatures()
{
    auto fn = [](const NeighborBuffer& buffer) {
        const CovarianceEigen eig = covarianceEigen(buffer.x(), buffer.y(), buffer.z());
        const double e1 = eig.values[0];
        const double e2 = eig.values[1];
        const double e3 = eig.values[2];

        // Degenerate neighborhoods (e1 == 0) give nan ratios
        AggregationOutput out;
        out.set("eigen_largest", e1);
        out.set("eigen_medium", e2);
        out.set("eigen_smallest", e3);
        out.set("linearity", (e1 - e2) / e1);
        out.set("planarity", (e2 - e3) / e1);
        out.set("sphericity", e3 / e1);
        out.set("verticality", 1.0 - std::abs(eig.normal[2]));
        return out;
    };
    return Aggregation(fn, "eigen", true);
}

Aggregation planar(double th1, double th2)
{
    auto fn = [th1, th2](const NeighborBuffer& buffer) {
        const CovarianceEigen eig = covarianceEigen(buffer.x(), buffer.y(), buffer.z());
        const double e1 = eig.values[0];
        const double e2 = eig.values[1];
        const double e3 = eig.values[2];
        const bool isPlanar = e2 > th1 * e3 && th2 * e2 > e1;

        AggregationOutput out;
        out.set("planar", isPlanar ? 1.0 : 0.0);
        return out;
    };
    return Aggregation(fn, "planar", true);
}

Aggregation fromString(const std::string& name)
{
    const auto colon = name.find(':');
    const std::string method = name.substr(0, colon);
    const std::string field = colon == std::string::npos ? std::string() : name.substr(colon + 1);

    if (method == "describe" || method == "mean") {
        if (field.empty()) {
            throw InvalidArgumentError("Aggregation '" + method + "' needs a field, e.g. '" + method + ":Z'");
        }
        return method == "describe" ? describe(field) : mean(field);
    }
    if (!field.empty()) {
        throw InvalidArgumentError("Aggregation '" + method + "' takes no field, got '" + name + "'");
    }
    if (method == "eigen") return eigenFeatures();
    if (method == "planar") return planar();

    std::string known;
    for (const auto& n : availableAggregations()) {
        known += (known.empty() ? "" : ", ") + n;
    }
    throw InvalidArgumentError("Unknown aggregation '" + name + "', expected one of: " + known);
}

std::vector<std::string> availableAggregations()
{
    return {
        "describe:<field>",
        "mean:<field>",
        "eigen",
        "planar"
    };
}

} // namespace pm::stats
