#pragma once

#include <string>
#include <vector>

#include "pm/core/Aggregation.hpp"
#include "pm/core/PointSet.hpp"

// Built-in aggregations over a neighbor buffer.
// All of them are pure functions of the buffer and marked thread-safe.
namespace pm::stats {

// Column reducers, nan where the statistic is undefined
namespace column {

double mean(const Column& values);
// Sample standard deviation (n-1), nan for fewer than 2 values
double sd(const Column& values);
double min(const Column& values);
double max(const Column& values);

} // namespace column

// <field>_mean, <field>_sd, <field>_min, <field>_max
Aggregation describe(const std::string& field);

// Single unnamed scalar, the column is named <field>_mean
Aggregation mean(const std::string& field);

// Covariance eigenvalues of the neighbors' X, Y, Z with the usual shape
// descriptors: eigen_largest, eigen_medium, eigen_smallest, linearity,
// planarity, sphericity, verticality
Aggregation eigenFeatures();

// planar = 1 when e2 > th1 * e3 and th2 * e2 > e1, e1 >= e2 >= e3 the
// covariance eigenvalues; the usual plane detection test for k around 25
Aggregation planar(double th1 = 25.0, double th2 = 6.0);

/**
 * Look up a built-in by name: "describe:<field>", "mean:<field>", "eigen", "planar"
 * @throws InvalidArgumentError for an unknown name or a missing field
 */
Aggregation fromString(const std::string& name);

// Names accepted by fromString, <field> left as a placeholder
std::vector<std::string> availableAggregations();

} // namespace pm::stats
