#pragma once

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "pm/core/Aggregation.hpp"
#include "pm/core/PointFilter.hpp"
#include "pm/core/PointIndex.hpp"
#include "pm/core/PointSet.hpp"
#include "pm/core/ResultTable.hpp"

namespace pm {

// Parameters of one point metrics run
struct PointMetricsParams {
    // Neighbors per point, must be > 1 and below the point count
    int k = 8;

    // Prepend X, Y, Z of the processed points to the result
    bool includeCoordinates = true;

    // Remove the processed point from its own neighborhood
    bool excludeSelf = false;

    IndexType index = IndexType::RTree;

    // Fields copied into the neighbor buffer, empty for all of them
    std::vector<std::string> fields;

    // >1 needs a thread-safe aggregation
    int threads = 1;

    // Print a summary line to stdout
    bool verbose = false;

    // @throws InvalidArgumentError if a value is out of range
    void validate() const;

    /**
     * Read params from a JSON object, absent keys keep their defaults.
     * Keys: k, xyz, exclude_self, index, fields, threads, verbose
     * @throws InvalidArgumentError on an unknown key, a wrong type or a bad value
     */
    static PointMetricsParams fromJson(const nlohmann::json& root);
    nlohmann::json toJson() const;
};

/**
 * @brief Compute an aggregation over the k nearest neighbors of every point
 *
 * Builds one spatial index over all points, then for each point accepted by
 * filter (every point when filter is empty) queries its k nearest neighbors,
 * fills a reusable buffer with their attributes and calls the aggregation.
 * Rows follow point order. Neighbors are always searched among all points,
 * the filter only chooses which points get a row.
 *
 * @throws InvalidArgumentError if k <= 1, k >= points.size() or params are invalid
 * @throws InvalidInputError if points is empty or holds non-finite coordinates
 * @throws PredicateEvaluationError if filter throws for a point
 * @throws AggregationError if the aggregation fails or its output changes shape
 */
ResultTable computePointMetrics(
    const PointSet& points,
    int k,
    const Aggregation& aggregation,
    bool includeCoordinates = true,
    const PointPredicate& filter = {}
);

ResultTable computePointMetrics(
    const PointSet& points,
    const Aggregation& aggregation,
    const PointMetricsParams& params,
    const PointPredicate& filter = {}
);

// Same run against an index already built over points, so several
// aggregations can share one index
// @throws InvalidArgumentError if index was not built over a set of points.size() points
ResultTable computePointMetrics(
    const PointSet& points,
    const NeighborIndex& index,
    const Aggregation& aggregation,
    const PointMetricsParams& params,
    const PointPredicate& filter = {}
);

} // namespace pm
