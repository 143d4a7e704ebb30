#include "pm/core/PointMetrics.hpp"
#include "pm/core/Errors.hpp"
#include "pm/core/NeighborBuffer.hpp"
#include "pm/core/util/LoadJson.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>

#include <nlohmann/json.hpp>

namespace pm {

namespace {

const char* const PARAMS_CONTEXT = "Point metrics params";

void checkK(int k)
{
    if (k <= 1) {
        throw InvalidArgumentError("k must be greater than 1, got " + std::to_string(k));
    }
}

void checkAggregation(const Aggregation& aggregation, const PointMetricsParams& params)
{
    if (!aggregation.function) {
        throw InvalidArgumentError("Aggregation has no function");
    }
    if (params.threads > 1 && !aggregation.threadSafe) {
        throw InvalidArgumentError("threads = " + std::to_string(params.threads) +
                                   " requires an aggregation marked thread-safe");
    }
}

void checkPointCount(const PointSet& points, size_t k)
{
    if (k >= points.size()) {
        throw InvalidArgumentError("k = " + std::to_string(k) + " needs more than " + std::to_string(k) +
                                   " points, the set has " + std::to_string(points.size()));
    }
}

inline void queryNeighbors(const NeighborIndex& index, const PointSet& points, size_t pointIdx,
                           size_t k, bool excludeSelf, NeighborQueryResult& result)
{
    if (excludeSelf) {
        index.kNearestExcluding(points.coordinate(pointIdx), k, pointIdx, result);
    } else {
        index.kNearest(points.coordinate(pointIdx), k, result);
    }
}

void serialSweep(const PointSet& points, const NeighborIndex& index, const Aggregation& aggregation,
                 const PointMetricsParams& params, const PointSelection& selection,
                 ResultAssembler& assembler)
{
    const size_t k = static_cast<size_t>(params.k);
    NeighborBuffer buffer(points, params.fields, k);
    NeighborQueryResult result;
    result.reserve(k);
    AggregationInvoker invoker(aggregation);

    for (size_t row = 0; row < selection.size(); row++) {
        const size_t pointIdx = selection[row];
        queryNeighbors(index, points, pointIdx, k, params.excludeSelf, result);
        buffer.fill(points, result, pointIdx);
        assembler.push(invoker.invoke(buffer), pointIdx);
    }
}

// Rows are computed out of order, stored, then pushed in row order so the
// table and the reported error match the serial sweep.
void parallelSweep(const PointSet& points, const NeighborIndex& index, const Aggregation& aggregation,
                   const PointMetricsParams& params, const PointSelection& selection,
                   ResultAssembler& assembler)
{
    const size_t k = static_cast<size_t>(params.k);
    const auto rows = static_cast<int64_t>(selection.size());

    // Built once up front so field errors surface outside the parallel region
    const NeighborBuffer prototype(points, params.fields, k);

    std::vector<AggregationOutput> outputs(selection.size());
    int64_t firstErrorRow = std::numeric_limits<int64_t>::max();
    std::exception_ptr firstError;

    #pragma omp parallel num_threads(params.threads)
    {
        NeighborBuffer buffer = prototype;
        NeighborQueryResult result;
        result.reserve(k);
        AggregationInvoker invoker(aggregation);

        #pragma omp for schedule(dynamic, 256)
        for (int64_t row = 0; row < rows; row++) {
            const size_t pointIdx = selection[static_cast<size_t>(row)];
            try {
                queryNeighbors(index, points, pointIdx, k, params.excludeSelf, result);
                buffer.fill(points, result, pointIdx);
                outputs[row] = invoker.invoke(buffer);
            } catch (...) {
                #pragma omp critical(pm_sweep_error)
                {
                    if (row < firstErrorRow) {
                        firstErrorRow = row;
                        firstError = std::current_exception();
                    }
                }
            }
        }
    }

    const int64_t good = firstError ? firstErrorRow : rows;
    for (int64_t row = 0; row < good; row++) {
        assembler.push(outputs[row], selection[static_cast<size_t>(row)]);
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

ResultTable runSweep(const PointSet& points, const NeighborIndex& index, const Aggregation& aggregation,
                     const PointMetricsParams& params, const PointPredicate& filter)
{
    const auto start = std::chrono::steady_clock::now();

    const PointSelection selection = selectPoints(points, filter);

    std::vector<std::string> reserved;
    if (params.includeCoordinates) {
        reserved = {"X", "Y", "Z"};
    }
    ResultAssembler assembler(aggregation.name, std::move(reserved));
    assembler.reserve(selection.size());

    if (params.threads > 1 && selection.size() > 1) {
        parallelSweep(points, index, aggregation, params, selection, assembler);
    } else {
        serialSweep(points, index, aggregation, params, selection, assembler);
    }

    ResultTable table = assembler.finalize(params.includeCoordinates, points, selection);

    if (params.verbose) {
        const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        std::cout << "Point metrics: " << points.size() << " points, k=" << params.k << ", "
                  << selection.size() << " processed in " << seconds << "s" << std::endl;
    }
    return table;
}

} // anonymous namespace

void PointMetricsParams::validate() const
{
    checkK(k);
    if (threads < 1) {
        throw InvalidArgumentError("threads must be at least 1, got " + std::to_string(threads));
    }
}

PointMetricsParams PointMetricsParams::fromJson(const nlohmann::json& root)
{
    if (!root.is_object()) {
        throw InvalidArgumentError(std::string(PARAMS_CONTEXT) + " must be a JSON object");
    }
    json::reject_unknown_fields(root, {"k", "xyz", "exclude_self", "index", "fields", "threads", "verbose"},
                                PARAMS_CONTEXT);

    PointMetricsParams params;
    const int64_t k = json::integer_or(root, "k", params.k, PARAMS_CONTEXT);
    const int64_t threads = json::integer_or(root, "threads", params.threads, PARAMS_CONTEXT);
    if (k > std::numeric_limits<int>::max() || k < std::numeric_limits<int>::min()) {
        throw InvalidArgumentError("k is out of range: " + std::to_string(k));
    }
    if (threads > std::numeric_limits<int>::max() || threads < std::numeric_limits<int>::min()) {
        throw InvalidArgumentError("threads is out of range: " + std::to_string(threads));
    }
    params.k = static_cast<int>(k);
    params.threads = static_cast<int>(threads);
    params.includeCoordinates = json::bool_or(root, "xyz", params.includeCoordinates, PARAMS_CONTEXT);
    params.excludeSelf = json::bool_or(root, "exclude_self", params.excludeSelf, PARAMS_CONTEXT);
    params.index = indexTypeFromString(json::string_or(root, "index", indexTypeName(params.index), PARAMS_CONTEXT));
    params.fields = json::string_list_or(root, "fields", params.fields, PARAMS_CONTEXT);
    params.verbose = json::bool_or(root, "verbose", params.verbose, PARAMS_CONTEXT);

    params.validate();
    return params;
}

nlohmann::json PointMetricsParams::toJson() const
{
    return {
        {"k", k},
        {"xyz", includeCoordinates},
        {"exclude_self", excludeSelf},
        {"index", indexTypeName(index)},
        {"fields", fields},
        {"threads", threads},
        {"verbose", verbose},
    };
}

ResultTable computePointMetrics(const PointSet& points, int k, const Aggregation& aggregation,
                                bool includeCoordinates, const PointPredicate& filter)
{
    PointMetricsParams params;
    params.k = k;
    params.includeCoordinates = includeCoordinates;
    return computePointMetrics(points, aggregation, params, filter);
}

ResultTable computePointMetrics(const PointSet& points, const Aggregation& aggregation,
                                const PointMetricsParams& params, const PointPredicate& filter)
{
    // k first, nothing is indexed for a k that can never work
    checkK(params.k);
    params.validate();
    checkAggregation(aggregation, params);

    points.validate();
    checkPointCount(points, static_cast<size_t>(params.k));

    const auto index = makeNeighborIndex(params.index, points);
    return runSweep(points, *index, aggregation, params, filter);
}

ResultTable computePointMetrics(const PointSet& points, const NeighborIndex& index,
                                const Aggregation& aggregation, const PointMetricsParams& params,
                                const PointPredicate& filter)
{
    checkK(params.k);
    params.validate();
    checkAggregation(aggregation, params);

    points.validate();
    if (index.size() != points.size()) {
        throw InvalidArgumentError("Index holds " + std::to_string(index.size()) +
                                   " points, the point set has " + std::to_string(points.size()));
    }
    checkPointCount(points, static_cast<size_t>(params.k));

    return runSweep(points, index, aggregation, params, filter);
}

} // namespace pm
