#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include "pm/core/Aggregation.hpp"
#include "pm/core/PointFilter.hpp"
#include "pm/core/PointSet.hpp"

namespace pm {

/**
 * @brief Column table of doubles, one row per processed point
 *
 * Columns are shared and immutable. A table built without a narrowing
 * filter holds the point set's own X, Y and Z columns rather than copies.
 */
class ResultTable
{
public:
    ResultTable() = default;

    // @throws InvalidArgumentError on a duplicate name or a row count mismatch
    void addColumn(const std::string& name, ColumnPtr data);

    size_t rows() const { return _columns.empty() ? 0 : _columns.front()->size(); }
    size_t cols() const { return _columns.size(); }
    bool empty() const { return _columns.empty(); }

    const std::vector<std::string>& columnNames() const { return _names; }
    bool hasColumn(const std::string& name) const { return _lookup.count(name) > 0; }

    // @throws std::out_of_range for an unknown column
    const Column& column(const std::string& name) const;
    const Column& column(size_t i) const { return *_columns.at(i); }
    ColumnPtr sharedColumn(size_t i) const { return _columns.at(i); }

    double at(size_t row, size_t col) const { return (*_columns.at(col))[row]; }
    double at(size_t row, const std::string& name) const { return column(name)[row]; }

    // rows x cols copy, row-major
    cv::Mat_<double> toMat() const;

    // Same names and bit-identical values
    bool operator==(const ResultTable& other) const;
    bool operator!=(const ResultTable& other) const { return !(*this == other); }

private:
    std::vector<std::string> _names;
    std::vector<ColumnPtr> _columns;
    std::unordered_map<std::string, size_t> _lookup;
};

/**
 * @brief Accumulates one aggregation output per processed point
 *
 * The first pushed output fixes the metric columns; later outputs must have
 * the same metric names, order and value counts. A metric with m values
 * becomes the columns name_1 .. name_m. An unnamed metric takes the declared
 * aggregation name, or DEFAULT_COLUMN when there is none. Column names are
 * checked for clashes when the first push fixes them.
 */
class ResultAssembler
{
public:
    static constexpr const char* DEFAULT_COLUMN = "V1";

    // reservedNames are columns finalize will add ahead of the metrics, e.g. X, Y, Z
    explicit ResultAssembler(std::string declaredName = {}, std::vector<std::string> reservedNames = {});

    void reserve(size_t rows);

    // @throws AggregationError if output does not match the first pushed output,
    //         or the first output expands to a duplicate or reserved column name
    void push(const AggregationOutput& output, std::optional<size_t> pointIndex = std::nullopt);

    size_t rows() const { return _rows; }

    /**
     * @brief Build the table and reset the assembler
     *
     * With no pushed rows the table is empty and has no columns.
     * @param includeCoordinates Prepend X, Y, Z of the selected points
     * @param points Point set the rows were computed from
     * @param selection Processed points, in row order
     * @throws InvalidArgumentError if selection does not match the row count,
     *         or a metric column is named X, Y or Z while coordinates are included
     *         and were not reserved at construction
     */
    ResultTable finalize(bool includeCoordinates, const PointSet& points, const PointSelection& selection);

    // Metric columns fixed by the first push; empty before it
    const std::vector<std::string>& metricColumnNames() const { return _names; }

private:
    std::vector<std::string> expandNames(const MetricSchema& schema) const;

    std::string _declaredName;
    std::vector<std::string> _reserved;
    std::vector<std::string> _names;
    std::optional<MetricSchema> _schema;
    std::vector<Column> _columns;
    size_t _rows = 0;
    size_t _reservedRows = 0;
};

} // namespace pm
