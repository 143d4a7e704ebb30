#include "pm/core/ResultTable.hpp"
#include "pm/core/Errors.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

namespace pm {

void ResultTable::addColumn(const std::string& name, ColumnPtr data)
{
    if (!data) {
        throw InvalidArgumentError("Column '" + name + "' has no data");
    }
    if (_lookup.count(name)) {
        throw InvalidArgumentError("Duplicate column '" + name + "'");
    }
    if (!_columns.empty() && data->size() != rows()) {
        throw InvalidArgumentError("Column '" + name + "' has " + std::to_string(data->size()) +
                                   " rows, table has " + std::to_string(rows()));
    }
    _lookup.emplace(name, _columns.size());
    _names.push_back(name);
    _columns.push_back(std::move(data));
}

const Column& ResultTable::column(const std::string& name) const
{
    auto it = _lookup.find(name);
    if (it == _lookup.end()) {
        throw std::out_of_range("No column named '" + name + "'");
    }
    return *_columns[it->second];
}

cv::Mat_<double> ResultTable::toMat() const
{
    cv::Mat_<double> mat(static_cast<int>(rows()), static_cast<int>(cols()));
    for (size_t c = 0; c < cols(); c++) {
        const Column& col = *_columns[c];
        for (size_t r = 0; r < col.size(); r++) {
            mat(static_cast<int>(r), static_cast<int>(c)) = col[r];
        }
    }
    return mat;
}

bool ResultTable::operator==(const ResultTable& other) const
{
    if (_names != other._names || rows() != other.rows()) {
        return false;
    }
    for (size_t c = 0; c < _columns.size(); c++) {
        const Column& a = *_columns[c];
        const Column& b = *other._columns[c];
        if (!a.empty() && std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) != 0) {
            return false;
        }
    }
    return true;
}

ResultAssembler::ResultAssembler(std::string declaredName, std::vector<std::string> reservedNames)
    : _declaredName(std::move(declaredName)), _reserved(std::move(reservedNames))
{
}

void ResultAssembler::reserve(size_t rows)
{
    _reservedRows = rows;
    for (auto& col : _columns) {
        col.reserve(rows);
    }
}

void ResultAssembler::push(const AggregationOutput& output, std::optional<size_t> pointIndex)
{
    auto fail = [&](const std::string& message) -> AggregationError {
        return pointIndex ? AggregationError(message, *pointIndex) : AggregationError(message);
    };

    if (output.empty()) {
        throw fail("aggregation returned no value");
    }

    if (!_schema) {
        MetricSchema schema = MetricSchema::of(output);
        std::vector<std::string> names = expandNames(schema);

        std::unordered_set<std::string> seen(_reserved.begin(), _reserved.end());
        for (const auto& name : names) {
            if (std::find(_reserved.begin(), _reserved.end(), name) != _reserved.end()) {
                throw fail("metric column '" + name + "' collides with a coordinate column");
            }
            if (!seen.insert(name).second) {
                throw fail("metric column '" + name + "' appears twice in " + describeMetrics(output));
            }
        }

        _schema = std::move(schema);
        _names = std::move(names);
        _columns.resize(_names.size());
        for (auto& col : _columns) {
            col.reserve(_reservedRows);
        }
    } else if (!_schema->matches(output)) {
        throw fail("aggregation output changed shape: expected " + _schema->describe() +
                   ", got " + describeMetrics(output));
    }

    size_t c = 0;
    for (const auto& m : output.metrics()) {
        for (double v : m.values) {
            _columns[c++].push_back(v);
        }
    }
    _rows++;
}

std::vector<std::string> ResultAssembler::expandNames(const MetricSchema& schema) const
{
    std::vector<std::string> names;
    for (size_t i = 0; i < schema.names.size(); i++) {
        const size_t arity = schema.arity[i];
        std::string base = schema.names[i];
        if (base.empty()) {
            // Unnamed output: V1 for a scalar, V1..Vm for m values unless the aggregation has a name
            if (!_declaredName.empty()) {
                base = _declaredName;
            } else if (arity == 1) {
                names.emplace_back(DEFAULT_COLUMN);
                continue;
            } else {
                for (size_t j = 1; j <= arity; j++) {
                    names.push_back("V" + std::to_string(j));
                }
                continue;
            }
        }
        if (arity == 1) {
            names.push_back(base);
        } else {
            for (size_t j = 1; j <= arity; j++) {
                names.push_back(base + "_" + std::to_string(j));
            }
        }
    }
    return names;
}

ResultTable ResultAssembler::finalize(bool includeCoordinates, const PointSet& points,
                                      const PointSelection& selection)
{
    ResultTable table;
    if (_rows == 0) {
        return table;
    }

    if (selection.size() != _rows) {
        throw InvalidArgumentError("Selection holds " + std::to_string(selection.size()) +
                                   " points, assembler holds " + std::to_string(_rows) + " rows");
    }

    if (includeCoordinates) {
        for (const char* axis : {"X", "Y", "Z"}) {
            if (selection.selectsAll()) {
                table.addColumn(axis, points.sharedField(axis));
                continue;
            }
            const Column& src = points.field(axis);
            Column narrowed;
            narrowed.reserve(selection.size());
            for (size_t i = 0; i < selection.size(); i++) {
                narrowed.push_back(src[selection[i]]);
            }
            table.addColumn(axis, std::make_shared<const Column>(std::move(narrowed)));
        }
    }

    // Only reached when X, Y, Z were not reserved at construction
    for (size_t c = 0; c < _names.size(); c++) {
        if (table.hasColumn(_names[c])) {
            throw InvalidArgumentError("Metric column '" + _names[c] + "' collides with a coordinate column");
        }
        table.addColumn(_names[c], std::make_shared<const Column>(std::move(_columns[c])));
    }

    _schema.reset();
    _names.clear();
    _columns.clear();
    _rows = 0;
    return table;
}

} // namespace pm
