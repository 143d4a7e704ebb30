#include "pm/core/util/PointCloudIO.hpp"
#include "pm/core/Errors.hpp"
#include "pm/core/util/ParseNumber.hpp"

#include <fstream>
#include <iomanip>
#include <istream>
#include <limits>
#include <ostream>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace pm {

namespace {

std::vector<std::string> splitFields(const std::string& line)
{
    std::vector<std::string> parts;
    boost::algorithm::split(parts, line, boost::algorithm::is_any_of(", \t\r"),
                            boost::algorithm::token_compress_on);
    std::vector<std::string> fields;
    fields.reserve(parts.size());
    for (auto& p : parts) {
        if (!p.empty()) fields.push_back(std::move(p));
    }
    return fields;
}

bool isSkipped(const std::string& line)
{
    const std::string trimmed = boost::algorithm::trim_copy(line);
    return trimmed.empty() || trimmed[0] == '#';
}

} // anonymous namespace

PointSet readPointSet(std::istream& in, const std::string& source)
{
    auto fail = [&](size_t lineNo, const std::string& message) {
        return InvalidInputError(source + ":" + std::to_string(lineNo) + ": " + message);
    };

    std::string line;
    size_t lineNo = 0;

    // Header
    std::vector<std::string> names;
    while (std::getline(in, line)) {
        lineNo++;
        if (isSkipped(line)) continue;
        names = splitFields(line);
        break;
    }
    if (names.empty()) {
        throw InvalidInputError(source + ": no header line");
    }

    int xCol = -1, yCol = -1, zCol = -1;
    for (size_t c = 0; c < names.size(); c++) {
        const std::string upper = boost::algorithm::to_upper_copy(names[c]);
        int* slot = upper == "X" ? &xCol : upper == "Y" ? &yCol : upper == "Z" ? &zCol : nullptr;
        if (!slot) continue;
        if (*slot >= 0) {
            throw fail(lineNo, "duplicate coordinate column '" + names[c] + "'");
        }
        *slot = static_cast<int>(c);
        names[c] = upper;
    }
    if (xCol < 0 || yCol < 0 || zCol < 0) {
        throw fail(lineNo, "header must contain X, Y and Z columns");
    }

    std::vector<Column> columns(names.size());
    while (std::getline(in, line)) {
        lineNo++;
        if (isSkipped(line)) continue;

        const auto values = splitFields(line);
        if (values.size() != names.size()) {
            throw fail(lineNo, "expected " + std::to_string(names.size()) + " values, got " +
                                   std::to_string(values.size()));
        }
        for (size_t c = 0; c < values.size(); c++) {
            double v = 0.0;
            if (!parseDecimal(values[c], v)) {
                throw fail(lineNo, "malformed number '" + values[c] + "' in column " + names[c]);
            }
            columns[c].push_back(v);
        }
    }
    if (in.bad()) {
        throw InvalidInputError(source + ": read error");
    }

    PointSet points(std::move(columns[xCol]), std::move(columns[yCol]), std::move(columns[zCol]));
    for (size_t c = 0; c < names.size(); c++) {
        if (static_cast<int>(c) == xCol || static_cast<int>(c) == yCol || static_cast<int>(c) == zCol) {
            continue;
        }
        try {
            points.addAttribute(names[c], std::move(columns[c]));
        } catch (const InvalidInputError& e) {
            throw InvalidInputError(source + ": " + e.what());
        }
    }
    return points;
}

PointSet readPointSet(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw InvalidInputError("Point cloud file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw InvalidInputError("Cannot open point cloud file: " + path.string());
    }
    return readPointSet(file, path.string());
}

void writeCsv(const ResultTable& table, std::ostream& out)
{
    if (table.empty()) return;

    const auto& names = table.columnNames();
    for (size_t c = 0; c < names.size(); c++) {
        out << (c ? "," : "") << names[c];
    }
    out << '\n';

    const auto precision = out.precision(std::numeric_limits<double>::max_digits10);
    for (size_t r = 0; r < table.rows(); r++) {
        for (size_t c = 0; c < table.cols(); c++) {
            out << (c ? "," : "") << table.at(r, c);
        }
        out << '\n';
    }
    out.precision(precision);
}

void writeCsv(const ResultTable& table, const std::filesystem::path& path)
{
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }
    writeCsv(table, file);
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing " + path.string());
    }
}

} // namespace pm
