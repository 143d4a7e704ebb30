#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include "pm/core/PointSet.hpp"
#include "pm/core/ResultTable.hpp"

namespace pm {

/**
 * @brief Read an ASCII point table
 *
 * The first line that is neither blank nor a '#' comment names the columns,
 * separated by whitespace or commas. X, Y and Z (any case) are required, the
 * remaining columns become attributes. Every following data line holds one
 * number per column.
 *
 * @throws InvalidInputError with file and line on an unreadable file, a
 *         missing coordinate column, a duplicate column, a wrong number of
 *         values or a malformed number
 */
PointSet readPointSet(const std::filesystem::path& path);
PointSet readPointSet(std::istream& in, const std::string& source = "<stream>");

// Header line of column names, then one line per row with round-trip precision.
// A table without columns writes nothing.
void writeCsv(const ResultTable& table, std::ostream& out);

// @throws std::runtime_error if path cannot be written
void writeCsv(const ResultTable& table, const std::filesystem::path& path);

} // namespace pm
