#pragma once

#include <string>
#include <vector>

#include "pm/core/PointFilter.hpp"

namespace pm {

enum class CompareOp {
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual
};

// One "field op number" term of a filter expression
struct FilterClause {
    std::string field;
    CompareOp op = CompareOp::Equal;
    double value = 0.0;

    bool matches(double fieldValue) const;
    std::string toString() const;
};

/**
 * @brief Parse a conjunction such as "ReturnNumber == 1 && Z >= 2.5"
 *
 * Each clause is a field name (X, Y, Z or an attribute), one of
 * == != < <= > >=, and a number.
 * @throws InvalidArgumentError on a syntax error or an empty expression
 */
std::vector<FilterClause> parseFilterExpression(const std::string& expr);

// Predicate that holds when every clause holds; a point lacking one of the
// fields makes it throw std::out_of_range
// @throws InvalidArgumentError as parseFilterExpression
PointPredicate parsePredicate(const std::string& expr);

} // namespace pm
