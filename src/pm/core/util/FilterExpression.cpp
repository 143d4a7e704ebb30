#include "pm/core/util/FilterExpression.hpp"
#include "pm/core/Errors.hpp"
#include "pm/core/util/ParseNumber.hpp"

#include <cctype>
#include <sstream>
#include <string>
#include <utility>

#include <boost/algorithm/string/trim.hpp>

namespace pm {

namespace {

struct OpToken {
    const char* text;
    CompareOp op;
};

// Two-character operators first so "<=" is not read as "<"
const OpToken OPERATORS[] = {
    {"==", CompareOp::Equal},
    {"!=", CompareOp::NotEqual},
    {"<=", CompareOp::LessEqual},
    {">=", CompareOp::GreaterEqual},
    {"<", CompareOp::Less},
    {">", CompareOp::Greater},
};

bool isFieldName(const std::string& name)
{
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

FilterClause parseClause(const std::string& text, const std::string& expr)
{
    const auto opPos = text.find_first_of("=!<>");
    if (opPos == std::string::npos) {
        throw InvalidArgumentError("Filter clause '" + text + "' in '" + expr + "' has no comparison operator");
    }

    FilterClause clause;
    size_t opLen = 0;
    for (const auto& token : OPERATORS) {
        if (text.compare(opPos, std::char_traits<char>::length(token.text), token.text) == 0) {
            clause.op = token.op;
            opLen = std::char_traits<char>::length(token.text);
            break;
        }
    }
    if (opLen == 0) {
        throw InvalidArgumentError("Filter clause '" + text + "' in '" + expr + "' has an unknown operator");
    }

    clause.field = boost::algorithm::trim_copy(text.substr(0, opPos));
    const std::string number = boost::algorithm::trim_copy(text.substr(opPos + opLen));

    if (!isFieldName(clause.field)) {
        throw InvalidArgumentError("Filter clause '" + text + "' in '" + expr + "' must start with a field name");
    }
    if (!parseDecimal(number, clause.value)) {
        throw InvalidArgumentError("Filter clause '" + text + "' in '" + expr + "' must compare with a number");
    }
    return clause;
}

} // anonymous namespace

bool FilterClause::matches(double fieldValue) const
{
    switch (op) {
        case CompareOp::Equal: return fieldValue == value;
        case CompareOp::NotEqual: return fieldValue != value;
        case CompareOp::Less: return fieldValue < value;
        case CompareOp::LessEqual: return fieldValue <= value;
        case CompareOp::Greater: return fieldValue > value;
        case CompareOp::GreaterEqual: return fieldValue >= value;
    }
    return false;
}

std::string FilterClause::toString() const
{
    const char* text = "?";
    for (const auto& token : OPERATORS) {
        if (token.op == op) {
            text = token.text;
            break;
        }
    }
    std::ostringstream ss;
    ss << field << ' ' << text << ' ' << value;
    return ss.str();
}

std::vector<FilterClause> parseFilterExpression(const std::string& expr)
{
    if (boost::algorithm::trim_copy(expr).empty()) {
        throw InvalidArgumentError("Filter expression is empty");
    }

    std::vector<FilterClause> clauses;
    size_t start = 0;
    while (true) {
        const auto sep = expr.find("&&", start);
        const std::string part = boost::algorithm::trim_copy(expr.substr(start, sep == std::string::npos ? std::string::npos : sep - start));
        if (part.empty()) {
            throw InvalidArgumentError("Filter expression '" + expr + "' has an empty clause");
        }
        clauses.push_back(parseClause(part, expr));
        if (sep == std::string::npos) {
            break;
        }
        start = sep + 2;
    }
    return clauses;
}

PointPredicate parsePredicate(const std::string& expr)
{
    auto clauses = parseFilterExpression(expr);
    return [clauses = std::move(clauses)](const Point& p) {
        for (const auto& clause : clauses) {
            if (!clause.matches(p[clause.field])) {
                return false;
            }
        }
        return true;
    };
}

} // namespace pm
