#include "pm/core/Errors.hpp"
#include "pm/core/PointMetrics.hpp"
#include "pm/core/util/FilterExpression.hpp"
#include "test_point_clouds.hpp"

#include <gtest/gtest.h>

using namespace pm;

TEST(FilterExpressionTest, ParsesConjunction) {
    const auto clauses = parseFilterExpression("ReturnNumber == 1 && Z >= 2.5&&X!=-3");
    ASSERT_EQ(clauses.size(), 3u);
    EXPECT_EQ(clauses[0].field, "ReturnNumber");
    EXPECT_EQ(clauses[0].op, CompareOp::Equal);
    EXPECT_EQ(clauses[0].value, 1.0);
    EXPECT_EQ(clauses[1].field, "Z");
    EXPECT_EQ(clauses[1].op, CompareOp::GreaterEqual);
    EXPECT_EQ(clauses[1].value, 2.5);
    EXPECT_EQ(clauses[2].op, CompareOp::NotEqual);
    EXPECT_EQ(clauses[2].value, -3.0);
    EXPECT_EQ(clauses[1].toString(), "Z >= 2.5");
}

TEST(FilterExpressionTest, Operators) {
    const auto clause = [](const std::string& expr) { return parseFilterExpression(expr).front(); };

    EXPECT_TRUE(clause("A < 2").matches(1.0));
    EXPECT_FALSE(clause("A < 2").matches(2.0));
    EXPECT_TRUE(clause("A <= 2").matches(2.0));
    EXPECT_TRUE(clause("A > 2").matches(3.0));
    EXPECT_FALSE(clause("A > 2").matches(2.0));
    EXPECT_TRUE(clause("A >= 2").matches(2.0));
    EXPECT_TRUE(clause("A == 2").matches(2.0));
    EXPECT_TRUE(clause("A != 2").matches(2.5));
    EXPECT_TRUE(clause("A < 1e3").matches(999.0));
}

TEST(FilterExpressionTest, SyntaxErrors) {
    for (const char* bad : {"", "   ", "Z", "Z 2", "Z = 2", "Z => 2", "Z == ", "== 2", "2 == Z", "Z == two",
                            "Z == 1 &&", "&& Z == 1", "Z == 1 2", "Z-1 == 2", "Z == 0x10", "Z < inf",
                            "Z != nan", "Z > 1e999"}) {
        EXPECT_THROW(parseFilterExpression(bad), InvalidArgumentError) << "'" << bad << "'";
    }
}

TEST(FilterExpressionTest, PredicateSelectsMatchingPoints) {
    PointSet points = test::collinearPoints(6);
    points.addAttribute("ReturnNumber", {1, 2, 1, 1, 2, 1});

    const PointPredicate first = parsePredicate("ReturnNumber == 1 && X > 0");
    const PointSelection selection = selectPoints(points, first);
    EXPECT_EQ(selection.indices(), (std::vector<size_t>{2, 3, 5}));
}

TEST(FilterExpressionTest, MissingFieldFailsEvaluation) {
    const PointSet points = test::collinearPoints(4);
    const PointPredicate predicate = parsePredicate("Classification == 2");
    EXPECT_THROW(predicate(points.point(0)), std::out_of_range);
    EXPECT_THROW(selectPoints(points, predicate), PredicateEvaluationError);
}

TEST(FilterExpressionTest, FirstReturnsOnly) {
    PointSet points = test::randomCloud(100, 17);
    Column returns;
    for (size_t i = 0; i < points.size(); i++) returns.push_back(i % 3 == 0 ? 2.0 : 1.0);
    points.addAttribute("ReturnNumber", returns);

    const ResultTable table =
        computePointMetrics(points, 5, test::meanOf("Z"), true, parsePredicate("ReturnNumber == 1"));
    ASSERT_EQ(table.rows(), 66u);
    size_t row = 0;
    for (size_t i = 0; i < points.size(); i++) {
        if (i % 3 == 0) continue;
        EXPECT_EQ(table.at(row, "X"), points.x()[i]);
        row++;
    }
}
