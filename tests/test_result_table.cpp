#include "pm/core/Errors.hpp"
#include "pm/core/ResultTable.hpp"
#include "test_point_clouds.hpp"

#include <gtest/gtest.h>

using namespace pm;

namespace {

AggregationOutput named(std::initializer_list<std::pair<const char*, double>> values)
{
    AggregationOutput out;
    for (const auto& [name, v] : values) out.set(name, v);
    return out;
}

ColumnPtr column(Column values)
{
    return std::make_shared<const Column>(std::move(values));
}

} // namespace

TEST(ResultTableTest, AddColumnChecksShape) {
    ResultTable table;
    EXPECT_TRUE(table.empty());
    table.addColumn("a", column({1, 2, 3}));
    table.addColumn("b", column({4, 5, 6}));

    EXPECT_EQ(table.rows(), 3u);
    EXPECT_EQ(table.cols(), 2u);
    EXPECT_EQ(table.at(2, "b"), 6.0);
    EXPECT_EQ(table.at(0, 1), 4.0);
    EXPECT_THROW(table.column("c"), std::out_of_range);

    EXPECT_THROW(table.addColumn("a", column({7, 8, 9})), InvalidArgumentError);
    EXPECT_THROW(table.addColumn("c", column({7, 8})), InvalidArgumentError);
    EXPECT_THROW(table.addColumn("c", nullptr), InvalidArgumentError);
}

TEST(ResultTableTest, ToMatIsRowMajor) {
    ResultTable table;
    table.addColumn("a", column({1, 2}));
    table.addColumn("b", column({3, 4}));

    const cv::Mat_<double> mat = table.toMat();
    ASSERT_EQ(mat.rows, 2);
    ASSERT_EQ(mat.cols, 2);
    EXPECT_EQ(mat(0, 1), 3.0);
    EXPECT_EQ(mat(1, 0), 2.0);
}

TEST(ResultTableTest, EqualityComparesNamesAndValues) {
    ResultTable a, b, c;
    a.addColumn("v", column({1, 2}));
    b.addColumn("v", column({1, 2}));
    c.addColumn("w", column({1, 2}));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(ResultAssemblerTest, ZeroRowsGiveEmptyTable) {
    const PointSet points = test::collinearPoints(3);
    ResultAssembler assembler;
    const ResultTable table = assembler.finalize(true, points, PointSelection({}, 3));
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.rows(), 0u);
    EXPECT_EQ(table.cols(), 0u);
}

TEST(ResultAssemblerTest, UnnamedScalarColumnNames) {
    const PointSet points = test::collinearPoints(2);

    ResultAssembler anonymous;
    anonymous.push(AggregationOutput::scalar(1.0));
    anonymous.push(AggregationOutput::scalar(2.0));
    EXPECT_EQ(anonymous.metricColumnNames(), (std::vector<std::string>{ResultAssembler::DEFAULT_COLUMN}));
    const ResultTable table = anonymous.finalize(false, points, PointSelection::all(2));
    EXPECT_EQ(table.columnNames(), (std::vector<std::string>{"V1"}));
    EXPECT_EQ(table.column("V1"), (Column{1.0, 2.0}));

    ResultAssembler declared("Z_mean");
    declared.push(AggregationOutput::scalar(1.0));
    EXPECT_EQ(declared.metricColumnNames(), (std::vector<std::string>{"Z_mean"}));
}

TEST(ResultAssemblerTest, VectorMetricsExpand) {
    AggregationOutput out;
    out.set("mean", 1.0).set("eigen", {3.0, 2.0, 1.0});

    ResultAssembler assembler("ignored");
    assembler.push(out);
    EXPECT_EQ(assembler.metricColumnNames(),
              (std::vector<std::string>{"mean", "eigen_1", "eigen_2", "eigen_3"}));

    AggregationOutput unnamed;
    unnamed.set("", {1.0, 2.0});
    ResultAssembler anonymous;
    anonymous.push(unnamed);
    EXPECT_EQ(anonymous.metricColumnNames(), (std::vector<std::string>{"V1", "V2"}));

    ResultAssembler declared("q");
    declared.push(unnamed);
    EXPECT_EQ(declared.metricColumnNames(), (std::vector<std::string>{"q_1", "q_2"}));
}

TEST(ResultAssemblerTest, CoordinatesComeFirstAndAreShared) {
    const PointSet points = test::collinearPoints(3);
    ResultAssembler assembler;
    for (double v : {10.0, 11.0, 12.0}) {
        assembler.push(named({{"max", v}, {"min", -v}}));
    }

    const ResultTable table = assembler.finalize(true, points, PointSelection::all(3));
    EXPECT_EQ(table.columnNames(), (std::vector<std::string>{"X", "Y", "Z", "max", "min"}));
    EXPECT_EQ(table.sharedColumn(0).get(), points.sharedField("X").get());
    EXPECT_EQ(table.sharedColumn(2).get(), points.sharedField("Z").get());
    EXPECT_EQ(table.column("min"), (Column{-10.0, -11.0, -12.0}));
}

TEST(ResultAssemblerTest, NarrowedSelectionCopiesCoordinates) {
    const PointSet points = test::collinearPoints(5);
    ResultAssembler assembler;
    assembler.push(AggregationOutput::scalar(0.0));
    assembler.push(AggregationOutput::scalar(2.0));

    const ResultTable table = assembler.finalize(true, points, PointSelection({1, 3}, 5));
    EXPECT_EQ(table.column("X"), (Column{1.0, 3.0}));
    EXPECT_NE(table.sharedColumn(0).get(), points.sharedField("X").get());
}

TEST(ResultAssemblerTest, ShapeChangeThrows) {
    ResultAssembler assembler;
    assembler.push(named({{"mean", 1.0}}), 0);
    try {
        assembler.push(named({{"mean", 1.0}, {"sd", 0.5}}), 1);
        FAIL() << "expected AggregationError";
    } catch (const AggregationError& e) {
        EXPECT_EQ(e.pointIndex(), std::optional<size_t>(1));
    }
    EXPECT_EQ(assembler.rows(), 1u);
}

TEST(ResultAssemblerTest, EmptyOutputThrows) {
    ResultAssembler assembler;
    EXPECT_THROW(assembler.push(AggregationOutput()), AggregationError);
}

TEST(ResultAssemblerTest, SelectionMustMatchRows) {
    const PointSet points = test::collinearPoints(3);
    ResultAssembler assembler;
    assembler.push(AggregationOutput::scalar(1.0));
    EXPECT_THROW(assembler.finalize(true, points, PointSelection::all(3)), InvalidArgumentError);
}

TEST(ResultAssemblerTest, MetricNamedLikeCoordinate) {
    const PointSet points = test::collinearPoints(2);

    ResultAssembler withXyz;
    withXyz.push(named({{"Z", 1.0}}));
    withXyz.push(named({{"Z", 2.0}}));
    EXPECT_THROW(withXyz.finalize(true, points, PointSelection::all(2)), InvalidArgumentError);

    ResultAssembler withoutXyz;
    withoutXyz.push(named({{"Z", 1.0}}));
    withoutXyz.push(named({{"Z", 2.0}}));
    EXPECT_EQ(withoutXyz.finalize(false, points, PointSelection::all(2)).columnNames(),
              (std::vector<std::string>{"Z"}));
}

TEST(ResultAssemblerTest, ReservedCoordinateNameFailsOnFirstPush) {
    ResultAssembler assembler({}, {"X", "Y", "Z"});
    try {
        assembler.push(named({{"mean", 1.0}, {"Y", 2.0}}), 4);
        FAIL() << "expected AggregationError";
    } catch (const AggregationError& e) {
        EXPECT_EQ(e.pointIndex(), std::optional<size_t>(4));
        EXPECT_NE(std::string(e.what()).find("coordinate"), std::string::npos);
    }
    EXPECT_EQ(assembler.rows(), 0u);
    EXPECT_TRUE(assembler.metricColumnNames().empty());
}

TEST(ResultAssemblerTest, ExpandedNameClashFailsOnFirstPush) {
    AggregationOutput out;
    out.set("a", {1.0, 2.0}).set("a_1", 3.0);

    ResultAssembler assembler;
    try {
        assembler.push(out, 0);
        FAIL() << "expected AggregationError";
    } catch (const AggregationError& e) {
        EXPECT_EQ(e.pointIndex(), std::optional<size_t>(0));
        const std::string message = e.what();
        EXPECT_NE(message.find("'a_1' appears twice"), std::string::npos);
        EXPECT_EQ(message.find("coordinate"), std::string::npos);
    }
    EXPECT_EQ(assembler.rows(), 0u);

    // The assembler stays usable after a rejected first output
    assembler.push(named({{"b", 1.0}}), 1);
    EXPECT_EQ(assembler.metricColumnNames(), (std::vector<std::string>{"b"}));
}

TEST(ResultAssemblerTest, FinalizeResets) {
    const PointSet points = test::collinearPoints(2);
    ResultAssembler assembler;
    assembler.push(named({{"a", 1.0}}));
    assembler.push(named({{"a", 2.0}}));
    assembler.finalize(false, points, PointSelection::all(2));

    EXPECT_EQ(assembler.rows(), 0u);
    EXPECT_TRUE(assembler.metricColumnNames().empty());
    assembler.push(named({{"b", 1.0}}));
    EXPECT_EQ(assembler.metricColumnNames(), (std::vector<std::string>{"b"}));
}
