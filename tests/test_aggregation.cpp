#include "pm/core/Aggregation.hpp"
#include "pm/core/Errors.hpp"
#include "pm/core/NeighborBuffer.hpp"
#include "test_point_clouds.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace pm;

class AggregationInvokerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        points = test::collinearPoints(4);
        buffer = std::make_unique<NeighborBuffer>(points, std::vector<std::string>{}, 2);
    }

    // Simulates the engine moving on to the next point
    const NeighborBuffer& at(size_t pointIndex)
    {
        const size_t other = pointIndex == 0 ? 1 : pointIndex - 1;
        buffer->fill(points, NeighborQueryResult{{pointIndex, 0.0}, {other, 1.0}}, pointIndex);
        return *buffer;
    }

    PointSet points;
    std::unique_ptr<NeighborBuffer> buffer;
};

TEST(AggregationOutputTest, SetKeepsOrderAndReplaces) {
    AggregationOutput out;
    out.set("mean", 1.0).set("range", {0.0, 2.0}).set("mean", 3.0);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out.metrics()[0].name, "mean");
    EXPECT_EQ(out.metrics()[1].name, "range");
    EXPECT_EQ(out.value("mean"), 3.0);
    EXPECT_EQ(out.value("range", 1), 2.0);
    EXPECT_THROW(out.value("range", 2), std::out_of_range);
    EXPECT_THROW(out.value("max"), std::out_of_range);
    EXPECT_EQ(out.find("max"), nullptr);
    EXPECT_FALSE(out.isUnnamedScalar());
}

TEST(AggregationOutputTest, UnnamedScalar) {
    const AggregationOutput out = AggregationOutput::scalar(2.5);
    EXPECT_TRUE(out.isUnnamedScalar());
    EXPECT_EQ(out.value(""), 2.5);
    EXPECT_EQ(out, AggregationOutput::scalar(2.5));
}

TEST(AggregationOutputTest, SchemaDescription) {
    AggregationOutput out;
    out.set("mean", 1.0).set("eigen", {1.0, 2.0, 3.0});
    const MetricSchema schema = MetricSchema::of(out);

    EXPECT_EQ(schema.columnCount(), 4u);
    EXPECT_EQ(schema.describe(), "{mean, eigen[3]}");
    EXPECT_TRUE(schema.matches(out));

    AggregationOutput shorter;
    shorter.set("mean", 1.0).set("eigen", {1.0, 2.0});
    EXPECT_FALSE(schema.matches(shorter));
}

TEST_F(AggregationInvokerTest, ReturnsOutputUnchanged) {
    const Aggregation mean = test::meanOf("X");
    AggregationInvoker invoker(mean);
    EXPECT_EQ(invoker.invoke(at(1)), AggregationOutput::scalar(0.5));
    EXPECT_EQ(invoker.invoke(at(3)), AggregationOutput::scalar(2.5));
    ASSERT_TRUE(invoker.schema().has_value());
    EXPECT_EQ(invoker.schema()->columnCount(), 1u);
}

TEST_F(AggregationInvokerTest, MissingFunctionThrows) {
    EXPECT_THROW(AggregationInvoker{Aggregation()}, InvalidArgumentError);
}

TEST_F(AggregationInvokerTest, ThrowingFunctionReportsPoint) {
    const Aggregation failing([](const NeighborBuffer& b) -> AggregationOutput {
        if (b.queryIndex() == 2) throw std::runtime_error("degenerate neighborhood");
        return AggregationOutput::scalar(0.0);
    });
    AggregationInvoker invoker(failing);
    invoker.invoke(at(1));

    try {
        invoker.invoke(at(2));
        FAIL() << "expected AggregationError";
    } catch (const AggregationError& e) {
        EXPECT_EQ(e.pointIndex(), std::optional<size_t>(2));
        EXPECT_NE(std::string(e.what()).find("degenerate neighborhood"), std::string::npos);
    }
}

TEST_F(AggregationInvokerTest, NonStandardExceptionIsWrapped) {
    const Aggregation failing([](const NeighborBuffer&) -> AggregationOutput { throw 42; });
    AggregationInvoker invoker(failing);
    EXPECT_THROW(invoker.invoke(at(0)), AggregationError);
}

TEST_F(AggregationInvokerTest, EmptyOutputThrows) {
    const Aggregation nothing([](const NeighborBuffer&) { return AggregationOutput(); });
    AggregationInvoker invoker(nothing);
    EXPECT_THROW(invoker.invoke(at(0)), AggregationError);
}

TEST_F(AggregationInvokerTest, MalformedOutputThrows) {
    const Aggregation mixed([](const NeighborBuffer&) {
        AggregationOutput out = AggregationOutput::scalar(1.0);
        out.set("max", 2.0);
        return out;
    });
    AggregationInvoker mixedInvoker(mixed);
    EXPECT_THROW(mixedInvoker.invoke(at(0)), AggregationError);

    const Aggregation emptyMetric([](const NeighborBuffer&) {
        AggregationOutput out;
        out.set("values", std::vector<double>{});
        return out;
    });
    AggregationInvoker emptyInvoker(emptyMetric);
    EXPECT_THROW(emptyInvoker.invoke(at(0)), AggregationError);
}

TEST_F(AggregationInvokerTest, NameDriftThrows) {
    const Aggregation drifting([](const NeighborBuffer& b) {
        AggregationOutput out;
        out.set(b.queryIndex() < 2 ? "mean" : "average", 1.0);
        return out;
    });
    AggregationInvoker invoker(drifting);
    invoker.invoke(at(0));
    invoker.invoke(at(1));

    try {
        invoker.invoke(at(2));
        FAIL() << "expected AggregationError";
    } catch (const AggregationError& e) {
        EXPECT_EQ(e.pointIndex(), std::optional<size_t>(2));
        EXPECT_NE(std::string(e.what()).find("{mean}"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("{average}"), std::string::npos);
    }
}

TEST_F(AggregationInvokerTest, ArityDriftThrows) {
    const Aggregation drifting([](const NeighborBuffer& b) {
        AggregationOutput out;
        out.set("values", std::vector<double>(b.queryIndex() == 3 ? 3 : 2, 0.0));
        return out;
    });
    AggregationInvoker invoker(drifting);
    invoker.invoke(at(0));
    EXPECT_THROW(invoker.invoke(at(3)), AggregationError);
}
